#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace rscx {

// Page layout of one region, decoded from a 32-bit page-flags word.
//
// Bits 0..3 hold the base shift; the page size of the smallest bucket is
// 0x200 << shift. Nine buckets follow, each doubling the page size of the
// next one down, with the page count of each bucket packed at a fixed bit
// position:
//
//   bucket   0    1    2    3     4     5    6    7    8
//   shift    4    5    7    11    17    24   25   26   27
//   mask     0x1  0x3  0xF  0x3F  0x7F  0x1  0x1  0x1  0x1
//   page     base << 8 ............................ base << 0
//
// Bits 28..31 hold the resource type. Every 32-bit value is a valid layout.
class ResourceChunkFlags {
public:
  static constexpr size_t bucketCount = 9;

  static constexpr std::array<uint32_t, bucketCount> bucketShifts = {4,  5,  7,  11, 17,
                                                                     24, 25, 26, 27};
  static constexpr std::array<uint32_t, bucketCount> bucketMasks = {0x1, 0x3, 0xF, 0x3F, 0x7F,
                                                                    0x1, 0x1, 0x1, 0x1};

  explicit ResourceChunkFlags(uint32_t value);

  uint32_t value() const { return value_; }
  uint32_t type() const { return (value_ >> 28) & 0xF; }
  uint32_t baseShift() const { return value_ & 0xF; }
  uint32_t baseSize() const { return 0x200u << baseShift(); }

  // Page size of each bucket, largest first
  // 64-bit because base << 8 reaches 2^32 for the largest base shift
  std::array<uint64_t, bucketCount> chunkSizes() const;

  // Number of pages in each bucket
  std::array<uint32_t, bucketCount> bucketCounts() const;

  // chunkSizes()[i] * bucketCounts()[i]
  std::array<uint64_t, bucketCount> bucketSizes() const;

  // Total region size in bytes (sum of bucketSizes())
  uint64_t size() const;

private:
  uint32_t value_;
};

} // namespace rscx
