#pragma once

#include <cstddef>
#include <cstdint>

namespace rscx {

// "RSC7" read as a little-endian u32
inline constexpr uint32_t kResourceMagic = 0x37435352;

// High address bits selecting the region a resource address points into
inline constexpr uint64_t kVirtualBase = 0x50000000;
inline constexpr uint64_t kPhysicalBase = 0x60000000;

// The two memory regions of a resource archive
enum class Region {
  Virtual,  // CPU-side data
  Physical, // GPU-side data
};

// Archive header (20 bytes including the magic)
struct ArchiveHeader {
  uint32_t flags = 0;             // Passed through unmodified
  uint32_t virtualPageFlags = 0;  // Page layout of the virtual region
  uint32_t physicalPageFlags = 0; // Page layout of the physical region
  int32_t version = 0;            // Only the low byte is significant

  static constexpr size_t headerSize = 20;
};

} // namespace rscx
