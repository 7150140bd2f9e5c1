#pragma once

#include <cstdint>
#include <optional>

#include "memory_archive.hpp"
#include "types.hpp"

namespace rscx {

// Where a resource address points: a region and an offset inside it
struct ResolvedAddress {
  Region region = Region::Virtual;
  uint64_t base = 0;   // kVirtualBase or kPhysicalBase
  uint64_t offset = 0; // Address with the base bits cleared
};

// Reader over the two regions of a resource archive sharing one address space.
//
// Addresses carry the region in their high bits: 0x5xxxxxxx reads from the
// virtual region, 0x6xxxxxxx from the physical one. The region is resolved
// from the stored address on every read. Reads do not advance the stored
// address: reading another offset, in either region, takes a setPosition().
class ResourceArchive : public ArchiveReader {
public:
  ResourceArchive(MemoryArchive virtualArchive, MemoryArchive physicalArchive);
  ~ResourceArchive() override = default;

  // Delete copy, enable move
  ResourceArchive(const ResourceArchive &) = delete;
  ResourceArchive &operator=(const ResourceArchive &) = delete;
  ResourceArchive(ResourceArchive &&) noexcept = default;
  ResourceArchive &operator=(ResourceArchive &&) noexcept = default;

  // Map an address onto a region; the virtual marker wins when both are set
  // Returns std::nullopt if neither region marker is set
  static std::optional<ResolvedAddress> resolveAddress(uint64_t address);

  // Fails with an invalid-address error if the current address has no region marker
  std::optional<size_t> readBytes(std::span<uint8_t> buffer,
                                  std::string *outError = nullptr) override;

  // Stored verbatim, validated by the next read
  void setPosition(uint64_t address) override { address_ = address; }
  uint64_t position() const override { return address_; }

  const MemoryArchive &virtualArchive() const { return virtualArchive_; }
  const MemoryArchive &physicalArchive() const { return physicalArchive_; }

private:
  MemoryArchive &archiveFor(Region region);

  MemoryArchive virtualArchive_;
  MemoryArchive physicalArchive_;
  uint64_t address_ = 0;
};

} // namespace rscx
