#include <utility>

#include <fmt/format.h>

#include <rscx/resource_archive.hpp>

namespace rscx {

ResourceArchive::ResourceArchive(MemoryArchive virtualArchive, MemoryArchive physicalArchive)
    : virtualArchive_(std::move(virtualArchive)), physicalArchive_(std::move(physicalArchive)) {}

std::optional<ResolvedAddress> ResourceArchive::resolveAddress(uint64_t address) {
  if ((address & kVirtualBase) == kVirtualBase) {
    return ResolvedAddress{Region::Virtual, kVirtualBase, address & ~kVirtualBase};
  }
  if ((address & kPhysicalBase) == kPhysicalBase) {
    return ResolvedAddress{Region::Physical, kPhysicalBase, address & ~kPhysicalBase};
  }
  return std::nullopt;
}

std::optional<size_t> ResourceArchive::readBytes(std::span<uint8_t> buffer, std::string *outError) {
  auto resolved = resolveAddress(address_);
  if (!resolved) {
    if (outError) {
      *outError = fmt::format("Invalid resource address: {:#x}", address_);
    }
    return std::nullopt;
  }

  MemoryArchive &archive = archiveFor(resolved->region);
  archive.setPosition(resolved->offset);

  auto read = archive.readBytes(buffer, outError);
  if (!read) {
    return std::nullopt;
  }

  address_ |= resolved->base;
  return read;
}

MemoryArchive &ResourceArchive::archiveFor(Region region) {
  return region == Region::Virtual ? virtualArchive_ : physicalArchive_;
}

} // namespace rscx
