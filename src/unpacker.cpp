#include <ostream>
#include <utility>

#include <fmt/format.h>

#include <rscx/chunk_flags.hpp>
#include <rscx/compression.hpp>
#include <rscx/header.hpp>
#include <rscx/mmap.hpp>
#include <rscx/resource_archive.hpp>
#include <rscx/unpacker.hpp>

namespace rscx {

const char *stageName(UnpackStage stage) {
  switch (stage) {
  case UnpackStage::Open:
    return "open";
  case UnpackStage::MagicCheck:
    return "magic check";
  case UnpackStage::HeaderParse:
    return "header parse";
  case UnpackStage::SizeRegions:
    return "size regions";
  case UnpackStage::ExtractRaw:
    return "extract raw";
  case UnpackStage::Decompress:
    return "decompress";
  case UnpackStage::SecondaryParse:
    return "secondary parse";
  case UnpackStage::Done:
    return "done";
  }
  return "unknown";
}

std::optional<RawRegions> extractRegions(MemoryArchive &archive, uint64_t virtualSize,
                                         uint64_t physicalSize, std::string *outError) {
  uint64_t available = archive.remaining();
  if (virtualSize > available || physicalSize > available - virtualSize) {
    if (outError) {
      *outError = fmt::format("Archive too small for its regions: needs {} + {} bytes at "
                              "position {} but only {} bytes remain",
                              virtualSize, physicalSize, archive.position(), available);
    }
    return std::nullopt;
  }

  RawRegions regions;
  regions.virtualData.resize(static_cast<size_t>(virtualSize));
  regions.physicalData.resize(static_cast<size_t>(physicalSize));

  if (!archive.readBytes(regions.virtualData, outError)) {
    return std::nullopt;
  }
  if (!archive.readBytes(regions.physicalData, outError)) {
    return std::nullopt;
  }

  return regions;
}

Unpacker::Unpacker(UnpackOptions options) : options_(std::move(options)) {}

std::optional<UnpackResult> Unpacker::unpackFile(const std::filesystem::path &path,
                                                 std::string *outError) {
  stage_ = UnpackStage::Open;

  MappedFile file;
  if (!file.openRead(path, outError)) {
    return std::nullopt;
  }
  log(fmt::format("Loaded file {} ({} bytes)", path.string(), file.size()));

  return run(file.data(), outError);
}

std::optional<UnpackResult> Unpacker::unpack(std::span<const uint8_t> data,
                                             std::string *outError) {
  stage_ = UnpackStage::Open;
  log(fmt::format("Loaded archive ({} bytes)", data.size()));

  return run(data, outError);
}

std::optional<UnpackResult> Unpacker::run(std::span<const uint8_t> data, std::string *outError) {
  MemoryArchive archive(data);
  UnpackResult result;

  stage_ = UnpackStage::MagicCheck;
  if (!checkMagic(archive, outError)) {
    return std::nullopt;
  }

  stage_ = UnpackStage::HeaderParse;
  auto header = readArchiveHeader(archive, outError);
  if (!header) {
    return std::nullopt;
  }
  result.header = *header;
  log(fmt::format("Header: {}", describeHeader(result.header)));

  stage_ = UnpackStage::SizeRegions;
  uint32_t physicalFlags = options_.sizing == RegionSizing::LegacyVirtualFlags
                               ? result.header.virtualPageFlags
                               : result.header.physicalPageFlags;
  result.virtualSize = ResourceChunkFlags(result.header.virtualPageFlags).size();
  result.physicalSize = ResourceChunkFlags(physicalFlags).size();
  log(fmt::format("Virtual size: {}", result.virtualSize));
  log(fmt::format("Physical size: {}", result.physicalSize));

  stage_ = UnpackStage::ExtractRaw;
  auto raw = extractRegions(archive, result.virtualSize, result.physicalSize, outError);
  if (!raw) {
    return std::nullopt;
  }

  stage_ = UnpackStage::Decompress;
  auto virtualData = inflateRaw(raw->virtualData, outError);
  if (!virtualData) {
    return std::nullopt;
  }
  auto physicalData = inflateRaw(raw->physicalData, outError);
  if (!physicalData) {
    return std::nullopt;
  }
  log(fmt::format("Decompressed virtual size: {}", virtualData->size()));
  log(fmt::format("Decompressed physical size: {}", physicalData->size()));

  result.virtualData = std::move(*virtualData);
  result.physicalData = std::move(*physicalData);

  stage_ = UnpackStage::SecondaryParse;
  ResourceArchive resource{MemoryArchive(std::span<const uint8_t>(result.virtualData)),
                           MemoryArchive(std::span<const uint8_t>(result.physicalData))};
  resource.setPosition(kPhysicalBase);

  auto vft = readU64(resource, outError);
  if (!vft) {
    return std::nullopt;
  }
  resource.setPosition(kPhysicalBase + sizeof(uint64_t));
  auto pagesInfoPointer = readU64(resource, outError);
  if (!pagesInfoPointer) {
    return std::nullopt;
  }
  result.vft = *vft;
  result.pagesInfoPointer = *pagesInfoPointer;
  log(fmt::format("VFT: {:#x}", result.vft));
  log(fmt::format("Pages info pointer: {:#x}", result.pagesInfoPointer));

  stage_ = UnpackStage::Done;
  return result;
}

void Unpacker::log(const std::string &line) const {
  if (options_.log) {
    *options_.log << line << '\n';
  }
}

} // namespace rscx
