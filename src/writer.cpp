#include <algorithm>
#include <fstream>
#include <limits>
#include <utility>

#include <fmt/format.h>

#include <rscx/chunk_flags.hpp>
#include <rscx/compression.hpp>
#include <rscx/endian.hpp>
#include <rscx/mmap.hpp>
#include <rscx/writer.hpp>

namespace rscx {

namespace {

const char *regionName(Region region) {
  return region == Region::Virtual ? "virtual" : "physical";
}

} // namespace

Writer::Writer(WriterOptions options) : options_(options) {}

void Writer::setPageFlags(Region region, uint32_t pageFlags) {
  if (region == Region::Virtual) {
    header_.virtualPageFlags = pageFlags;
  } else {
    header_.physicalPageFlags = pageFlags;
  }
}

void Writer::setRegionData(Region region, std::span<const uint8_t> data) {
  auto &target = region == Region::Virtual ? virtualData_ : physicalData_;
  target.assign(data.begin(), data.end());
}

bool Writer::setRegionFile(Region region, const std::filesystem::path &sourcePath,
                           std::string *outError) {
  std::ifstream in(sourcePath, std::ios::binary | std::ios::ate);
  if (!in) {
    if (outError) {
      *outError = fmt::format("Failed to open source file: {}", sourcePath.string());
    }
    return false;
  }

  auto fileSize = static_cast<size_t>(in.tellg());
  in.seekg(0, std::ios::beg);

  std::vector<uint8_t> data(fileSize);
  if (!in.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(fileSize))) {
    if (outError) {
      *outError = fmt::format("Failed to read source file: {}", sourcePath.string());
    }
    return false;
  }

  auto &target = region == Region::Virtual ? virtualData_ : physicalData_;
  target = std::move(data);
  return true;
}

uint64_t Writer::archiveSize() const {
  return ArchiveHeader::headerSize + ResourceChunkFlags(header_.virtualPageFlags).size() +
         ResourceChunkFlags(header_.physicalPageFlags).size();
}

std::optional<std::vector<uint8_t>> Writer::build(std::string *outError) const {
  uint64_t totalSize = archiveSize();
  if (totalSize > maxBuildSize || totalSize > std::vector<uint8_t>().max_size()) {
    if (outError) {
      *outError = fmt::format("Archive size {} is too large to build in memory (limit {})",
                              totalSize, maxBuildSize);
    }
    return std::nullopt;
  }

  std::vector<uint8_t> output(static_cast<size_t>(totalSize), 0);
  if (!fill(output, outError)) {
    return std::nullopt;
  }
  return output;
}

bool Writer::write(const std::filesystem::path &destPath, std::string *outError) const {
  uint64_t totalSize = archiveSize();
  if (totalSize > std::numeric_limits<size_t>::max()) {
    if (outError) {
      *outError = fmt::format("Archive size {} exceeds addressable memory", totalSize);
    }
    return false;
  }

  if (destPath.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(destPath.parent_path(), ec);
    if (ec) {
      if (outError) {
        *outError = fmt::format("Failed to create output directory: {} ({})",
                                destPath.parent_path().string(), ec.message());
      }
      return false;
    }
  }

  MappedFile outputFile;
  if (!outputFile.openWrite(destPath, static_cast<size_t>(totalSize), outError)) {
    return false;
  }

  // A freshly truncated file reads as zeros, which provides the region padding
  if (!fill(outputFile.data(), outError)) {
    return false;
  }

  return outputFile.flush(outError);
}

void Writer::clear() {
  header_ = ArchiveHeader{};
  virtualData_.clear();
  physicalData_.clear();
}

bool Writer::fill(std::span<uint8_t> out, std::string *outError) const {
  uint8_t *pos = out.data();
  storeLittleEndian<uint32_t>(pos, kResourceMagic);
  storeLittleEndian<uint32_t>(pos + 4, header_.flags);
  storeLittleEndian<uint32_t>(pos + 8, header_.virtualPageFlags);
  storeLittleEndian<uint32_t>(pos + 12, header_.physicalPageFlags);
  storeLittleEndian<uint32_t>(pos + 16, static_cast<uint32_t>(header_.version));

  auto virtualSize = static_cast<size_t>(ResourceChunkFlags(header_.virtualPageFlags).size());
  auto regions = out.subspan(ArchiveHeader::headerSize);

  if (!packRegion(Region::Virtual, regions.first(virtualSize), outError)) {
    return false;
  }
  return packRegion(Region::Physical, regions.subspan(virtualSize), outError);
}

bool Writer::packRegion(Region region, std::span<uint8_t> out, std::string *outError) const {
  const auto &payload = region == Region::Virtual ? virtualData_ : physicalData_;
  if (out.empty() && payload.empty()) {
    return true;
  }

  auto compressed = deflateRaw(payload, options_.compressionLevel, outError);
  if (!compressed) {
    return false;
  }

  if (compressed->size() > out.size()) {
    if (outError) {
      *outError = fmt::format("Compressed {} payload ({} bytes) does not fit its region ({} bytes)",
                              regionName(region), compressed->size(), out.size());
    }
    return false;
  }

  std::copy(compressed->begin(), compressed->end(), out.begin());
  return true;
}

} // namespace rscx
