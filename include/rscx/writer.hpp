#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "types.hpp"

namespace rscx {

struct WriterOptions {
  int compressionLevel = -1; // zlib level, -1 for the zlib default
};

// Packs two payloads into a resource archive.
//
// Each payload is deflated into its region; regions are sized from the page
// flags and zero-padded, so the flags must describe regions large enough for
// the compressed payloads.
class Writer {
public:
  static constexpr uint64_t maxBuildSize = uint64_t{1} << 32;

  explicit Writer(WriterOptions options = {});
  ~Writer() = default;

  // Delete copy, enable move
  Writer(const Writer &) = delete;
  Writer &operator=(const Writer &) = delete;
  Writer(Writer &&) noexcept = default;
  Writer &operator=(Writer &&) noexcept = default;

  void setFlags(uint32_t flags) { header_.flags = flags; }
  void setVersion(int32_t version) { header_.version = version; }
  void setPageFlags(Region region, uint32_t pageFlags);

  // Set region payload from memory
  void setRegionData(Region region, std::span<const uint8_t> data);

  // Set region payload from a file on disk
  // Returns true on success, false on failure (error in outError if provided)
  bool setRegionFile(Region region, const std::filesystem::path &sourcePath,
                     std::string *outError = nullptr);

  const ArchiveHeader &header() const { return header_; }

  // Size of the archive write() produces, derived from the page flags
  uint64_t archiveSize() const;

  // Build the archive in memory; archives over maxBuildSize bytes must go through write()
  // Returns std::nullopt on failure, with error message in outError if provided
  std::optional<std::vector<uint8_t>> build(std::string *outError = nullptr) const;

  // Write archive to disk
  // Returns true on success, false on failure (error in outError if provided)
  bool write(const std::filesystem::path &destPath, std::string *outError = nullptr) const;

  // Reset header and payloads
  void clear();

private:
  // Serialize into a zeroed buffer of archiveSize() bytes
  bool fill(std::span<uint8_t> out, std::string *outError) const;

  bool packRegion(Region region, std::span<uint8_t> out, std::string *outError) const;

  WriterOptions options_;
  ArchiveHeader header_;
  std::vector<uint8_t> virtualData_;
  std::vector<uint8_t> physicalData_;
};

} // namespace rscx
