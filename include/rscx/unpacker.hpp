#pragma once

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "memory_archive.hpp"
#include "types.hpp"

namespace rscx {

// How the physical region is sized
enum class RegionSizing {
  PerRegionFlags,     // Each region from its own page flags
  LegacyVirtualFlags, // Both regions from the virtual page flags (matches old tool output)
};

// Pipeline stages, in order
enum class UnpackStage {
  Open,
  MagicCheck,
  HeaderParse,
  SizeRegions,
  ExtractRaw,
  Decompress,
  SecondaryParse,
  Done,
};

const char *stageName(UnpackStage stage);

struct UnpackOptions {
  RegionSizing sizing = RegionSizing::PerRegionFlags;
  std::ostream *log = nullptr; // One line per milestone when set
};

// Raw (still compressed) region bytes as stored in the file
struct RawRegions {
  std::vector<uint8_t> virtualData;
  std::vector<uint8_t> physicalData;
};

struct UnpackResult {
  ArchiveHeader header;
  uint64_t virtualSize = 0;  // Raw region sizes taken from the file
  uint64_t physicalSize = 0;
  std::vector<uint8_t> virtualData; // Inflated regions
  std::vector<uint8_t> physicalData;
  uint64_t vft = 0;              // First u64 of the physical region
  uint64_t pagesInfoPointer = 0; // Second u64 of the physical region
};

// Read the virtual then the physical region back to back from the current position
// Sizes are checked against the remaining bytes before anything is allocated
std::optional<RawRegions> extractRegions(MemoryArchive &archive, uint64_t virtualSize,
                                         uint64_t physicalSize, std::string *outError = nullptr);

// Decodes a resource archive: magic, header, region sizes, raw regions,
// inflate, then the two leading u64 fields of the physical region.
// Stops at the first failing stage; stage() tells which one it was.
class Unpacker {
public:
  explicit Unpacker(UnpackOptions options = {});

  // Map the file and decode it
  // Returns std::nullopt on failure, with error message in outError if provided
  std::optional<UnpackResult> unpackFile(const std::filesystem::path &path,
                                         std::string *outError = nullptr);

  // Decode an archive already in memory
  std::optional<UnpackResult> unpack(std::span<const uint8_t> data,
                                     std::string *outError = nullptr);

  // Last stage entered; after a failure, the stage that failed
  UnpackStage stage() const { return stage_; }

  const UnpackOptions &options() const { return options_; }

private:
  std::optional<UnpackResult> run(std::span<const uint8_t> data, std::string *outError);

  void log(const std::string &line) const;

  UnpackOptions options_;
  UnpackStage stage_ = UnpackStage::Open;
};

} // namespace rscx
