#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

#include <rscx/chunk_flags.hpp>
#include <rscx/header.hpp>
#include <rscx/unpacker.hpp>
#include <rscx/writer.hpp>

#include "archive_bytes.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;

namespace {

// One 512-byte page
constexpr uint32_t kSmallPageFlags = 0x08000000;
// One 1024-byte page
constexpr uint32_t kLargePageFlags = 0x04000000;

constexpr uint64_t kVft = 0x0000000140A1B2C8ull;
constexpr uint64_t kPagesInfo = 0x0000000050000040ull;

} // namespace

class UnpackerTest : public ::testing::Test {
protected:
  void SetUp() override {
    tempDir_ = fs::temp_directory_path() / "rscx_test_unpacker";
    fs::create_directories(tempDir_);

    virtualPayload_ = {'v', 'i', 'r', 't', 'u', 'a', 'l'};
    appendU64(physicalPayload_, kVft);
    appendU64(physicalPayload_, kPagesInfo);
    physicalPayload_.insert(physicalPayload_.end(), 32, 0xCD);
  }

  void TearDown() override { fs::remove_all(tempDir_); }

  std::vector<uint8_t> buildArchive() {
    rscx::Writer writer;
    writer.setFlags(0x1);
    writer.setVersion(165);
    writer.setPageFlags(rscx::Region::Virtual, kSmallPageFlags);
    writer.setPageFlags(rscx::Region::Physical, kLargePageFlags);
    writer.setRegionData(rscx::Region::Virtual, virtualPayload_);
    writer.setRegionData(rscx::Region::Physical, physicalPayload_);

    std::string error;
    auto bytes = writer.build(&error);
    EXPECT_TRUE(bytes.has_value()) << error;
    return bytes.value_or(std::vector<uint8_t>{});
  }

  // Header followed by exactly as many zero bytes as the page flags call for
  static std::vector<uint8_t> zeroFilledArchive(uint32_t virtualFlags, uint32_t physicalFlags) {
    auto bytes = makeHeaderBytes(0, virtualFlags, physicalFlags, 0);
    uint64_t regions = rscx::ResourceChunkFlags(virtualFlags).size() +
                       rscx::ResourceChunkFlags(physicalFlags).size();
    bytes.resize(bytes.size() + regions, 0);
    return bytes;
  }

  fs::path writeFile(const std::string &name, const std::vector<uint8_t> &content) {
    fs::path filePath = tempDir_ / name;
    std::ofstream file(filePath, std::ios::binary);
    file.write(reinterpret_cast<const char *>(content.data()), content.size());
    return filePath;
  }

  fs::path tempDir_;
  std::vector<uint8_t> virtualPayload_;
  std::vector<uint8_t> physicalPayload_;
};

// Test a full decode of an archive built by the writer
TEST_F(UnpackerTest, UnpackBuiltArchive) {
  auto bytes = buildArchive();
  ASSERT_EQ(bytes.size(), rscx::ArchiveHeader::headerSize + 512 + 1024);

  rscx::Unpacker unpacker;
  std::string error;
  auto result = unpacker.unpack(bytes, &error);
  ASSERT_TRUE(result.has_value()) << error;
  EXPECT_EQ(unpacker.stage(), rscx::UnpackStage::Done);

  EXPECT_EQ(result->header.flags, 0x1u);
  EXPECT_EQ(result->header.virtualPageFlags, kSmallPageFlags);
  EXPECT_EQ(result->header.physicalPageFlags, kLargePageFlags);
  EXPECT_EQ(result->header.version, 165);
  EXPECT_EQ(result->virtualSize, 512);
  EXPECT_EQ(result->physicalSize, 1024);
  EXPECT_EQ(result->virtualData, virtualPayload_);
  EXPECT_EQ(result->physicalData, physicalPayload_);
  EXPECT_EQ(result->vft, kVft);
  EXPECT_EQ(result->pagesInfoPointer, kPagesInfo);
}

// Test decoding from disk with progress logging
TEST_F(UnpackerTest, UnpackFileWithLog) {
  fs::path archivePath = writeFile("model.rsc", buildArchive());

  std::ostringstream log;
  rscx::UnpackOptions options;
  options.log = &log;

  rscx::Unpacker unpacker(options);
  std::string error;
  auto result = unpacker.unpackFile(archivePath, &error);
  ASSERT_TRUE(result.has_value()) << error;
  EXPECT_EQ(result->vft, kVft);

  std::string output = log.str();
  EXPECT_NE(output.find("Loaded file"), std::string::npos) << output;
  EXPECT_NE(output.find("(1556 bytes)"), std::string::npos) << output;
  EXPECT_NE(output.find("Header: flags=0x00000001"), std::string::npos) << output;
  EXPECT_NE(output.find("Virtual size: 512"), std::string::npos) << output;
  EXPECT_NE(output.find("Physical size: 1024"), std::string::npos) << output;
  EXPECT_NE(output.find("Decompressed virtual size: 7"), std::string::npos) << output;
  EXPECT_NE(output.find("Decompressed physical size: 48"), std::string::npos) << output;
  EXPECT_NE(output.find("VFT: 0x140a1b2c8"), std::string::npos) << output;
  EXPECT_NE(output.find("Pages info pointer: 0x50000040"), std::string::npos) << output;
}

// Test that nothing is logged without a log stream
TEST_F(UnpackerTest, SilentByDefault) {
  rscx::Unpacker unpacker;
  EXPECT_EQ(unpacker.options().log, nullptr);
  EXPECT_EQ(unpacker.options().sizing, rscx::RegionSizing::PerRegionFlags);
}

// Test sizing the physical region from the virtual flags, as older tools did
TEST_F(UnpackerTest, LegacySizing) {
  auto bytes = buildArchive();

  rscx::UnpackOptions options;
  options.sizing = rscx::RegionSizing::LegacyVirtualFlags;
  rscx::Unpacker unpacker(options);

  std::string error;
  auto result = unpacker.unpack(bytes, &error);
  ASSERT_TRUE(result.has_value()) << error;
  EXPECT_EQ(result->virtualSize, 512);
  EXPECT_EQ(result->physicalSize, 512);
  EXPECT_EQ(result->vft, kVft);
}

// Test that a header plus zero-filled regions of the exact size extracts cleanly
TEST_F(UnpackerTest, ExtractZeroFilledRegions) {
  auto bytes = zeroFilledArchive(kSmallPageFlags, kLargePageFlags | 0x08000000);
  rscx::MemoryArchive archive(bytes);

  std::string error;
  ASSERT_TRUE(rscx::checkMagic(archive, &error)) << error;
  auto header = rscx::readArchiveHeader(archive, &error);
  ASSERT_TRUE(header.has_value()) << error;

  uint64_t virtualSize = rscx::ResourceChunkFlags(header->virtualPageFlags).size();
  uint64_t physicalSize = rscx::ResourceChunkFlags(header->physicalPageFlags).size();
  auto regions = rscx::extractRegions(archive, virtualSize, physicalSize, &error);
  ASSERT_TRUE(regions.has_value()) << error;
  EXPECT_EQ(regions->virtualData.size(), 512);
  EXPECT_EQ(regions->physicalData.size(), 1536);
  EXPECT_EQ(archive.remaining(), 0);
}

// Test that one byte missing from the regions fails extraction
TEST_F(UnpackerTest, ExtractTruncatedRegions) {
  auto bytes = zeroFilledArchive(kSmallPageFlags, kLargePageFlags);
  bytes.pop_back();
  rscx::MemoryArchive archive(bytes);
  archive.setPosition(rscx::ArchiveHeader::headerSize);

  std::string error;
  EXPECT_FALSE(rscx::extractRegions(archive, 512, 1024, &error).has_value());
  EXPECT_NE(error.find("too small"), std::string::npos) << error;
  EXPECT_EQ(archive.position(), rscx::ArchiveHeader::headerSize);

  rscx::Unpacker unpacker;
  EXPECT_FALSE(unpacker.unpack(bytes, &error).has_value());
  EXPECT_EQ(unpacker.stage(), rscx::UnpackStage::ExtractRaw);
}

// Test that huge claimed regions fail before anything is allocated
TEST_F(UnpackerTest, ExtractOversizedRegions) {
  auto bytes = zeroFilledArchive(0, 0);
  rscx::MemoryArchive archive(bytes);
  archive.setPosition(rscx::ArchiveHeader::headerSize);

  std::string error;
  EXPECT_FALSE(rscx::extractRegions(archive, UINT64_MAX, 1, &error).has_value());
  EXPECT_FALSE(rscx::extractRegions(archive, 0, UINT64_MAX, &error).has_value());
}

// Test that zero bytes are not a valid deflate stream
TEST_F(UnpackerTest, ZeroFilledRegionsFailToInflate) {
  auto bytes = zeroFilledArchive(kSmallPageFlags, kLargePageFlags);

  rscx::Unpacker unpacker;
  std::string error;
  EXPECT_FALSE(unpacker.unpack(bytes, &error).has_value());
  EXPECT_EQ(unpacker.stage(), rscx::UnpackStage::Decompress);
  EXPECT_NE(error.find("Failed to inflate region"), std::string::npos) << error;
}

// Test that a file shorter than the header fails before the header is parsed
TEST_F(UnpackerTest, ShortFile) {
  auto bytes = makeHeaderBytes(0, 0, 0, 0);
  bytes.resize(12);

  rscx::Unpacker unpacker;
  std::string error;
  EXPECT_FALSE(unpacker.unpack(bytes, &error).has_value());
  EXPECT_EQ(unpacker.stage(), rscx::UnpackStage::HeaderParse);
  EXPECT_NE(error.find("Tried to read"), std::string::npos) << error;

  bytes.resize(2);
  EXPECT_FALSE(unpacker.unpack(bytes, &error).has_value());
  EXPECT_EQ(unpacker.stage(), rscx::UnpackStage::MagicCheck);

  EXPECT_FALSE(unpacker.unpack({}, &error).has_value());
  EXPECT_EQ(unpacker.stage(), rscx::UnpackStage::MagicCheck);
}

// Test that a wrong magic stops the pipeline
TEST_F(UnpackerTest, InvalidMagic) {
  auto bytes = makeHeaderBytes(0, 0, 0, 0, 0x46474942);

  rscx::Unpacker unpacker;
  std::string error;
  EXPECT_FALSE(unpacker.unpack(bytes, &error).has_value());
  EXPECT_EQ(unpacker.stage(), rscx::UnpackStage::MagicCheck);
  EXPECT_NE(error.find("0x46474942"), std::string::npos) << error;
}

// Test that a physical region too short for the two pointers fails the last stage
TEST_F(UnpackerTest, PhysicalRegionTooShort) {
  rscx::Writer writer;
  writer.setPageFlags(rscx::Region::Physical, kSmallPageFlags);
  std::vector<uint8_t> shortPayload = {1, 2, 3, 4, 5, 6, 7, 8, 9};
  writer.setRegionData(rscx::Region::Physical, shortPayload);

  std::string error;
  auto bytes = writer.build(&error);
  ASSERT_TRUE(bytes.has_value()) << error;

  rscx::Unpacker unpacker;
  EXPECT_FALSE(unpacker.unpack(*bytes, &error).has_value());
  EXPECT_EQ(unpacker.stage(), rscx::UnpackStage::SecondaryParse);
  EXPECT_NE(error.find("Tried to read 8 bytes"), std::string::npos) << error;
}

// Test that a corrupt virtual region aborts decompression
TEST_F(UnpackerTest, CorruptVirtualRegion) {
  auto bytes = buildArchive();
  bytes[rscx::ArchiveHeader::headerSize] = 0xFF; // Reserved block type

  rscx::Unpacker unpacker;
  std::string error;
  EXPECT_FALSE(unpacker.unpack(bytes, &error).has_value());
  EXPECT_EQ(unpacker.stage(), rscx::UnpackStage::Decompress);
}

// Test opening a missing file
TEST_F(UnpackerTest, MissingFile) {
  rscx::Unpacker unpacker;
  std::string error;
  EXPECT_FALSE(unpacker.unpackFile(tempDir_ / "missing.rsc", &error).has_value());
  EXPECT_EQ(unpacker.stage(), rscx::UnpackStage::Open);
  EXPECT_FALSE(error.empty());
}

// Test opening an empty file
TEST_F(UnpackerTest, EmptyFile) {
  fs::path archivePath = writeFile("empty.rsc", {});

  rscx::Unpacker unpacker;
  std::string error;
  EXPECT_FALSE(unpacker.unpackFile(archivePath, &error).has_value());
  EXPECT_EQ(unpacker.stage(), rscx::UnpackStage::Open);
}

// Test stage names used in error reports
TEST_F(UnpackerTest, StageNames) {
  EXPECT_STREQ(rscx::stageName(rscx::UnpackStage::Open), "open");
  EXPECT_STREQ(rscx::stageName(rscx::UnpackStage::ExtractRaw), "extract raw");
  EXPECT_STREQ(rscx::stageName(rscx::UnpackStage::Done), "done");
}
