#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace rscx {

// Anything bytes can be read from at a position.
//
// Backends implement the two primitives below; every typed read (integers,
// floats, strings) is provided once by the free functions further down and is
// built only on readBytes(), so all backends share identical semantics.
class ArchiveReader {
public:
  virtual ~ArchiveReader() = default;

  // Fill the whole buffer from the current position; whether the position advances is up to the backend
  // Returns the number of bytes read, or std::nullopt on failure (error in outError if provided)
  virtual std::optional<size_t> readBytes(std::span<uint8_t> buffer,
                                          std::string *outError = nullptr) = 0;

  // Move the read position. Never fails; bounds are checked by the next read.
  virtual void setPosition(uint64_t position) = 0;

  virtual uint64_t position() const = 0;
};

// Little-endian typed reads on top of ArchiveReader::readBytes()
// Each returns std::nullopt on failure, with error message in outError if provided
std::optional<uint8_t> readU8(ArchiveReader &reader, std::string *outError = nullptr);
std::optional<uint32_t> readU32(ArchiveReader &reader, std::string *outError = nullptr);
std::optional<int32_t> readI32(ArchiveReader &reader, std::string *outError = nullptr);
std::optional<uint64_t> readU64(ArchiveReader &reader, std::string *outError = nullptr);
std::optional<float> readF32(ArchiveReader &reader, std::string *outError = nullptr);

// Any non-zero byte reads as true
std::optional<bool> readBool(ArchiveReader &reader, std::string *outError = nullptr);

// u32 byte length followed by that many bytes of UTF-8
// On failure the reader is moved back to where the string started
std::optional<std::string> readString(ArchiveReader &reader, std::string *outError = nullptr);

// Strict UTF-8 check: rejects overlong forms, surrogates and code points above U+10FFFF
bool isValidUtf8(std::string_view text);

} // namespace rscx
