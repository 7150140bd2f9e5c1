#include <array>
#include <bit>

#include <fmt/format.h>

#include <rscx/archive_reader.hpp>
#include <rscx/endian.hpp>

namespace rscx {

namespace {

// Strings are read in slices so a corrupt length fails at the end of the data
// instead of allocating the whole claimed size up front
constexpr size_t kStringSliceSize = 64 * 1024;

template <typename T> std::optional<T> readLittleEndian(ArchiveReader &reader, std::string *outError) {
  std::array<uint8_t, sizeof(T)> scratch{};
  if (!reader.readBytes(scratch, outError)) {
    return std::nullopt;
  }
  return loadLittleEndian<T>(scratch.data());
}

} // namespace

std::optional<uint8_t> readU8(ArchiveReader &reader, std::string *outError) {
  std::array<uint8_t, 1> scratch{};
  if (!reader.readBytes(scratch, outError)) {
    return std::nullopt;
  }
  return scratch[0];
}

std::optional<uint32_t> readU32(ArchiveReader &reader, std::string *outError) {
  return readLittleEndian<uint32_t>(reader, outError);
}

std::optional<int32_t> readI32(ArchiveReader &reader, std::string *outError) {
  auto value = readLittleEndian<uint32_t>(reader, outError);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<int32_t>(*value);
}

std::optional<uint64_t> readU64(ArchiveReader &reader, std::string *outError) {
  return readLittleEndian<uint64_t>(reader, outError);
}

std::optional<float> readF32(ArchiveReader &reader, std::string *outError) {
  auto bits = readLittleEndian<uint32_t>(reader, outError);
  if (!bits) {
    return std::nullopt;
  }
  return std::bit_cast<float>(*bits);
}

std::optional<bool> readBool(ArchiveReader &reader, std::string *outError) {
  auto value = readU8(reader, outError);
  if (!value) {
    return std::nullopt;
  }
  return *value != 0;
}

std::optional<std::string> readString(ArchiveReader &reader, std::string *outError) {
  uint64_t start = reader.position();

  auto length = readU32(reader, outError);
  if (!length) {
    return std::nullopt;
  }

  std::string result;
  size_t pending = *length;
  while (pending > 0) {
    size_t slice = pending < kStringSliceSize ? pending : kStringSliceSize;
    size_t offset = result.size();
    result.resize(offset + slice);

    auto bytes = std::span<uint8_t>(reinterpret_cast<uint8_t *>(result.data()) + offset, slice);
    if (!reader.readBytes(bytes, outError)) {
      reader.setPosition(start);
      return std::nullopt;
    }
    pending -= slice;
  }

  if (!isValidUtf8(result)) {
    if (outError) {
      *outError = fmt::format("Invalid UTF-8 sequence in string of {} bytes", result.size());
    }
    reader.setPosition(start);
    return std::nullopt;
  }

  return result;
}

bool isValidUtf8(std::string_view text) {
  size_t i = 0;
  while (i < text.size()) {
    auto lead = static_cast<uint8_t>(text[i]);
    if (lead < 0x80) {
      ++i;
      continue;
    }

    // Sequence length and the allowed range of the second byte
    size_t length = 0;
    uint8_t low = 0x80;
    uint8_t high = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
      length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      length = 3;
      if (lead == 0xE0) {
        low = 0xA0; // Overlong
      } else if (lead == 0xED) {
        high = 0x9F; // Surrogates
      }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      length = 4;
      if (lead == 0xF0) {
        low = 0x90; // Overlong
      } else if (lead == 0xF4) {
        high = 0x8F; // Above U+10FFFF
      }
    } else {
      return false;
    }

    if (text.size() - i < length) {
      return false;
    }

    auto second = static_cast<uint8_t>(text[i + 1]);
    if (second < low || second > high) {
      return false;
    }
    for (size_t j = 2; j < length; ++j) {
      auto next = static_cast<uint8_t>(text[i + j]);
      if (next < 0x80 || next > 0xBF) {
        return false;
      }
    }

    i += length;
  }

  return true;
}

} // namespace rscx
