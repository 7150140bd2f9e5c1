#include <fmt/format.h>

#include <rscx/header.hpp>

namespace rscx {

bool checkMagic(ArchiveReader &reader, std::string *outError) {
  auto magic = readU32(reader, outError);
  if (!magic) {
    return false;
  }

  if (*magic != kResourceMagic) {
    if (outError) {
      *outError = fmt::format("Invalid resource archive magic: {:#010x} (expected {:#010x})",
                              *magic, kResourceMagic);
    }
    return false;
  }

  return true;
}

std::optional<ArchiveHeader> readArchiveHeader(ArchiveReader &reader, std::string *outError) {
  ArchiveHeader header;

  auto flags = readU32(reader, outError);
  if (!flags) {
    return std::nullopt;
  }
  header.flags = *flags;

  auto virtualPageFlags = readU32(reader, outError);
  if (!virtualPageFlags) {
    return std::nullopt;
  }
  header.virtualPageFlags = *virtualPageFlags;

  auto physicalPageFlags = readU32(reader, outError);
  if (!physicalPageFlags) {
    return std::nullopt;
  }
  header.physicalPageFlags = *physicalPageFlags;

  auto version = readI32(reader, outError);
  if (!version) {
    return std::nullopt;
  }
  header.version = *version & 0xFF;

  return header;
}

std::string describeHeader(const ArchiveHeader &header) {
  return fmt::format("flags={:#010x} virtualPageFlags={:#010x} physicalPageFlags={:#010x} version={}",
                     header.flags, header.virtualPageFlags, header.physicalPageFlags,
                     header.version);
}

} // namespace rscx
