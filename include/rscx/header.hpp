#pragma once

#include <optional>
#include <string>

#include "archive_reader.hpp"
#include "types.hpp"

namespace rscx {

// Read one u32 and compare it against kResourceMagic
// Returns false on a read failure or a mismatch (both values reported in outError)
bool checkMagic(ArchiveReader &reader, std::string *outError = nullptr);

// Read the four header fields that follow the magic, in file order
// The version is masked to its low byte
std::optional<ArchiveHeader> readArchiveHeader(ArchiveReader &reader,
                                               std::string *outError = nullptr);

// One-line human-readable description, e.g. for logging
std::string describeHeader(const ArchiveHeader &header);

} // namespace rscx
