#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace rscx {

// Raw DEFLATE (no zlib/gzip wrapper), as stored in resource archive regions

// Inflate one deflate stream. Bytes after the end of the stream (page padding) are ignored.
// An empty input inflates to an empty buffer.
// Returns std::nullopt on corrupt or truncated input, with error message in outError if provided
std::optional<std::vector<uint8_t>> inflateRaw(std::span<const uint8_t> input,
                                               std::string *outError = nullptr);

// Deflate into a single stream at the given zlib level (-1 for the zlib default, 0..9)
std::optional<std::vector<uint8_t>> deflateRaw(std::span<const uint8_t> input, int level = -1,
                                               std::string *outError = nullptr);

} // namespace rscx
