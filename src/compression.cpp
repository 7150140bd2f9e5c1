#include <algorithm>
#include <array>
#include <limits>

#include <fmt/format.h>
#include <zlib.h>

#include <rscx/compression.hpp>

namespace rscx {

namespace {

constexpr int kRawWindowBits = -MAX_WBITS;
constexpr size_t kOutputChunkSize = 64 * 1024;
constexpr size_t kMaxInputSlice = std::numeric_limits<uInt>::max();

void setError(std::string *outError, const char *what, const z_stream &stream, int result) {
  if (outError) {
    *outError = fmt::format("{}: {} (zlib error {})", what, stream.msg ? stream.msg : zError(result),
                            result);
  }
}

// RAII wrapper releasing zlib stream state
class InflateStream {
public:
  InflateStream() = default;
  ~InflateStream() {
    if (initialized_) {
      inflateEnd(&stream_);
    }
  }

  InflateStream(const InflateStream &) = delete;
  InflateStream &operator=(const InflateStream &) = delete;

  int init() {
    int result = inflateInit2(&stream_, kRawWindowBits);
    initialized_ = result == Z_OK;
    return result;
  }

  z_stream &get() { return stream_; }

private:
  z_stream stream_{};
  bool initialized_ = false;
};

class DeflateStream {
public:
  DeflateStream() = default;
  ~DeflateStream() {
    if (initialized_) {
      deflateEnd(&stream_);
    }
  }

  DeflateStream(const DeflateStream &) = delete;
  DeflateStream &operator=(const DeflateStream &) = delete;

  int init(int level) {
    int result = deflateInit2(&stream_, level, Z_DEFLATED, kRawWindowBits, 8, Z_DEFAULT_STRATEGY);
    initialized_ = result == Z_OK;
    return result;
  }

  z_stream &get() { return stream_; }

private:
  z_stream stream_{};
  bool initialized_ = false;
};

} // namespace

std::optional<std::vector<uint8_t>> inflateRaw(std::span<const uint8_t> input,
                                               std::string *outError) {
  std::vector<uint8_t> output;
  if (input.empty()) {
    return output;
  }

  InflateStream inflater;
  z_stream &stream = inflater.get();
  int result = inflater.init();
  if (result != Z_OK) {
    setError(outError, "Failed to initialize inflate", stream, result);
    return std::nullopt;
  }

  std::array<uint8_t, kOutputChunkSize> chunk;
  size_t consumed = 0;

  do {
    // Feed input in slices zlib's 32-bit counters can describe
    if (stream.avail_in == 0 && consumed < input.size()) {
      size_t slice = std::min(input.size() - consumed, kMaxInputSlice);
      stream.next_in = const_cast<Bytef *>(input.data() + consumed);
      stream.avail_in = static_cast<uInt>(slice);
      consumed += slice;
    }

    stream.next_out = chunk.data();
    stream.avail_out = static_cast<uInt>(chunk.size());

    result = inflate(&stream, Z_NO_FLUSH);
    if (result == Z_BUF_ERROR || (result == Z_OK && stream.avail_in == 0 &&
                                  consumed == input.size() && stream.avail_out != 0)) {
      if (outError) {
        *outError = fmt::format("Failed to inflate region: stream truncated after {} bytes",
                                stream.total_in);
      }
      return std::nullopt;
    }
    if (result != Z_OK && result != Z_STREAM_END) {
      setError(outError, "Failed to inflate region", stream, result);
      return std::nullopt;
    }

    output.insert(output.end(), chunk.data(), chunk.data() + (chunk.size() - stream.avail_out));
  } while (result != Z_STREAM_END);

  return output;
}

std::optional<std::vector<uint8_t>> deflateRaw(std::span<const uint8_t> input, int level,
                                               std::string *outError) {
  if (level < Z_DEFAULT_COMPRESSION || level > Z_BEST_COMPRESSION) {
    if (outError) {
      *outError = fmt::format("Invalid compression level: {}", level);
    }
    return std::nullopt;
  }

  DeflateStream deflater;
  z_stream &stream = deflater.get();
  int result = deflater.init(level);
  if (result != Z_OK) {
    setError(outError, "Failed to initialize deflate", stream, result);
    return std::nullopt;
  }

  std::vector<uint8_t> output;
  std::array<uint8_t, kOutputChunkSize> chunk;
  size_t consumed = 0;

  do {
    if (stream.avail_in == 0 && consumed < input.size()) {
      size_t slice = std::min(input.size() - consumed, kMaxInputSlice);
      stream.next_in = const_cast<Bytef *>(input.data() + consumed);
      stream.avail_in = static_cast<uInt>(slice);
      consumed += slice;
    }

    stream.next_out = chunk.data();
    stream.avail_out = static_cast<uInt>(chunk.size());

    int flush = consumed == input.size() ? Z_FINISH : Z_NO_FLUSH;
    result = deflate(&stream, flush);
    if (result == Z_STREAM_ERROR) {
      setError(outError, "Failed to deflate region", stream, result);
      return std::nullopt;
    }

    output.insert(output.end(), chunk.data(), chunk.data() + (chunk.size() - stream.avail_out));
  } while (result != Z_STREAM_END);

  return output;
}

} // namespace rscx
