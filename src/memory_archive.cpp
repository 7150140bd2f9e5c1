#include <cstring>
#include <utility>

#include <fmt/format.h>

#include <rscx/memory_archive.hpp>

namespace rscx {

MemoryArchive::MemoryArchive(std::vector<uint8_t> data) : storage_(std::move(data)) {
  data_ = storage_;
}

MemoryArchive::MemoryArchive(std::span<const uint8_t> view) : data_(view) {}

MemoryArchive::MemoryArchive(MemoryArchive &&other) noexcept
    : storage_(std::move(other.storage_)), data_(other.data_), position_(other.position_) {
  other.storage_.clear();
  other.data_ = {};
  other.position_ = 0;
}

MemoryArchive &MemoryArchive::operator=(MemoryArchive &&other) noexcept {
  if (this != &other) {
    storage_ = std::move(other.storage_);
    data_ = other.data_;
    position_ = other.position_;
    other.storage_.clear();
    other.data_ = {};
    other.position_ = 0;
  }
  return *this;
}

std::optional<size_t> MemoryArchive::readBytes(std::span<uint8_t> buffer, std::string *outError) {
  uint64_t available = remaining();
  if (buffer.size() > available) {
    if (outError) {
      *outError = fmt::format("Tried to read {} bytes at position {} but only {} bytes remain",
                              buffer.size(), position_, available);
    }
    return std::nullopt;
  }

  if (!buffer.empty()) {
    std::memcpy(buffer.data(), data_.data() + position_, buffer.size());
  }
  position_ += buffer.size();
  return buffer.size();
}

} // namespace rscx
