#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "archive_reader.hpp"

namespace rscx {

// Sequential reader over an in-memory buffer
// Either owns its bytes or views bytes owned by someone else (e.g. a MappedFile)
class MemoryArchive : public ArchiveReader {
public:
  explicit MemoryArchive(std::vector<uint8_t> data);
  explicit MemoryArchive(std::span<const uint8_t> view);
  ~MemoryArchive() override = default;

  // Delete copy, enable move
  MemoryArchive(const MemoryArchive &) = delete;
  MemoryArchive &operator=(const MemoryArchive &) = delete;
  MemoryArchive(MemoryArchive &&other) noexcept;
  MemoryArchive &operator=(MemoryArchive &&other) noexcept;

  // Fails without copying or moving if fewer than buffer.size() bytes remain
  std::optional<size_t> readBytes(std::span<uint8_t> buffer,
                                  std::string *outError = nullptr) override;

  void setPosition(uint64_t position) override { position_ = position; }
  uint64_t position() const override { return position_; }

  // Buffer length, fixed at construction
  size_t size() const { return data_.size(); }

  // Bytes left after the current position (0 if positioned past the end)
  uint64_t remaining() const { return position_ < data_.size() ? data_.size() - position_ : 0; }

  std::span<const uint8_t> data() const { return data_; }

private:
  std::vector<uint8_t> storage_; // Empty when viewing external bytes
  std::span<const uint8_t> data_;
  uint64_t position_ = 0;
};

} // namespace rscx
