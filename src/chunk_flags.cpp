#include <numeric>

#include <rscx/chunk_flags.hpp>

namespace rscx {

ResourceChunkFlags::ResourceChunkFlags(uint32_t value) : value_(value) {}

std::array<uint64_t, ResourceChunkFlags::bucketCount> ResourceChunkFlags::chunkSizes() const {
  std::array<uint64_t, bucketCount> sizes{};
  for (size_t i = 0; i < bucketCount; ++i) {
    sizes[i] = static_cast<uint64_t>(baseSize()) << (bucketCount - 1 - i);
  }
  return sizes;
}

std::array<uint32_t, ResourceChunkFlags::bucketCount> ResourceChunkFlags::bucketCounts() const {
  std::array<uint32_t, bucketCount> counts{};
  for (size_t i = 0; i < bucketCount; ++i) {
    counts[i] = (value_ >> bucketShifts[i]) & bucketMasks[i];
  }
  return counts;
}

std::array<uint64_t, ResourceChunkFlags::bucketCount> ResourceChunkFlags::bucketSizes() const {
  auto chunks = chunkSizes();
  auto counts = bucketCounts();

  std::array<uint64_t, bucketCount> sizes{};
  for (size_t i = 0; i < bucketCount; ++i) {
    sizes[i] = chunks[i] * counts[i];
  }
  return sizes;
}

uint64_t ResourceChunkFlags::size() const {
  auto sizes = bucketSizes();
  return std::accumulate(sizes.begin(), sizes.end(), uint64_t{0});
}

} // namespace rscx
