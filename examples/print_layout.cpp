#include <cstdint>
#include <exception>
#include <iostream>
#include <string>

#include <fmt/format.h>

#include <rscx/chunk_flags.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <page-flags> [<page-flags> ...]\n";
    return 1;
  }

  for (int arg = 1; arg < argc; ++arg) {
    uint32_t value = 0;
    try {
      size_t used = 0;
      unsigned long parsed = std::stoul(argv[arg], &used, 0);
      if (used != std::string(argv[arg]).size() || parsed > UINT32_MAX) {
        std::cerr << "Error: not a 32-bit value: " << argv[arg] << "\n";
        return 1;
      }
      value = static_cast<uint32_t>(parsed);
    } catch (const std::exception &) {
      std::cerr << "Error: not a number: " << argv[arg] << "\n";
      return 1;
    }

    rscx::ResourceChunkFlags flags(value);
    std::cout << fmt::format("{:#010x}: type {} base size {:#x}\n", flags.value(), flags.type(),
                             flags.baseSize());

    auto chunkSizes = flags.chunkSizes();
    auto counts = flags.bucketCounts();
    auto sizes = flags.bucketSizes();
    for (size_t i = 0; i < rscx::ResourceChunkFlags::bucketCount; ++i) {
      if (counts[i] == 0) {
        continue;
      }
      std::cout << fmt::format("  bucket {}: {} x {:#x} = {:#x}\n", i, counts[i], chunkSizes[i],
                               sizes[i]);
    }
    std::cout << fmt::format("  total: {:#x} ({} bytes)\n", flags.size(), flags.size());
  }

  return 0;
}
