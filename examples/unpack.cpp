#include <iostream>
#include <string>

#include <rscx/rscx.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <archive.rsc> [--legacy-sizing]\n";
    return 1;
  }

  rscx::UnpackOptions options;
  options.log = &std::cout;
  if (argc > 2 && std::string(argv[2]) == "--legacy-sizing") {
    options.sizing = rscx::RegionSizing::LegacyVirtualFlags;
  }

  std::string error;
  rscx::Unpacker unpacker(options);
  auto result = unpacker.unpackFile(argv[1], &error);

  if (!result) {
    std::cerr << "Error (" << rscx::stageName(unpacker.stage()) << "): " << error << "\n";
    return 1;
  }

  return 0;
}
