#pragma once

// Resource Archive Library
// A C++20 library for decoding RSC7 resource archives: packed game-asset
// containers holding a "virtual" (CPU) and a "physical" (GPU) memory region.

#include "archive_reader.hpp"
#include "chunk_flags.hpp"
#include "compression.hpp"
#include "header.hpp"
#include "memory_archive.hpp"
#include "mmap.hpp"
#include "resource_archive.hpp"
#include "types.hpp"
#include "unpacker.hpp"
#include "writer.hpp"

// The library provides three levels of abstraction:
//
// 1. Readers: MemoryArchive / ResourceArchive
//    - Bounds-checked byte readers; readU32(), readU64(), readString() etc.
//      work on any ArchiveReader
//    - ResourceArchive serves 0x5xxxxxxx addresses from the virtual region
//      and 0x6xxxxxxx addresses from the physical region
//
// 2. Format pieces: checkMagic(), readArchiveHeader(), ResourceChunkFlags
//    - ResourceChunkFlags turns a page-flags word into the region's size
//
// 3. High-level: Unpacker / Writer
//    - Unpacker runs the whole decode and returns the inflated regions
//    - Writer packs two payloads into a new archive
//
// Example usage:
//
//   // Decoding an archive
//   std::string error;
//   rscx::Unpacker unpacker;
//   auto result = unpacker.unpackFile("model.ydr", &error);
//   if (result) {
//     std::cout << "VFT: " << result->vft << std::endl;
//   }
//
//   // Creating a new archive
//   rscx::Writer writer;
//   writer.setPageFlags(rscx::Region::Virtual, 0x08000000);  // one 512-byte page
//   writer.setPageFlags(rscx::Region::Physical, 0x08000000);
//   writer.setRegionData(rscx::Region::Physical, payload);
//   writer.write("output.rsc", &error);

namespace rscx {}
