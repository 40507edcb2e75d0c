#pragma once

#include <vector>
#include <cstdint>
#include <filesystem>

#include <depot/manifest/manifest-types.hxx>

namespace depot
{
  namespace fs = std::filesystem;

  // Chunk file layout.
  //
  // Little-endian header followed by the (optionally zlib-compressed) chunk
  // data:
  //
  // version 1: magic, version, header size, compressed size, GUID, rolling
  //            hash, storage flags (41 bytes)
  // version 2: + SHA-1 of the uncompressed data, hash type (62 bytes)
  // version 3: + uncompressed size (66 bytes)
  //
  constexpr std::uint32_t chunk_magic = 0xB1FE3AA2;

  constexpr std::uint8_t chunk_stored_compressed = 0x01;

  constexpr std::uint8_t chunk_hash_rolling = 0x01;
  constexpr std::uint8_t chunk_hash_sha1    = 0x02;

  struct chunk_header
  {
    std::uint32_t version = 3;
    std::uint32_t header_size = 66;
    std::uint32_t compressed_size = 0;
    guid id;
    std::uint64_t hash = 0;
    std::uint8_t stored_as = 0;
    sha1_digest sha {};
    std::uint8_t hash_type = 0;
    std::uint32_t uncompressed_size = 0;
  };

  // Decoded chunk.
  //
  struct chunk_data
  {
    chunk_header header;
    std::vector<std::uint8_t> data; // Uncompressed.
  };

  // Decode a chunk, decompressing and verifying its SHA-1 if it carries one.
  // Throws std::runtime_error.
  //
  chunk_data
  read_chunk (const std::vector<std::uint8_t>&);

  chunk_data
  read_chunk_file (const fs::path&);

  // Encode a version 3 chunk with both hashes.
  //
  std::vector<std::uint8_t>
  write_chunk (const guid&,
               std::uint64_t hash,
               const std::vector<std::uint8_t>& data,
               bool compress);
}
