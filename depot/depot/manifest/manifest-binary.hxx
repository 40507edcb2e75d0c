#pragma once

#include <cstdint>

#include <depot/manifest/manifest-types.hxx>

namespace depot
{
  // Binary manifest layout.
  //
  // A fixed little-endian header followed by a (usually zlib-compressed)
  // body made of four length-prefixed sections: meta, chunk data list, file
  // manifest list and custom fields. List sections are stored column by
  // column, that is, all the GUIDs first, then all the hashes, and so on.
  //
  constexpr std::uint32_t binary_manifest_magic = 0x44BEC00C;
  constexpr std::uint32_t binary_manifest_header_size = 41;

  // Check the magic only.
  //
  bool
  is_binary_manifest (const manifest_bytes&) noexcept;

  // Decode a binary manifest.
  //
  // Throws std::runtime_error describing the first problem found: bad
  // magic, truncated section, decompression failure or SHA-1 mismatch.
  //
  manifest
  read_binary_manifest (const manifest_bytes&);

  // Encode a manifest in the binary layout, honoring the header version,
  // section versions and compression flag recorded in it.
  //
  // Decoding the result yields an equal manifest and re-encoding a decoded
  // manifest that was produced by this function reproduces it byte for byte.
  //
  manifest_bytes
  write_binary_manifest (const manifest&);
}
