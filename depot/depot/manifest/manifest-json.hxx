#pragma once

#include <string>
#include <vector>
#include <cstdint>

#include <depot/manifest/manifest-types.hxx>

namespace depot
{
  // JSON manifest layout.
  //
  // The older, textual form of the same data. Numbers are stored as "blobs":
  // strings of three decimal digits per byte, least significant byte first,
  // so that 64-bit values survive JSON parsers that only know doubles.
  // Chunk attributes are spread over several objects keyed by the chunk
  // GUID (ChunkHashList, ChunkShaList, DataGroupList, ChunkFilesizeList).
  //
  constexpr std::uint32_t json_manifest_window_size = 1024 * 1024;

  // Decode a blob into an unsigned integer. Throws std::invalid_argument if
  // the string is not a multiple of three digits or does not fit.
  //
  std::uint64_t
  blob_to_number (const std::string&);

  // Decode a blob into raw bytes.
  //
  std::vector<std::uint8_t>
  blob_to_bytes (const std::string&);

  // Inverse of blob_to_number() for a value of `bytes` bytes.
  //
  std::string
  number_to_blob (std::uint64_t, std::size_t bytes);

  // Decode a JSON manifest.
  //
  // Throws std::runtime_error describing the problem (malformed JSON,
  // missing or mistyped key, bad blob, part referencing an unknown chunk).
  //
  manifest
  read_json_manifest (const manifest_bytes&);
}
