#pragma once

#include <string>
#include <optional>

#include <depot/manifest/manifest-types.hxx>

namespace depot
{
  // Outcome of a decode attempt.
  //
  // Exactly one of the following holds:
  //
  // - decoded with the primary encoding: manifest set, no errors;
  // - decoded with the fallback: manifest set, primary_error set;
  // - both failed: no manifest, both errors set.
  //
  struct decode_result
  {
    std::optional<manifest> value;
    manifest_encoding encoding = manifest_encoding::binary;
    std::optional<std::string> primary_error;
    std::optional<std::string> fallback_error;

    explicit operator bool () const noexcept
    {
      return value.has_value ();
    }

    bool
    fallback_used () const noexcept
    {
      return value && encoding == manifest_encoding::json;
    }
  };

  // Manifest decoder.
  //
  // Try the binary layout first and, if it rejects the bytes for whatever
  // reason, the JSON layout. Never throws for bad input.
  //
  class manifest_decoder
  {
  public:
    decode_result
    try_decode (const manifest_bytes&) const;

    // As above but throw manifest_invalid (carrying the fallback decoder's
    // message) if neither layout accepts the bytes.
    //
    manifest
    decode (const manifest_bytes&) const;
  };
}
