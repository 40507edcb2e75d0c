#pragma once

#include <array>
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <utility>
#include <ostream>
#include <optional>
#include <filesystem>

namespace depot
{
  namespace fs = std::filesystem;

  // Raw manifest bytes as they came off the wire or the disk.
  //
  using manifest_bytes = std::vector<std::uint8_t>;

  // Manifest wire encodings, in the order the decoder tries them.
  //
  enum class manifest_encoding
  {
    binary,
    json
  };

  inline std::ostream&
  operator<< (std::ostream& o, manifest_encoding e)
  {
    switch (e)
    {
    case manifest_encoding::binary: return o << "binary";
    case manifest_encoding::json:   return o << "json";
    }
    return o;
  }

  // 128-bit chunk identifier, stored as four 32-bit words in the order they
  // appear on the wire.
  //
  struct guid
  {
    std::array<std::uint32_t, 4> words {0, 0, 0, 0};

    guid () = default;

    guid (std::uint32_t a, std::uint32_t b, std::uint32_t c, std::uint32_t d)
      : words {a, b, c, d} {}

    // 32 upper-case hex digits, word by word.
    //
    std::string
    string () const;

    // Inverse of string(). Throws std::invalid_argument.
    //
    static guid
    parse (const std::string&);

    bool
    empty () const noexcept
    {
      return words[0] == 0 && words[1] == 0 && words[2] == 0 && words[3] == 0;
    }
  };

  inline bool
  operator== (const guid& x, const guid& y) noexcept
  {
    return x.words == y.words;
  }

  inline bool
  operator!= (const guid& x, const guid& y) noexcept
  {
    return !(x == y);
  }

  inline bool
  operator< (const guid& x, const guid& y) noexcept
  {
    return x.words < y.words;
  }

  inline std::ostream&
  operator<< (std::ostream& o, const guid& g)
  {
    return o << g.string ();
  }

  struct guid_hash
  {
    std::size_t
    operator() (const guid& g) const noexcept
    {
      std::size_t h (0);
      for (std::uint32_t w: g.words)
        h = h * 1000003u ^ w;
      return h;
    }
  };

  using sha1_digest   = std::array<std::uint8_t, 20>;
  using md5_digest    = std::array<std::uint8_t, 16>;
  using sha256_digest = std::array<std::uint8_t, 32>;

  // Lower-case hex representation of a digest.
  //
  template <std::size_t N>
  std::string
  to_hex (const std::array<std::uint8_t, N>&);

  // Inverse of to_hex(). Throws std::invalid_argument.
  //
  sha1_digest
  parse_sha1 (const std::string&);

  // Incremental SHA-1 (OpenSSL EVP).
  //
  class sha1_hasher
  {
  public:
    sha1_hasher ();
    ~sha1_hasher ();

    sha1_hasher (const sha1_hasher&) = delete;
    sha1_hasher& operator= (const sha1_hasher&) = delete;

    void
    update (const void*, std::size_t);

    sha1_digest
    finish ();

  private:
    void* ctx_; // EVP_MD_CTX
  };

  sha1_digest
  compute_sha1 (const void*, std::size_t);

  // Hash a file in fixed-size blocks. Throws std::runtime_error if it cannot
  // be read.
  //
  sha1_digest
  compute_file_sha1 (const fs::path&);

  // Build metadata.
  //
  struct manifest_meta
  {
    std::uint8_t data_version = 0;
    std::uint32_t feature_level = 18;
    bool is_file_data = false;
    std::uint32_t app_id = 0;
    std::string app_name;
    std::string build_version;
    std::string launch_exe;
    std::string launch_command;
    std::vector<std::string> prereq_ids;
    std::string prereq_name;
    std::string prereq_path;
    std::string prereq_args;

    // Data version 1 and up.
    //
    std::string build_id;

    // Data version 2 and up.
    //
    std::string uninstall_action_path;
    std::string uninstall_action_args;
  };

  // Chunk as described by the chunk data list.
  //
  struct chunk_info
  {
    guid id;
    std::uint64_t hash = 0;        // Rolling hash, part of the file name.
    sha1_digest sha {};
    std::uint8_t group = 0;        // Data group, a directory level.
    std::uint32_t window_size = 0; // Uncompressed size.
    std::int64_t file_size = 0;    // Size of the .chunk file on the CDN.
  };

  // A contiguous slice of a chunk that lands in a file.
  //
  struct chunk_part
  {
    guid id;
    std::uint32_t offset = 0;
    std::uint32_t size = 0;
  };

  // File flags.
  //
  constexpr std::uint8_t file_read_only       = 0x01;
  constexpr std::uint8_t file_compressed      = 0x02;
  constexpr std::uint8_t file_unix_executable = 0x04;

  struct file_manifest
  {
    std::string filename;
    std::string symlink_target;
    sha1_digest hash {};
    std::uint8_t flags = 0;
    std::vector<std::string> install_tags;
    std::vector<chunk_part> parts;

    // File manifest list version 1 and up.
    //
    std::optional<md5_digest> md5;
    std::string mime_type;

    // File manifest list version 2 and up.
    //
    sha256_digest sha256 {};

    // Sum of the chunk part sizes.
    //
    std::uint64_t
    size () const noexcept;

    bool
    executable () const noexcept
    {
      return (flags & file_unix_executable) != 0;
    }
  };

  // Decoded manifest.
  //
  // Besides the payload we keep the per-section versions and the header
  // version so that the binary encoder can reproduce what it was given.
  //
  struct manifest
  {
    std::uint32_t version = 18;        // Header version.
    bool compressed = true;            // Body stored zlib-compressed.

    manifest_meta meta;

    std::uint8_t chunk_list_version = 0;
    std::vector<chunk_info> chunks;

    std::uint8_t file_list_version = 0;
    std::vector<file_manifest> files;

    std::uint8_t custom_fields_version = 0;
    std::vector<std::pair<std::string, std::string>> custom_fields;

    // Lookups. Linear, manifests have at most a few tens of thousands of
    // entries and these are not called in loops over every part.
    //
    const chunk_info*
    find_chunk (const guid&) const noexcept;

    const file_manifest*
    find_file (const std::string& name) const noexcept;

    // Path of the chunk relative to the base URL, for example
    // ChunksV4/07/1A2B3C4D5E6F7081_0123456789ABCDEF0123456789ABCDEF.chunk.
    //
    std::string
    chunk_path (const chunk_info&) const;

    // Total size of all the files once installed.
    //
    std::uint64_t
    install_size () const noexcept;

    // Total size of all the chunks on the CDN.
    //
    std::uint64_t
    download_size () const noexcept;
  };

  // Chunk directory name for a feature level.
  //
  const char*
  chunk_directory (std::uint32_t feature_level) noexcept;
}
