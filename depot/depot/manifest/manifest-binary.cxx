#include <depot/manifest/manifest-binary.hxx>

#include <string>
#include <stdexcept>

#include <miniz.h>

#include <depot/manifest/binary-stream.hxx>

using namespace std;

namespace depot
{
  // Body sections.
  //
  // Each section starts with its total size (including the size field
  // itself) so that a reader that does not know about fields added in later
  // versions can skip over them. We do the same: after reading what we
  // understand we seek to the end of the section.
  //

  static void
  read_meta (binary_reader& r, manifest_meta& m)
  {
    size_t start (r.position ());
    uint32_t size (r.read<uint32_t> ("meta size"));

    m.data_version   = r.read<uint8_t> ("meta data version");
    m.feature_level  = r.read<uint32_t> ("feature level");
    m.is_file_data   = r.read<uint8_t> ("file data flag") != 0;
    m.app_id         = r.read<uint32_t> ("app id");
    m.app_name       = r.read_fstring ("app name");
    m.build_version  = r.read_fstring ("build version");
    m.launch_exe     = r.read_fstring ("launch executable");
    m.launch_command = r.read_fstring ("launch command");

    uint32_t n (r.read<uint32_t> ("prerequisite count"));
    m.prereq_ids.clear ();
    for (uint32_t i (0); i != n; ++i)
      m.prereq_ids.push_back (r.read_fstring ("prerequisite id"));

    m.prereq_name = r.read_fstring ("prerequisite name");
    m.prereq_path = r.read_fstring ("prerequisite path");
    m.prereq_args = r.read_fstring ("prerequisite arguments");

    if (m.data_version >= 1)
      m.build_id = r.read_fstring ("build id");

    if (m.data_version >= 2)
    {
      m.uninstall_action_path = r.read_fstring ("uninstall action path");
      m.uninstall_action_args = r.read_fstring ("uninstall action arguments");
    }

    r.seek (start + size, "meta section");
  }

  static void
  write_meta (binary_writer& w, const manifest_meta& m)
  {
    size_t start (w.position ());
    w.write<uint32_t> (0);

    w.write<uint8_t> (m.data_version);
    w.write<uint32_t> (m.feature_level);
    w.write<uint8_t> (m.is_file_data ? 1 : 0);
    w.write<uint32_t> (m.app_id);
    w.write_fstring (m.app_name);
    w.write_fstring (m.build_version);
    w.write_fstring (m.launch_exe);
    w.write_fstring (m.launch_command);

    w.write<uint32_t> (static_cast<uint32_t> (m.prereq_ids.size ()));
    for (const string& s: m.prereq_ids)
      w.write_fstring (s);

    w.write_fstring (m.prereq_name);
    w.write_fstring (m.prereq_path);
    w.write_fstring (m.prereq_args);

    if (m.data_version >= 1)
      w.write_fstring (m.build_id);

    if (m.data_version >= 2)
    {
      w.write_fstring (m.uninstall_action_path);
      w.write_fstring (m.uninstall_action_args);
    }

    w.patch (start, static_cast<uint32_t> (w.position () - start));
  }

  static guid
  read_guid (binary_reader& r, const char* what)
  {
    guid g;
    for (uint32_t& w: g.words)
      w = r.read<uint32_t> (what);
    return g;
  }

  static void
  write_guid (binary_writer& w, const guid& g)
  {
    for (uint32_t x: g.words)
      w.write<uint32_t> (x);
  }

  static void
  read_chunk_list (binary_reader& r, manifest& m)
  {
    size_t start (r.position ());
    uint32_t size (r.read<uint32_t> ("chunk list size"));

    m.chunk_list_version = r.read<uint8_t> ("chunk list version");
    uint32_t n (r.read<uint32_t> ("chunk count"));

    // Each chunk takes at least 61 bytes, so a count that cannot possibly
    // fit is corruption, not a reason to allocate gigabytes.
    //
    if (n > r.remaining () / 61)
      throw runtime_error ("chunk count " + std::to_string (n) +
                           " exceeds section size");

    m.chunks.assign (n, chunk_info ());

    for (chunk_info& c: m.chunks) c.id = read_guid (r, "chunk guid");
    for (chunk_info& c: m.chunks) c.hash = r.read<uint64_t> ("chunk hash");
    for (chunk_info& c: m.chunks) c.sha = r.read_bytes<20> ("chunk SHA-1");
    for (chunk_info& c: m.chunks) c.group = r.read<uint8_t> ("chunk group");
    for (chunk_info& c: m.chunks)
      c.window_size = r.read<uint32_t> ("chunk window size");
    for (chunk_info& c: m.chunks)
      c.file_size = r.read<int64_t> ("chunk file size");

    r.seek (start + size, "chunk list section");
  }

  static void
  write_chunk_list (binary_writer& w, const manifest& m)
  {
    size_t start (w.position ());
    w.write<uint32_t> (0);

    w.write<uint8_t> (m.chunk_list_version);
    w.write<uint32_t> (static_cast<uint32_t> (m.chunks.size ()));

    for (const chunk_info& c: m.chunks) write_guid (w, c.id);
    for (const chunk_info& c: m.chunks) w.write<uint64_t> (c.hash);
    for (const chunk_info& c: m.chunks) w.write_bytes (c.sha);
    for (const chunk_info& c: m.chunks) w.write<uint8_t> (c.group);
    for (const chunk_info& c: m.chunks) w.write<uint32_t> (c.window_size);
    for (const chunk_info& c: m.chunks) w.write<int64_t> (c.file_size);

    w.patch (start, static_cast<uint32_t> (w.position () - start));
  }

  // Size of a serialized chunk part: size field, GUID, offset and size.
  //
  static const uint32_t chunk_part_size (28);

  static void
  read_file_list (binary_reader& r, manifest& m)
  {
    size_t start (r.position ());
    uint32_t size (r.read<uint32_t> ("file list size"));

    m.file_list_version = r.read<uint8_t> ("file list version");
    uint32_t n (r.read<uint32_t> ("file count"));

    if (n > r.remaining () / 34)
      throw runtime_error ("file count " + std::to_string (n) +
                           " exceeds section size");

    m.files.assign (n, file_manifest ());

    for (file_manifest& f: m.files)
      f.filename = r.read_fstring ("file name");
    for (file_manifest& f: m.files)
      f.symlink_target = r.read_fstring ("symlink target");
    for (file_manifest& f: m.files)
      f.hash = r.read_bytes<20> ("file hash");
    for (file_manifest& f: m.files)
      f.flags = r.read<uint8_t> ("file flags");

    for (file_manifest& f: m.files)
    {
      uint32_t k (r.read<uint32_t> ("install tag count"));
      for (uint32_t i (0); i != k; ++i)
        f.install_tags.push_back (r.read_fstring ("install tag"));
    }

    for (file_manifest& f: m.files)
    {
      uint32_t k (r.read<uint32_t> ("chunk part count"));

      if (k > r.remaining () / chunk_part_size)
        throw runtime_error ("chunk part count of " + f.filename +
                             " exceeds section size");

      f.parts.reserve (k);

      for (uint32_t i (0); i != k; ++i)
      {
        size_t ps (r.position ());
        uint32_t s (r.read<uint32_t> ("chunk part size"));

        chunk_part p;
        p.id = read_guid (r, "chunk part guid");
        p.offset = r.read<uint32_t> ("chunk part offset");
        p.size = r.read<uint32_t> ("chunk part size");
        f.parts.push_back (p);

        r.seek (ps + s, "chunk part");
      }
    }

    if (m.file_list_version >= 1)
    {
      for (file_manifest& f: m.files)
      {
        if (r.read<uint32_t> ("MD5 flag") != 0)
          f.md5 = r.read_bytes<16> ("file MD5");
      }

      for (file_manifest& f: m.files)
        f.mime_type = r.read_fstring ("mime type");
    }

    if (m.file_list_version >= 2)
    {
      for (file_manifest& f: m.files)
        f.sha256 = r.read_bytes<32> ("file SHA-256");
    }

    r.seek (start + size, "file list section");
  }

  static void
  write_file_list (binary_writer& w, const manifest& m)
  {
    size_t start (w.position ());
    w.write<uint32_t> (0);

    w.write<uint8_t> (m.file_list_version);
    w.write<uint32_t> (static_cast<uint32_t> (m.files.size ()));

    for (const file_manifest& f: m.files) w.write_fstring (f.filename);
    for (const file_manifest& f: m.files) w.write_fstring (f.symlink_target);
    for (const file_manifest& f: m.files) w.write_bytes (f.hash);
    for (const file_manifest& f: m.files) w.write<uint8_t> (f.flags);

    for (const file_manifest& f: m.files)
    {
      w.write<uint32_t> (static_cast<uint32_t> (f.install_tags.size ()));
      for (const string& t: f.install_tags)
        w.write_fstring (t);
    }

    for (const file_manifest& f: m.files)
    {
      w.write<uint32_t> (static_cast<uint32_t> (f.parts.size ()));
      for (const chunk_part& p: f.parts)
      {
        w.write<uint32_t> (chunk_part_size);
        write_guid (w, p.id);
        w.write<uint32_t> (p.offset);
        w.write<uint32_t> (p.size);
      }
    }

    if (m.file_list_version >= 1)
    {
      for (const file_manifest& f: m.files)
      {
        w.write<uint32_t> (f.md5 ? 1 : 0);
        if (f.md5)
          w.write_bytes (*f.md5);
      }

      for (const file_manifest& f: m.files)
        w.write_fstring (f.mime_type);
    }

    if (m.file_list_version >= 2)
    {
      for (const file_manifest& f: m.files)
        w.write_bytes (f.sha256);
    }

    w.patch (start, static_cast<uint32_t> (w.position () - start));
  }

  static void
  read_custom_fields (binary_reader& r, manifest& m)
  {
    // Old manifests end right after the file list.
    //
    if (r.eof ())
      return;

    size_t start (r.position ());
    uint32_t size (r.read<uint32_t> ("custom fields size"));

    m.custom_fields_version = r.read<uint8_t> ("custom fields version");
    uint32_t n (r.read<uint32_t> ("custom field count"));

    if (n > r.remaining () / 8)
      throw runtime_error ("custom field count exceeds section size");

    m.custom_fields.assign (n, {});

    for (auto& f: m.custom_fields)
      f.first = r.read_fstring ("custom field key");
    for (auto& f: m.custom_fields)
      f.second = r.read_fstring ("custom field value");

    r.seek (start + size, "custom fields section");
  }

  static void
  write_custom_fields (binary_writer& w, const manifest& m)
  {
    size_t start (w.position ());
    w.write<uint32_t> (0);

    w.write<uint8_t> (m.custom_fields_version);
    w.write<uint32_t> (static_cast<uint32_t> (m.custom_fields.size ()));

    for (const auto& f: m.custom_fields) w.write_fstring (f.first);
    for (const auto& f: m.custom_fields) w.write_fstring (f.second);

    w.patch (start, static_cast<uint32_t> (w.position () - start));
  }

  bool
  is_binary_manifest (const manifest_bytes& b) noexcept
  {
    if (b.size () < 4)
      return false;

    uint32_t m (static_cast<uint32_t> (b[0])       |
                static_cast<uint32_t> (b[1]) << 8  |
                static_cast<uint32_t> (b[2]) << 16 |
                static_cast<uint32_t> (b[3]) << 24);

    return m == binary_manifest_magic;
  }

  manifest
  read_binary_manifest (const manifest_bytes& b)
  {
    binary_reader r (b);

    uint32_t magic (r.read<uint32_t> ("header magic"));
    if (magic != binary_manifest_magic)
      throw runtime_error ("not a binary manifest (bad header magic)");

    uint32_t header_size (r.read<uint32_t> ("header size"));
    uint32_t usize (r.read<uint32_t> ("uncompressed size"));
    uint32_t csize (r.read<uint32_t> ("compressed size"));
    sha1_digest sha (r.read_bytes<20> ("header SHA-1"));
    uint8_t stored_as (r.read<uint8_t> ("storage flags"));
    uint32_t version (r.read<uint32_t> ("header version"));

    if (header_size < binary_manifest_header_size)
      throw runtime_error ("invalid header size " +
                           std::to_string (header_size));

    r.seek (header_size, "header");

    manifest m;
    m.version = version;
    m.compressed = (stored_as & 0x1) != 0;

    manifest_bytes body;

    if (m.compressed)
    {
      const uint8_t* p (r.take (csize, "compressed body"));

      body.resize (usize);
      mz_ulong n (usize);

      int e (mz_uncompress (body.data (), &n, p, csize));
      if (e != MZ_OK)
        throw runtime_error (string ("unable to decompress body: ") +
                             mz_error (e));

      if (n != usize)
        throw runtime_error ("decompressed body is " + std::to_string (n) +
                             " bytes, header says " + std::to_string (usize));
    }
    else
    {
      const uint8_t* p (r.take (usize, "body"));
      body.assign (p, p + usize);
    }

    if (compute_sha1 (body.data (), body.size ()) != sha)
      throw runtime_error ("body SHA-1 mismatch");

    binary_reader br (body);

    read_meta (br, m.meta);
    read_chunk_list (br, m);
    read_file_list (br, m);
    read_custom_fields (br, m);

    return m;
  }

  manifest_bytes
  write_binary_manifest (const manifest& m)
  {
    binary_writer bw;

    write_meta (bw, m.meta);
    write_chunk_list (bw, m);
    write_file_list (bw, m);
    write_custom_fields (bw, m);

    const manifest_bytes& body (bw.data ());
    sha1_digest sha (compute_sha1 (body.data (), body.size ()));

    manifest_bytes data;

    if (m.compressed)
    {
      mz_ulong n (mz_compressBound (static_cast<mz_ulong> (body.size ())));
      data.resize (n);

      int e (mz_compress2 (data.data (),
                           &n,
                           body.data (),
                           static_cast<mz_ulong> (body.size ()),
                           MZ_DEFAULT_LEVEL));
      if (e != MZ_OK)
        throw runtime_error (string ("unable to compress body: ") +
                             mz_error (e));

      data.resize (n);
    }
    else
      data = body;

    binary_writer w;
    w.write<uint32_t> (binary_manifest_magic);
    w.write<uint32_t> (binary_manifest_header_size);
    w.write<uint32_t> (static_cast<uint32_t> (body.size ()));
    w.write<uint32_t> (static_cast<uint32_t> (data.size ()));
    w.write_bytes (sha);
    w.write<uint8_t> (m.compressed ? 0x1 : 0x0);
    w.write<uint32_t> (m.version);
    w.write_bytes (data.data (), data.size ());

    return std::move (w.data ());
  }
}
