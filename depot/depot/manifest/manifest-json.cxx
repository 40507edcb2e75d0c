#include <depot/manifest/manifest-json.hxx>

#include <string>
#include <algorithm>
#include <unordered_set>
#include <stdexcept>

#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>
#include <boost/json/value_to.hpp>

using namespace std;

namespace depot
{
  namespace json = boost::json;

  uint64_t
  blob_to_number (const string& s)
  {
    if (s.size () % 3 != 0)
      throw invalid_argument ("invalid blob '" + s + "'");

    if (s.size () > 3 * 8)
      throw invalid_argument ("blob '" + s + "' does not fit 64 bits");

    uint64_t r (0);
    for (size_t i (0), shift (0); i != s.size (); i += 3, shift += 8)
    {
      unsigned v (0);
      for (size_t j (0); j != 3; ++j)
      {
        char c (s[i + j]);
        if (c < '0' || c > '9')
          throw invalid_argument ("invalid blob '" + s + "'");

        v = v * 10 + static_cast<unsigned> (c - '0');
      }

      if (v > 255)
        throw invalid_argument ("invalid blob '" + s + "'");

      r |= static_cast<uint64_t> (v) << shift;
    }

    return r;
  }

  vector<uint8_t>
  blob_to_bytes (const string& s)
  {
    if (s.size () % 3 != 0)
      throw invalid_argument ("invalid blob of " + std::to_string (s.size ()) +
                              " digits");

    vector<uint8_t> r;
    r.reserve (s.size () / 3);

    for (size_t i (0); i != s.size (); i += 3)
      r.push_back (static_cast<uint8_t> (blob_to_number (s.substr (i, 3))));

    return r;
  }

  string
  number_to_blob (uint64_t v, size_t bytes)
  {
    string r;
    r.reserve (bytes * 3);

    for (size_t i (0); i != bytes; ++i, v >>= 8)
    {
      unsigned b (static_cast<unsigned> (v & 0xFF));
      r += static_cast<char> ('0' + b / 100);
      r += static_cast<char> ('0' + b / 10 % 10);
      r += static_cast<char> ('0' + b % 10);
    }

    return r;
  }

  // Accessors that name the offending key in their diagnostics.
  //
  static const json::value&
  member (const json::object& o, const char* k)
  {
    auto i (o.find (k));
    if (i == o.end ())
      throw runtime_error (string ("missing ") + k);

    return i->value ();
  }

  static string
  string_member (const json::object& o, const char* k, bool required = true)
  {
    auto i (o.find (k));
    if (i == o.end ())
    {
      if (required)
        throw runtime_error (string ("missing ") + k);

      return string ();
    }

    if (!i->value ().is_string ())
      throw runtime_error (string (k) + " is not a string");

    return json::value_to<string> (i->value ());
  }

  static uint64_t
  blob_member (const json::object& o, const char* k, bool required = true)
  {
    string s (string_member (o, k, required));
    if (s.empty ())
      return 0;

    try
    {
      return blob_to_number (s);
    }
    catch (const invalid_argument& e)
    {
      throw runtime_error (string (k) + ": " + e.what ());
    }
  }

  static const json::object&
  object_member (const json::object& o, const char* k)
  {
    const json::value& v (member (o, k));
    if (!v.is_object ())
      throw runtime_error (string (k) + " is not an object");

    return v.as_object ();
  }

  static bool
  flag_member (const json::object& o, const char* k)
  {
    auto i (o.find (k));
    return i != o.end () && i->value ().is_bool () && i->value ().as_bool ();
  }

  static void
  parse_meta (const json::object& o, manifest& m)
  {
    manifest_meta& mm (m.meta);

    mm.feature_level = static_cast<uint32_t> (
      blob_member (o, "ManifestFileVersion"));
    mm.is_file_data = flag_member (o, "bIsFileData");
    mm.app_id = static_cast<uint32_t> (blob_member (o, "AppID", false));
    mm.app_name = string_member (o, "AppNameString", false);
    mm.build_version = string_member (o, "BuildVersionString", false);
    mm.launch_exe = string_member (o, "LaunchExeString", false);
    mm.launch_command = string_member (o, "LaunchCommand", false);

    auto i (o.find ("PrereqIds"));
    if (i != o.end ())
    {
      if (!i->value ().is_array ())
        throw runtime_error ("PrereqIds is not an array");

      for (const json::value& v: i->value ().as_array ())
      {
        if (!v.is_string ())
          throw runtime_error ("PrereqIds entry is not a string");

        mm.prereq_ids.push_back (json::value_to<string> (v));
      }
    }

    mm.prereq_name = string_member (o, "PrereqName", false);
    mm.prereq_path = string_member (o, "PrereqPath", false);
    mm.prereq_args = string_member (o, "PrereqArgs", false);

    // JSON manifests map onto the current binary layout with the same
    // feature level.
    //
    m.version = mm.feature_level;
  }

  static void
  parse_chunks (const json::object& o, manifest& m)
  {
    const json::object& hashes (object_member (o, "ChunkHashList"));
    const json::object& shas (object_member (o, "ChunkShaList"));
    const json::object& groups (object_member (o, "DataGroupList"));
    const json::object& sizes (object_member (o, "ChunkFilesizeList"));

    m.chunks.reserve (hashes.size ());

    for (const auto& kv: hashes)
    {
      string k (kv.key ());

      chunk_info c;

      try
      {
        c.id = guid::parse (k);
      }
      catch (const invalid_argument& e)
      {
        throw runtime_error (string ("ChunkHashList: ") + e.what ());
      }

      if (!kv.value ().is_string ())
        throw runtime_error ("ChunkHashList entry " + k + " is not a string");

      try
      {
        c.hash = blob_to_number (json::value_to<string> (kv.value ()));
      }
      catch (const invalid_argument& e)
      {
        throw runtime_error ("ChunkHashList entry " + k + ": " + e.what ());
      }

      // The SHA-1 list is missing in some very old manifests.
      //
      if (auto i = shas.find (k); i != shas.end ())
      {
        if (!i->value ().is_string ())
          throw runtime_error ("ChunkShaList entry " + k + " is not a string");

        try
        {
          c.sha = parse_sha1 (json::value_to<string> (i->value ()));
        }
        catch (const invalid_argument& e)
        {
          throw runtime_error ("ChunkShaList entry " + k + ": " + e.what ());
        }
      }

      c.group = static_cast<uint8_t> (blob_member (groups, k.c_str ()));
      c.file_size = static_cast<int64_t> (blob_member (sizes, k.c_str ()));
      c.window_size = json_manifest_window_size;

      m.chunks.push_back (c);
    }
  }

  static void
  parse_files (const json::object& o, manifest& m)
  {
    const json::value& fl (member (o, "FileManifestList"));
    if (!fl.is_array ())
      throw runtime_error ("FileManifestList is not an array");

    unordered_set<guid, guid_hash> known;
    for (const chunk_info& c: m.chunks)
      known.insert (c.id);

    for (const json::value& v: fl.as_array ())
    {
      if (!v.is_object ())
        throw runtime_error ("FileManifestList entry is not an object");

      const json::object& fo (v.as_object ());

      file_manifest f;
      f.filename = string_member (fo, "Filename");
      f.symlink_target = string_member (fo, "SymlinkTarget", false);

      vector<uint8_t> h (blob_to_bytes (string_member (fo, "FileHash")));
      if (h.size () != f.hash.size ())
        throw runtime_error ("FileHash of " + f.filename +
                             " is not a SHA-1 digest");

      copy (h.begin (), h.end (), f.hash.begin ());

      if (flag_member (fo, "bIsReadOnly"))
        f.flags |= file_read_only;

      if (flag_member (fo, "bIsCompressed"))
        f.flags |= file_compressed;

      if (flag_member (fo, "bIsUnixExecutable"))
        f.flags |= file_unix_executable;

      if (auto i = fo.find ("InstallTags"); i != fo.end ())
      {
        if (!i->value ().is_array ())
          throw runtime_error ("InstallTags of " + f.filename +
                               " is not an array");

        for (const json::value& t: i->value ().as_array ())
          f.install_tags.push_back (json::value_to<string> (t));
      }

      const json::value& parts (member (fo, "FileChunkParts"));
      if (!parts.is_array ())
        throw runtime_error ("FileChunkParts of " + f.filename +
                             " is not an array");

      for (const json::value& pv: parts.as_array ())
      {
        if (!pv.is_object ())
          throw runtime_error ("chunk part of " + f.filename +
                               " is not an object");

        const json::object& po (pv.as_object ());

        chunk_part p;

        try
        {
          p.id = guid::parse (string_member (po, "Guid"));
        }
        catch (const invalid_argument& e)
        {
          throw runtime_error ("chunk part of " + f.filename + ": " +
                               e.what ());
        }

        if (known.find (p.id) == known.end ())
          throw runtime_error ("chunk part of " + f.filename +
                               " references unknown chunk " + p.id.string ());

        p.offset = static_cast<uint32_t> (blob_member (po, "Offset"));
        p.size = static_cast<uint32_t> (blob_member (po, "Size"));

        f.parts.push_back (p);
      }

      m.files.push_back (move (f));
    }
  }

  static void
  parse_custom_fields (const json::object& o, manifest& m)
  {
    auto i (o.find ("CustomFields"));
    if (i == o.end ())
      return;

    if (!i->value ().is_object ())
      throw runtime_error ("CustomFields is not an object");

    for (const auto& kv: i->value ().as_object ())
    {
      if (!kv.value ().is_string ())
        throw runtime_error ("custom field " + string (kv.key ()) +
                             " is not a string");

      m.custom_fields.emplace_back (string (kv.key ()),
                                    json::value_to<string> (kv.value ()));
    }
  }

  manifest
  read_json_manifest (const manifest_bytes& b)
  {
    json::value jv;

    {
      boost::system::error_code ec;
      jv = json::parse (
        json::string_view (reinterpret_cast<const char*> (b.data ()),
                           b.size ()),
        ec);

      if (ec)
        throw runtime_error ("invalid JSON: " + ec.message ());
    }

    if (!jv.is_object ())
      throw runtime_error ("manifest JSON must be an object");

    const json::object& o (jv.as_object ());

    manifest m;
    m.compressed = false;

    parse_meta (o, m);
    parse_chunks (o, m);
    parse_files (o, m);
    parse_custom_fields (o, m);

    return m;
  }
}
