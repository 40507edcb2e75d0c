#include <depot/manifest/manifest-json.hxx>

#include <string>
#include <vector>
#include <cassert>
#include <stdexcept>

using namespace std;
using namespace depot;

static manifest_bytes
bytes (const string& s)
{
  return manifest_bytes (s.begin (), s.end ());
}

static const string chunk_a ("0123456789ABCDEF0123456789ABCDEF");
static const string chunk_b ("FEDCBA9876543210FEDCBA9876543210");

// 20 bytes 0x00, 0x01, ..., 0x13 as a blob.
//
static string
file_hash_blob ()
{
  string r;
  for (uint64_t i (0); i != 20; ++i)
    r += number_to_blob (i, 1);
  return r;
}

static string
sample_json (const string& parts_b = "")
{
  string pb (parts_b.empty ()
             ? "{\"Guid\": \"" + chunk_b + "\", \"Offset\": \"000000000000\", "
               "\"Size\": \"200000000000\"}"
             : parts_b);

  return
    "{"
    "  \"ManifestFileVersion\": \"013000000000\","
    "  \"bIsFileData\": false,"
    "  \"AppID\": \"000000000000\","
    "  \"AppNameString\": \"Sample\","
    "  \"BuildVersionString\": \"1.2.3\","
    "  \"LaunchExeString\": \"Binaries/Sample.exe\","
    "  \"LaunchCommand\": \"\","
    "  \"PrereqIds\": [],"
    "  \"PrereqName\": \"\","
    "  \"PrereqPath\": \"\","
    "  \"PrereqArgs\": \"\","
    "  \"FileManifestList\": ["
    "    {"
    "      \"Filename\": \"Binaries/Sample.exe\","
    "      \"FileHash\": \"" + file_hash_blob () + "\","
    "      \"bIsUnixExecutable\": true,"
    "      \"InstallTags\": [\"core\"],"
    "      \"FileChunkParts\": ["
    "        {\"Guid\": \"" + chunk_a + "\", \"Offset\": \"000000000000\", "
    "         \"Size\": \"000000001000\"},"
    "        " + pb +
    "      ]"
    "    },"
    "    {"
    "      \"Filename\": \"Content/empty.txt\","
    "      \"FileHash\": \"" + file_hash_blob () + "\","
    "      \"FileChunkParts\": []"
    "    }"
    "  ],"
    "  \"ChunkHashList\": {"
    "    \"" + chunk_a + "\": \"239205171152255067109062\","
    "    \"" + chunk_b + "\": \"001000000000000000000000\""
    "  },"
    "  \"ChunkShaList\": {"
    "    \"" + chunk_a + "\": \"00112233445566778899aabbccddeeff00112233\""
    "  },"
    "  \"DataGroupList\": {"
    "    \"" + chunk_a + "\": \"007\","
    "    \"" + chunk_b + "\": \"042\""
    "  },"
    "  \"ChunkFilesizeList\": {"
    "    \"" + chunk_a + "\": \"160134000000000000\","
    "    \"" + chunk_b + "\": \"016000000000000000\""
    "  },"
    "  \"CustomFields\": {\"Channel\": \"live\"}"
    "}";
}

static void
test_blob ()
{
  assert (blob_to_number ("") == 0);
  assert (blob_to_number ("001") == 1);
  assert (blob_to_number ("001000") == 1);
  assert (blob_to_number ("000001") == 256);
  assert (blob_to_number ("255255") == 0xFFFF);
  assert (blob_to_number ("013000000000") == 13);

  assert (number_to_blob (0x0102, 2) == "002001");
  assert (number_to_blob (13, 4) == "013000000000");
  assert (blob_to_number (number_to_blob (0xDEADBEEFCAFEULL, 8)) ==
          0xDEADBEEFCAFEULL);

  vector<uint8_t> b (blob_to_bytes ("000127255"));
  assert ((b == vector<uint8_t> {0x00, 0x7F, 0xFF}));

  auto invalid = [] (const string& s)
  {
    try
    {
      blob_to_number (s);
    }
    catch (const invalid_argument&)
    {
      return true;
    }
    return false;
  };

  assert (invalid ("12"));
  assert (invalid ("256"));
  assert (invalid ("0a0"));
  assert (invalid (string (27, '0')));
}

static void
test_decode ()
{
  manifest m (read_json_manifest (bytes (sample_json ())));

  assert (!m.compressed);
  assert (m.version == 13);
  assert (m.meta.feature_level == 13);
  assert (m.meta.app_name == "Sample");
  assert (m.meta.build_version == "1.2.3");
  assert (m.meta.launch_exe == "Binaries/Sample.exe");

  assert (m.chunks.size () == 2);

  const chunk_info* a (m.find_chunk (guid::parse (chunk_a)));
  assert (a != nullptr);
  assert (a->hash == 0x3E6D43FF98ABCDEFULL);
  assert (a->group == 7);
  assert (a->file_size == 0x86A0);
  assert (a->window_size == json_manifest_window_size);
  assert (to_hex (a->sha) == "00112233445566778899aabbccddeeff00112233");

  // No SHA-1 listed for this one.
  //
  const chunk_info* b (m.find_chunk (guid::parse (chunk_b)));
  assert (b != nullptr);
  assert (b->hash == 1);
  assert (b->group == 42);
  assert (b->sha == sha1_digest {});

  assert (m.chunk_path (*a) ==
          "ChunksV3/07/3E6D43FF98ABCDEF_" + chunk_a + ".chunk");

  assert (m.files.size () == 2);

  const file_manifest& f (m.files[0]);
  assert (f.filename == "Binaries/Sample.exe");
  assert (f.executable ());
  assert (f.hash[0] == 0x00 && f.hash[19] == 0x13);
  assert (f.install_tags.size () == 1);
  assert (f.parts.size () == 2);
  assert (f.parts[0].size == 0x10000);
  assert (f.parts[1].size == 200);
  assert (f.size () == 0x10000 + 200);

  assert (m.files[1].parts.empty ());
  assert (m.files[1].size () == 0);

  assert (m.custom_fields.size () == 1);
  assert (m.custom_fields[0].first == "Channel");
}

static string
decode_error (const string& s)
{
  try
  {
    read_json_manifest (bytes (s));
  }
  catch (const runtime_error& e)
  {
    return e.what ();
  }

  assert (false);
  return string ();
}

static void
test_invalid ()
{
  assert (decode_error ("").find ("invalid JSON") == 0);
  assert (decode_error ("{\"ManifestFileVersion\": ").find (
            "invalid JSON") == 0);
  assert (decode_error ("[1, 2, 3]") == "manifest JSON must be an object");

  // Required keys.
  //
  assert (decode_error ("{}") == "missing ManifestFileVersion");
  assert (decode_error ("{\"ManifestFileVersion\": \"013000000000\"}") ==
          "missing ChunkHashList");

  // Part referencing a chunk that isn't listed.
  //
  string u ("{\"Guid\": \"00000000000000000000000000000001\", "
            "\"Offset\": \"000\", \"Size\": \"001\"}");

  string e (decode_error (sample_json (u)));
  assert (e.find ("unknown chunk") != string::npos);
  assert (e.find ("Binaries/Sample.exe") != string::npos);

  // Malformed blob.
  //
  string bad (sample_json ());
  bad.replace (bad.find ("\"007\""), 5, "\"7\"");
  assert (decode_error (bad).find ("invalid blob") != string::npos);
}

int
main ()
{
  test_blob ();
  test_decode ();
  test_invalid ();
}
