#include <depot/manifest/manifest-binary.hxx>

#include <string>
#include <vector>
#include <cassert>
#include <stdexcept>

using namespace std;
using namespace depot;

static sha1_digest
digest (uint8_t seed)
{
  sha1_digest r;
  for (size_t i (0); i != r.size (); ++i)
    r[i] = static_cast<uint8_t> (seed + i * 3);
  return r;
}

// A small but complete manifest: every section populated, a shared chunk, a
// symlink, and a non-ASCII file name (stored as UTF-16).
//
static manifest
sample_manifest ()
{
  manifest m;
  m.version = 21;
  m.compressed = true;

  m.meta.data_version = 2;
  m.meta.feature_level = 21;
  m.meta.app_id = 1234;
  m.meta.app_name = "Sample";
  m.meta.build_version = "1.0.2-CL-42";
  m.meta.launch_exe = "bin/sample";
  m.meta.launch_command = "-windowed";
  m.meta.prereq_ids = {"redist-a", "redist-b"};
  m.meta.prereq_name = "Redistributables";
  m.meta.build_id = "b6b3d2b9f7e14ce8";
  m.meta.uninstall_action_path = "bin/uninstall";

  m.chunk_list_version = 0;

  for (uint32_t i (0); i != 3; ++i)
  {
    chunk_info c;
    c.id = guid (0x10000000 + i, 0x2000, 0x3000, 0x4000 + i);
    c.hash = 0x0123456789ABCDEFULL + i;
    c.sha = digest (static_cast<uint8_t> (i * 40));
    c.group = static_cast<uint8_t> (i * 11);
    c.window_size = 1024 * 1024;
    c.file_size = 100000 + i;
    m.chunks.push_back (c);
  }

  m.file_list_version = 2;

  file_manifest a;
  a.filename = "bin/sample";
  a.hash = digest (1);
  a.flags = file_unix_executable;
  a.install_tags = {"core"};
  a.parts = {chunk_part {m.chunks[0].id, 0, 1024 * 1024},
             chunk_part {m.chunks[1].id, 0, 4096}};
  a.md5 = md5_digest {};
  a.mime_type = "application/octet-stream";
  m.files.push_back (a);

  file_manifest b;
  b.filename = "Données/résumé.txt";
  b.hash = digest (2);
  b.parts = {chunk_part {m.chunks[1].id, 4096, 100},
             chunk_part {m.chunks[2].id, 0, 77}};
  b.sha256[0] = 0xAB;
  m.files.push_back (b);

  file_manifest c;
  c.filename = "lib/libsample.so";
  c.symlink_target = "libsample.so.1";
  c.hash = digest (3);
  m.files.push_back (c);

  m.custom_fields_version = 0;
  m.custom_fields = {{"CloudSaveFolder", "{AppData}/Sample"},
                     {"Channel", "live"}};

  return m;
}

static void
test_magic ()
{
  manifest_bytes b (write_binary_manifest (sample_manifest ()));
  assert (is_binary_manifest (b));

  assert (!is_binary_manifest (manifest_bytes ()));
  assert (!is_binary_manifest (manifest_bytes {0x0C, 0xC0, 0xBE}));

  string j ("{\"ManifestFileVersion\": \"013000000000\"}");
  assert (!is_binary_manifest (manifest_bytes (j.begin (), j.end ())));
}

static void
test_decode ()
{
  const manifest o (sample_manifest ());
  manifest m (read_binary_manifest (write_binary_manifest (o)));

  assert (m.version == 21);
  assert (m.compressed);

  assert (m.meta.data_version == 2);
  assert (m.meta.feature_level == 21);
  assert (m.meta.app_id == 1234);
  assert (m.meta.app_name == "Sample");
  assert (m.meta.build_version == "1.0.2-CL-42");
  assert (m.meta.launch_exe == "bin/sample");
  assert (m.meta.launch_command == "-windowed");
  assert (m.meta.prereq_ids == o.meta.prereq_ids);
  assert (m.meta.build_id == "b6b3d2b9f7e14ce8");
  assert (m.meta.uninstall_action_path == "bin/uninstall");
  assert (m.meta.uninstall_action_args.empty ());

  assert (m.chunks.size () == 3);
  for (size_t i (0); i != 3; ++i)
  {
    const chunk_info& x (m.chunks[i]);
    const chunk_info& y (o.chunks[i]);

    assert (x.id == y.id);
    assert (x.hash == y.hash);
    assert (x.sha == y.sha);
    assert (x.group == y.group);
    assert (x.window_size == y.window_size);
    assert (x.file_size == y.file_size);
  }

  assert (m.files.size () == 3);

  const file_manifest* a (m.find_file ("bin/sample"));
  assert (a != nullptr);
  assert (a->executable ());
  assert (a->install_tags == vector<string> {"core"});
  assert (a->parts.size () == 2);
  assert (a->parts[1].id == o.chunks[1].id);
  assert (a->parts[1].size == 4096);
  assert (a->size () == 1024 * 1024 + 4096);
  assert (a->md5.has_value ());
  assert (a->mime_type == "application/octet-stream");

  const file_manifest* b (m.find_file ("Données/résumé.txt"));
  assert (b != nullptr);
  assert (b->hash == digest (2));
  assert (b->parts[0].offset == 4096);
  assert (!b->md5);
  assert (b->sha256[0] == 0xAB);

  const file_manifest* c (m.find_file ("lib/libsample.so"));
  assert (c != nullptr);
  assert (c->symlink_target == "libsample.so.1");
  assert (c->parts.empty ());

  assert (m.custom_fields == o.custom_fields);
}

// What we decode we can encode back exactly, compressed or not.
//
static void
test_reencode ()
{
  manifest o (sample_manifest ());

  manifest_bytes b (write_binary_manifest (o));
  assert (write_binary_manifest (read_binary_manifest (b)) == b);

  o.compressed = false;
  o.file_list_version = 0;
  o.meta.data_version = 0;

  manifest_bytes u (write_binary_manifest (o));
  manifest m (read_binary_manifest (u));

  assert (!m.compressed);
  assert (m.meta.build_id.empty ());
  assert (!m.files[0].md5);
  assert (write_binary_manifest (m) == u);
}

static void
test_chunk_path ()
{
  manifest m (sample_manifest ());

  assert (m.chunk_path (m.chunks[1]) ==
          "ChunksV4/11/0123456789ABCDF0_"
          "10000001000020000000300000004001.chunk");

  m.meta.feature_level = 5;
  assert (m.chunk_path (m.chunks[0]).compare (0, 9, "ChunksV2/") == 0);
}

template <typename F>
static bool
throws (F f)
{
  try
  {
    f ();
  }
  catch (const runtime_error&)
  {
    return true;
  }

  return false;
}

static void
test_corrupt ()
{
  manifest o (sample_manifest ());

  // Compressed body, damaged in the middle.
  //
  {
    manifest_bytes b (write_binary_manifest (o));
    size_t h (binary_manifest_header_size);
    b[h + (b.size () - h) / 2] ^= 0x5A;
    assert (throws ([&b] {read_binary_manifest (b);}));
  }

  // Stored body, damaged: only the SHA-1 can tell.
  //
  {
    o.compressed = false;
    manifest_bytes b (write_binary_manifest (o));
    b[b.size () - 3] ^= 0x01;

    bool thrown (false);
    try
    {
      read_binary_manifest (b);
    }
    catch (const runtime_error& e)
    {
      thrown = true;
      assert (string (e.what ()).find ("SHA-1") != string::npos);
    }
    assert (thrown);
  }

  // Truncated.
  //
  {
    manifest_bytes b (write_binary_manifest (o));
    b.resize (b.size () / 2);
    assert (throws ([&b] {read_binary_manifest (b);}));

    b.resize (10);
    assert (throws ([&b] {read_binary_manifest (b);}));
  }

  // Not a manifest at all.
  //
  {
    manifest_bytes b (64, 0x20);
    assert (throws ([&b] {read_binary_manifest (b);}));
  }
}

int
main ()
{
  test_magic ();
  test_decode ();
  test_reencode ();
  test_chunk_path ();
  test_corrupt ();
}
