#include <depot/engine/chunk-engine.hxx>

#include <string>
#include <vector>
#include <thread>
#include <chrono>
#include <fstream>
#include <cassert>
#include <iterator>
#include <stdexcept>
#include <exception>

#include <unistd.h>

#include <depot/errors.hxx>

using namespace std;
using namespace depot;

static fs::path
temp_dir (const string& n)
{
  fs::path d (fs::temp_directory_path () /
              ("depot-engine-test-" + std::to_string (::getpid ())) / n);

  fs::remove_all (d);
  fs::create_directories (d);
  return d;
}

static vector<uint8_t>
read_file (const fs::path& p)
{
  ifstream ifs (p, ios::binary);
  assert (ifs);
  return vector<uint8_t> (istreambuf_iterator<char> (ifs),
                          istreambuf_iterator<char> ());
}

static void
write_file (const fs::path& p, const vector<uint8_t>& d)
{
  if (p.has_parent_path ())
    fs::create_directories (p.parent_path ());

  ofstream ofs (p, ios::binary | ios::trunc);
  ofs.write (reinterpret_cast<const char*> (d.data ()),
             static_cast<streamsize> (d.size ()));
  assert (ofs);
}

static void
write_script (const fs::path& p, const string& s)
{
  {
    ofstream ofs (p, ios::trunc);
    ofs << s;
    assert (ofs);
  }

  fs::permissions (p,
                   fs::perms::owner_all |
                   fs::perms::group_read | fs::perms::group_exec |
                   fs::perms::others_read | fs::perms::others_exec);
}

// Ten 4 KiB chunks and four files made from them, two of which share
// chunks.
//
struct sample
{
  manifest m;
  vector<vector<uint8_t>> data; // By chunk index.

  size_t
  index (const guid& g) const
  {
    return g.words[0] - 1;
  }

  vector<uint8_t>
  content (const file_manifest& f) const
  {
    vector<uint8_t> r;
    for (const chunk_part& p: f.parts)
    {
      const vector<uint8_t>& d (data[index (p.id)]);
      auto b (d.begin () + p.offset);
      r.insert (r.end (), b, b + p.size);
    }
    return r;
  }

  vector<uint8_t>
  chunk_file (size_t i) const
  {
    const chunk_info& c (m.chunks[i]);
    return write_chunk (c.id, c.hash, data[i], i % 2 == 0);
  }
};

static ::sample
make_sample ()
{
  ::sample s;
  manifest& m (s.m);

  m.meta.app_name = "Sample";
  m.meta.build_version = "2";

  for (uint32_t i (0); i != 10; ++i)
  {
    vector<uint8_t> d (4096);
    for (size_t j (0); j != d.size (); ++j)
      d[j] = static_cast<uint8_t> ((i * 7 + j * 13 + j / 256) & 0xFF);

    chunk_info c;
    c.id = guid (i + 1, 0xA0, 0xB0, 0xC0);
    c.hash = 0x1000 + i;
    c.sha = compute_sha1 (d.data (), d.size ());
    c.group = static_cast<uint8_t> (i % 4);
    c.window_size = static_cast<uint32_t> (d.size ());

    m.chunks.push_back (c);
    s.data.push_back (move (d));
  }

  for (size_t i (0); i != m.chunks.size (); ++i)
    m.chunks[i].file_size = static_cast<int64_t> (s.chunk_file (i).size ());

  auto id = [&m] (size_t i) {return m.chunks[i].id;};

  file_manifest app;
  app.filename = "bin/app";
  app.flags = file_unix_executable;
  for (size_t i (0); i != 4; ++i)
    app.parts.push_back (chunk_part {id (i), 0, 4096});

  file_manifest pak;
  pak.filename = "data/pak0.dat";
  for (size_t i (4); i != 9; ++i)
    pak.parts.push_back (chunk_part {id (i), 0, 4096});

  file_manifest shared;
  shared.filename = "data/shared.bin";
  shared.parts = {chunk_part {id (0), 0, 10}, chunk_part {id (4), 10, 10}};

  file_manifest readme;
  readme.filename = "readme.txt";
  readme.parts = {chunk_part {id (9), 100, 200}};

  for (file_manifest* f: {&app, &pak, &shared, &readme})
  {
    vector<uint8_t> c (s.content (*f));
    f->hash = compute_sha1 (c.data (), c.size ());
    m.files.push_back (*f);
  }

  return s;
}

// Put chunks where the engine looks for already downloaded ones.
//
static void
populate_cache (const engine_config& c, const ::sample& s)
{
  fs::create_directories (c.cache_dir);

  for (size_t i (0); i != s.m.chunks.size (); ++i)
    write_file (c.cache_dir / (s.m.chunks[i].id.string () + ".chunk"),
                s.chunk_file (i));
}

// Lay chunks out the way the CDN does, under a local directory.
//
static void
populate_cdn (const fs::path& d, const ::sample& s)
{
  for (size_t i (0); i != s.m.chunks.size (); ++i)
    write_file (d / s.m.chunk_path (s.m.chunks[i]), s.chunk_file (i));
}

static void
check_installed (const fs::path& d, const ::sample& s)
{
  for (const file_manifest& f: s.m.files)
  {
    fs::path p (d / f.filename);
    assert (fs::is_regular_file (p));
    assert (read_file (p) == s.content (f));
  }

  fs::perms x (fs::status (d / "bin/app").permissions ());
  assert ((x & fs::perms::owner_exec) != fs::perms::none);

  fs::perms r (fs::status (d / "readme.txt").permissions ());
  assert ((r & fs::perms::owner_exec) == fs::perms::none);
}

template <typename E, typename F>
static string
expect (F f)
{
  try
  {
    f ();
  }
  catch (const E& e)
  {
    return e.what ();
  }

  assert (false);
  return string ();
}

// Everything is already cached: no worker, files assembled and verified,
// cache and resume file cleaned up, last sample says done.
//
static void
test_cached ()
{
  fs::path d (temp_dir ("cached"));
  ::sample s (make_sample ());

  progress_channel ch;
  engine_config c (d, "https://cdn.example.com/Builds", ch);
  null_sink diag;
  chunk_engine e (c, diag);

  populate_cache (c, s);

  e.analyze (s.m);

  const chunk_plan& p (e.plan ());
  assert (p.files.size () == 4);
  assert (p.chunks.size () == 10);
  assert (p.skipped.empty ());
  assert (p.tasks () == 14);
  assert (p.references.at (s.m.chunks[0].id) == 2);
  assert (p.references.at (s.m.chunks[4].id) == 2);
  assert (p.references.at (s.m.chunks[9].id) == 1);

  e.run ();

  check_installed (d, s);

  assert (fs::is_empty (c.cache_dir));
  assert (!fs::exists (c.resume_file));
  assert (!e.worker ().active ());

  optional<progress_sample> ps (ch.drain ());
  assert (ps);
  assert (ps->fraction_complete == 1.0);
  assert (!ch.drain ());
}

// Nothing cached: the worker fetches every chunk.
//
static void
test_worker ()
{
  fs::path d (temp_dir ("worker"));
  fs::path cdn (temp_dir ("worker-cdn"));
  fs::path w (temp_dir ("worker-bin") / "fake-worker");

  ::sample s (make_sample ());
  populate_cdn (cdn, s);

  // Same protocol as depot-worker, "downloading" with cp.
  //
  write_script (w,
                "#!/bin/sh\n"
                "t=$(printf '\\t')\n"
                "while IFS=\"$t\" read -r id url path; do\n"
                "  if cp \"$url\" \"$path\" 2>/dev/null; then\n"
                "    printf 'ok\\t%s\\t%s\\n' \"$id\" $(wc -c < \"$path\")\n"
                "  else\n"
                "    printf 'error\\t%s\\tno such chunk\\n' \"$id\"\n"
                "  fi\n"
                "done\n");

  progress_channel ch;
  engine_config c (d, cdn.string (), ch);
  c.worker_program = w;
  c.update_interval = chrono::milliseconds (0);

  null_sink diag;
  chunk_engine e (c, diag);

  e.analyze (s.m);
  e.run ();

  check_installed (d, s);
  assert (fs::is_empty (c.cache_dir));
  assert (ch.drain ()->fraction_complete == 1.0);

  // One chunk missing from the CDN.
  //
  fs::path d2 (temp_dir ("worker-missing"));
  fs::remove (cdn / s.m.chunk_path (s.m.chunks[5]));

  engine_config c2 (d2, cdn.string (), ch);
  c2.worker_program = w;

  chunk_engine e2 (c2, diag);
  e2.analyze (s.m);

  string m (expect<engine_failure> ([&e2] {e2.run ();}));
  assert (m.find ("unable to download chunk") != string::npos);
  assert (m.find (s.m.chunks[5].id.string ()) != string::npos);
}

// Files recorded in the resume file (and present) are not redone.
//
static void
test_resume ()
{
  fs::path d (temp_dir ("resume"));
  ::sample s (make_sample ());

  const file_manifest& app (s.m.files[0]);
  const file_manifest& readme (s.m.files[3]);

  write_file (d / readme.filename, s.content (readme));
  write_file (d / app.filename, s.content (app));

  sha1_digest wrong (app.hash);
  wrong[0] ^= 0xFF;

  {
    ofstream ofs (d / ".resumedata");
    ofs << to_hex (readme.hash) << ':' << readme.filename << '\n'
        << "not a resume line" << '\n'
        << to_hex (wrong) << ':' << app.filename << '\n'
        << "zz:data/pak0.dat" << '\n';
  }

  progress_channel ch;
  engine_config c (d, "https://cdn.example.com", ch);
  null_sink diag;
  chunk_engine e (c, diag);

  e.analyze (s.m);

  const chunk_plan& p (e.plan ());
  assert (p.skipped == vector<string> {"readme.txt"});
  assert (p.files.size () == 3);
  assert (p.chunks.size () == 9);
  assert (p.references.find (s.m.chunks[9].id) == p.references.end ());

  populate_cache (c, s);
  e.run ();

  check_installed (d, s);
  assert (!fs::exists (c.resume_file));
}

// Files unchanged since the previous manifest are skipped if they are in
// place with the right size.
//
static void
test_previous ()
{
  fs::path d (temp_dir ("previous"));
  ::sample s (make_sample ());

  manifest prev (s.m);

  const file_manifest& app (s.m.files[0]);
  const file_manifest& pak (s.m.files[1]);
  const file_manifest& readme (s.m.files[3]);

  write_file (d / pak.filename, s.content (pak));
  write_file (d / readme.filename, s.content (readme));

  // Truncated.
  //
  vector<uint8_t> a (s.content (app));
  a.resize (100);
  write_file (d / app.filename, a);

  // Changed between the versions.
  //
  prev.files[3].hash[0] ^= 0xFF;

  progress_channel ch;
  engine_config c (d, "https://cdn.example.com", ch);
  null_sink diag;
  chunk_engine e (c, diag);

  e.analyze (s.m, &prev);

  const chunk_plan& p (e.plan ());
  assert (p.skipped == vector<string> {"data/pak0.dat"});
  assert (p.files.size () == 3);

  // app, shared.bin (0 and 4) and readme.
  //
  assert (p.chunks.size () == 6);
  assert (p.chunks[4].id == s.m.chunks[4].id);
  assert (p.chunks[5].id == s.m.chunks[9].id);

  populate_cache (c, s);
  e.run ();

  check_installed (d, s);
}

static void
test_optimize ()
{
  fs::path d (temp_dir ("optimize"));
  ::sample s (make_sample ());

  manifest m (s.m);
  m.files = {s.m.files[2], s.m.files[3], s.m.files[1], s.m.files[0]};

  progress_channel ch;
  engine_config c (d, "https://cdn.example.com", ch);
  null_sink diag;

  {
    chunk_engine e (c, diag);
    e.analyze (m, nullptr, true);

    const chunk_plan& p (e.plan ());
    assert (p.files[0].filename == "data/shared.bin");
    assert (p.files[1].filename == "bin/app");
    assert (p.files[2].filename == "data/pak0.dat");
    assert (p.files[3].filename == "readme.txt");
  }

  {
    chunk_engine e (c, diag);
    e.analyze (m);

    const chunk_plan& p (e.plan ());
    assert (p.files[0].filename == "data/shared.bin");
    assert (p.files[1].filename == "readme.txt");
  }
}

static void
test_invalid ()
{
  fs::path d (temp_dir ("invalid"));

  progress_channel ch;
  engine_config c (d, "https://cdn.example.com", ch);
  null_sink diag;

  // Part referencing a chunk the manifest doesn't list.
  //
  {
    ::sample s (make_sample ());
    s.m.files[2].parts.push_back (chunk_part {guid (99, 0, 0, 0), 0, 1});

    chunk_engine e (c, diag);
    string m (expect<engine_failure> ([&] {e.analyze (s.m);}));
    assert (m.find ("unknown chunk") != string::npos);
  }

  // Names escaping the install directory.
  //
  for (const char* n: {"../escape", "/etc/passwd", "a/../../b", ""})
  {
    ::sample s (make_sample ());
    s.m.files[1].filename = n;

    chunk_engine e (c, diag);
    expect<engine_failure> ([&] {e.analyze (s.m);});
  }
}

static void
test_misuse ()
{
  fs::path d (temp_dir ("misuse"));
  ::sample s (make_sample ());

  progress_channel ch;
  engine_config c (d, "https://cdn.example.com", ch);
  null_sink diag;

  {
    chunk_engine e (c, diag);
    expect<logic_error> ([&e] {e.run ();});
  }

  // Stopped before it even started.
  //
  {
    chunk_engine e (c, diag);
    e.analyze (s.m);

    assert (e.running ());
    e.running (false);
    assert (!e.running ());

    expect<graceful_exit> ([&e] {e.run ();});
    assert (!fs::exists (d / "bin/app"));
  }

  // Missing chunks and nothing to download them with.
  //
  {
    chunk_engine e (c, diag);
    e.analyze (s.m);

    string m (expect<engine_failure> ([&e] {e.run ();}));
    assert (m.find ("no worker program") != string::npos);
  }
}

static void
test_corrupt_cache ()
{
  fs::path d (temp_dir ("corrupt"));
  ::sample s (make_sample ());

  progress_channel ch;
  engine_config c (d, "https://cdn.example.com", ch);
  null_sink diag;
  chunk_engine e (c, diag);

  populate_cache (c, s);

  vector<uint8_t> b (s.chunk_file (1));
  b[b.size () - 5] ^= 0x55;
  write_file (c.cache_dir / (s.m.chunks[1].id.string () + ".chunk"), b);

  e.analyze (s.m);
  expect<engine_failure> ([&e] {e.run ();});
}

static void
test_process_worker ()
{
  // Terminated before it was started: never starts.
  //
  {
    process_worker w;
    w.terminate ();
    w.terminate ();

    assert (w.terminated ());
    assert (!w.spawn ("/bin/sleep", {"30"}));
    assert (!w.active ());
  }

  {
    process_worker w;
    assert (w.spawn ("/bin/sleep", {"30"}));
    assert (w.active ());

    expect<logic_error> ([&w] {w.spawn ("/bin/sleep", {"30"});});

    w.terminate ();
    assert (!w.active ());
    assert (!w.wait ());

    // Idempotent.
    //
    w.terminate ();
  }

  {
    process_worker w;
    assert (w.spawn ("/bin/sh", {"-c", "exit 3"}));
    w.close_input ();

    optional<int> r (w.wait ());
    assert (r && *r == 3);
  }
}

// Stop the engine while it waits on a worker that never answers.
//
static void
test_interrupt ()
{
  fs::path d (temp_dir ("interrupt"));
  fs::path w (temp_dir ("interrupt-bin") / "stuck-worker");

  write_script (w, "#!/bin/sh\nexec sleep 30\n");

  ::sample s (make_sample ());

  progress_channel ch;
  engine_config c (d, "https://cdn.example.com", ch);
  c.worker_program = w;

  null_sink diag;
  chunk_engine e (c, diag);
  e.analyze (s.m);

  exception_ptr ex;
  thread t ([&e, &ex] ()
            {
              try
              {
                e.run ();
              }
              catch (...)
              {
                ex = current_exception ();
              }
            });

  auto start (chrono::steady_clock::now ());
  while (!e.worker ().active () &&
         chrono::steady_clock::now () - start < chrono::seconds (10))
    this_thread::sleep_for (chrono::milliseconds (5));

  assert (e.worker ().active ());

  e.running (false);
  e.worker ().terminate ();

  t.join ();

  assert (chrono::steady_clock::now () - start < chrono::seconds (20));
  assert (ex);
  expect<graceful_exit> ([&ex] {rethrow_exception (ex);});
}

int
main ()
{
  test_cached ();
  test_worker ();
  test_resume ();
  test_previous ();
  test_optimize ();
  test_invalid ();
  test_misuse ();
  test_corrupt_cache ();
  test_process_worker ();
  test_interrupt ();

  fs::remove_all (fs::temp_directory_path () /
                  ("depot-engine-test-" + std::to_string (::getpid ())));
}
