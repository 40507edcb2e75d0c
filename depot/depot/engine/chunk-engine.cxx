#include <depot/engine/chunk-engine.hxx>

#include <fstream>
#include <utility>
#include <algorithm>
#include <stdexcept>
#include <system_error>

#include <depot/errors.hxx>
#include <depot/http/http-types.hxx>

using namespace std;

namespace depot
{
  chunk_engine::
  chunk_engine (const engine_config& c, diagnostic_sink& d)
    : config_ (c), diag_ (d), resume_ (c.resume_file)
  {
  }

  fs::path chunk_engine::
  chunk_cache_path (const guid& g) const
  {
    return config_.cache_dir / (g.string () + ".chunk");
  }

  // Reject names that would land outside the install directory.
  //
  static void
  check_file_name (const string& n)
  {
    fs::path p (n);

    if (n.empty () || p.is_absolute ())
      throw engine_failure ("invalid file name '" + n + "' in manifest");

    for (const fs::path& c: p)
    {
      if (c == "..")
        throw engine_failure ("invalid file name '" + n + "' in manifest");
    }
  }

  void chunk_engine::
  analyze (const manifest& m, const manifest* previous, bool optimize)
  {
    manifest_ = m;
    plan_ = chunk_plan ();

    unordered_map<string, sha1_digest> completed;

    try
    {
      completed = resume_.load ();
    }
    catch (const runtime_error& e)
    {
      throw engine_failure (e.what ());
    }

    if (!completed.empty ())
      diag_.info ("resuming, " + std::to_string (completed.size ()) +
                  " files recorded as complete");

    unordered_map<string, const file_manifest*> old;
    if (previous != nullptr)
    {
      for (const file_manifest& f: previous->files)
        old.emplace (f.filename, &f);
    }

    for (const file_manifest& f: manifest_->files)
    {
      check_file_name (f.filename);

      fs::path p (config_.install_dir / f.filename);
      error_code ec;

      // Completed by an earlier run of this job.
      //
      if (auto i = completed.find (f.filename);
          i != completed.end () && i->second == f.hash &&
          fs::exists (p, ec))
      {
        plan_.skipped.push_back (f.filename);
        continue;
      }

      // Unchanged since the installed version and already in place.
      //
      if (auto i = old.find (f.filename);
          i != old.end () && i->second->hash == f.hash &&
          fs::is_regular_file (p, ec) &&
          fs::file_size (p, ec) == f.size () && !ec)
      {
        plan_.skipped.push_back (f.filename);
        continue;
      }

      plan_.files.push_back (f);
    }

    // Process files in the order of the chunks they start with so that
    // files sharing chunks are written back to back and each chunk is
    // loaded once.
    //
    if (optimize)
    {
      stable_sort (plan_.files.begin (), plan_.files.end (),
                   [] (const file_manifest& x, const file_manifest& y)
                   {
                     if (x.parts.empty () || y.parts.empty ())
                       return x.parts.empty () && !y.parts.empty ();

                     return x.parts.front ().id < y.parts.front ().id;
                   });
    }

    unordered_map<guid, const chunk_info*, guid_hash> known;
    for (const chunk_info& c: manifest_->chunks)
      known.emplace (c.id, &c);

    for (const file_manifest& f: plan_.files)
    {
      for (const chunk_part& p: f.parts)
      {
        auto i (known.find (p.id));
        if (i == known.end ())
          throw engine_failure ("file " + f.filename +
                                " references unknown chunk " +
                                p.id.string ());

        if (plan_.references[p.id]++ == 0)
          plan_.chunks.push_back (*i->second);
      }
    }

    diag_.info (std::to_string (plan_.files.size ()) + " files to write, " +
                std::to_string (plan_.skipped.size ()) + " skipped, " +
                std::to_string (plan_.chunks.size ()) + " chunks");
  }

  void chunk_engine::
  check_running () const
  {
    if (!running_.load ())
      throw graceful_exit ();
  }

  void chunk_engine::
  run ()
  {
    if (!manifest_)
      throw logic_error ("transfer engine run before analyze");

    check_running ();

    try
    {
      fs::create_directories (config_.install_dir);
      fs::create_directories (config_.cache_dir);

      done_ = 0;
      last_publish_ = 0;
      publish (true);

      vector<const chunk_info*> missing;
      for (const chunk_info& c: plan_.chunks)
      {
        if (fs::exists (chunk_cache_path (c.id)))
          task_done ();
        else
          missing.push_back (&c);
      }

      if (!missing.empty ())
        download_chunks (missing);

      for (const file_manifest& f: plan_.files)
      {
        check_running ();
        write_file (f);
        task_done ();
      }

      resume_.clear ();
    }
    catch (const graceful_exit&)
    {
      throw;
    }
    catch (const job_error&)
    {
      throw;
    }
    catch (const exception& e)
    {
      throw engine_failure (e.what ());
    }

    // Whatever the cadence, the last word is always "done".
    //
    progress_sample s;
    s.fraction_complete = 1.0;
    s.download_rate = download_meter_.rate ();
    s.disk_read_rate = read_meter_.rate ();
    s.disk_write_rate = write_meter_.rate ();
    config_.progress.publish (s);
  }

  void chunk_engine::
  download_chunks (const vector<const chunk_info*>& cs)
  {
    if (config_.worker_program.empty ())
      throw engine_failure ("no worker program to download chunks with");

    vector<string> args {
      "--jobs", std::to_string (config_.max_connections),
      "--connect-timeout", std::to_string (config_.connect_timeout),
      "--request-timeout", std::to_string (config_.request_timeout)};

    if (!worker_.spawn (config_.worker_program, args))
      throw graceful_exit ();

    diag_.trace ("started " + config_.worker_program.string () + " for " +
                 std::to_string (cs.size ()) + " chunks");

    unordered_map<string, const chunk_info*> pending;

    bp::opstream& in (worker_.input ());
    for (const chunk_info* c: cs)
    {
      string id (c->id.string ());

      in << id << '\t'
         << join_url (config_.base_url, manifest_->chunk_path (*c)) << '\t'
         << chunk_cache_path (c->id).string () << '\n';

      pending.emplace (move (id), c);
    }

    bool sent (static_cast<bool> (in));
    worker_.close_input ();

    if (!sent)
    {
      check_running ();
      throw engine_failure ("unable to send chunk list to worker");
    }

    string error;

    for (string l; getline (worker_.output (), l); )
    {
      if (!running_.load ())
      {
        worker_.terminate ();
        throw graceful_exit ();
      }

      size_t a (l.find ('\t'));
      size_t b (a != string::npos ? l.find ('\t', a + 1) : string::npos);

      if (b == string::npos)
      {
        diag_.warning ("unexpected worker output: " + l);
        continue;
      }

      string status (l, 0, a);
      string id (l, a + 1, b - a - 1);
      string rest (l, b + 1);

      if (status == "ok")
      {
        if (pending.erase (id) == 0)
        {
          diag_.warning ("worker reported unrequested chunk " + id);
          continue;
        }

        try
        {
          download_meter_.add (stoull (rest));
        }
        catch (const logic_error&)
        {
          diag_.warning ("invalid size in worker output: " + l);
        }

        task_done ();
      }
      else if (status == "error")
      {
        string m ("unable to download chunk " + id + ": " + rest);
        diag_.error (m);

        if (error.empty ())
          error = move (m);
      }
      else
        diag_.warning ("unexpected worker output: " + l);
    }

    optional<int> x (worker_.wait ());

    check_running ();

    if (!x)
      throw engine_failure ("worker process was killed");

    if (!error.empty ())
      throw engine_failure (error);

    if (*x != 0)
      throw engine_failure ("worker process exited with code " +
                            std::to_string (*x));

    if (!pending.empty ())
      throw engine_failure (std::to_string (pending.size ()) +
                            " chunks were not downloaded");
  }

  const vector<uint8_t>& chunk_engine::
  load_chunk (const guid& g)
  {
    if (!current_data_.empty () && current_id_ == g)
      return current_data_;

    fs::path p (chunk_cache_path (g));
    chunk_data c (read_chunk_file (p));

    if (c.header.id != g)
      throw engine_failure ("cached chunk " + p.string () + " has GUID " +
                            c.header.id.string ());

    read_meter_.add (c.header.compressed_size + c.header.header_size);

    current_id_ = g;
    current_data_ = move (c.data);
    return current_data_;
  }

  void chunk_engine::
  release_chunk (const guid& g)
  {
    auto i (plan_.references.find (g));
    if (i == plan_.references.end () || --i->second != 0)
      return;

    if (current_id_ == g)
      current_data_.clear ();

    error_code ec;
    fs::remove (chunk_cache_path (g), ec);

    if (ec)
      diag_.warning ("unable to remove cached chunk " + g.string () + ": " +
                     ec.message ());
  }

  void chunk_engine::
  write_file (const file_manifest& f)
  {
    fs::path p (config_.install_dir / f.filename);

    if (p.has_parent_path ())
      fs::create_directories (p.parent_path ());

    if (!f.symlink_target.empty ())
    {
      error_code ec;
      fs::remove (p, ec);
      fs::create_symlink (f.symlink_target, p);
      resume_.append (f.hash, f.filename);
      return;
    }

    sha1_hasher h;

    {
      ofstream ofs (p, ios::binary | ios::trunc);
      if (!ofs)
        throw engine_failure ("unable to create " + p.string ());

      for (const chunk_part& cp: f.parts)
      {
        check_running ();

        const vector<uint8_t>& d (load_chunk (cp.id));

        if (static_cast<uint64_t> (cp.offset) + cp.size > d.size ())
          throw engine_failure ("part of " + f.filename + " lies outside of "
                                "chunk " + cp.id.string ());

        const uint8_t* b (d.data () + cp.offset);
        ofs.write (reinterpret_cast<const char*> (b), cp.size);
        h.update (b, cp.size);
        write_meter_.add (cp.size);

        release_chunk (cp.id);
        publish (false);
      }

      ofs.close ();
      if (!ofs)
        throw engine_failure ("unable to write " + p.string ());
    }

    if (h.finish () != f.hash)
      throw engine_failure ("SHA-1 mismatch for " + f.filename);

    if (f.executable ())
      fs::permissions (p,
                       fs::perms::owner_exec |
                       fs::perms::group_exec |
                       fs::perms::others_exec,
                       fs::perm_options::add);

    resume_.append (f.hash, f.filename);
  }

  void chunk_engine::
  task_done ()
  {
    ++done_;
    publish (false);
  }

  void chunk_engine::
  publish (bool force)
  {
    uint64_t now (current_time_us ());
    uint64_t interval (
      static_cast<uint64_t> (config_.update_interval.count ()) * 1000);

    if (!force && now - last_publish_ < interval)
      return;

    last_publish_ = now;

    download_meter_.update (now);
    read_meter_.update (now);
    write_meter_.update (now);

    size_t n (plan_.tasks ());

    progress_sample s;
    s.fraction_complete =
      n == 0 ? 1.0 : static_cast<double> (done_) / static_cast<double> (n);
    s.download_rate = download_meter_.rate ();
    s.disk_read_rate = read_meter_.rate ();
    s.disk_write_rate = write_meter_.rate ();

    config_.progress.publish (s);
  }
}
