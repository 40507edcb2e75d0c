#include <depot/job/job-orchestrator.hxx>

#include <fstream>
#include <utility>
#include <stdexcept>
#include <exception>
#include <filesystem>
#include <system_error>

#include <boost/asio/post.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

using namespace std;

namespace depot
{
  job_orchestrator::
  job_orchestrator (asio::io_context& c,
                    diagnostic_sink& d,
                    engine_factory f,
                    job_handlers h,
                    shared_ptr<remote_fetcher> r)
    : caller_ (c),
      diag_ (d),
      factory_ (move (f)),
      handlers_ (move (h)),
      source_ (move (r))
  {
  }

  job_orchestrator::
  ~job_orchestrator ()
  {
    if (!terminal (state_.load ()))
      cancel ();

    job_ioc_.stop ();

    if (thread_.joinable ())
      thread_.join ();
  }

  shared_ptr<job_orchestrator>
  make_job_orchestrator (asio::io_context& c,
                         diagnostic_sink& d,
                         job_orchestrator::engine_factory f,
                         job_handlers h,
                         shared_ptr<remote_fetcher> r)
  {
    return make_shared<job_orchestrator> (c, d, move (f), move (h), move (r));
  }

  // Make sure the destination exists and that we can write into it before
  // committing to the job.
  //
  static void
  prepare_destination (const fs::path& d)
  {
    if (d.empty ())
      throw runtime_error ("empty destination directory");

    error_code ec;
    fs::create_directories (d, ec);

    if (ec)
      throw runtime_error ("unable to create destination directory " +
                           d.string () + ": " + ec.message ());

    if (!fs::is_directory (d, ec))
      throw runtime_error ("destination " + d.string () +
                           " is not a directory");

    fs::path p (d / ".depot-probe");

    {
      ofstream ofs (p, ios::trunc);
      ofs << "probe" << endl;

      if (!ofs)
        throw runtime_error ("destination directory " + d.string () +
                             " is not writable");
    }

    fs::remove (p, ec);
  }

  void job_orchestrator::
  start (job_request r)
  {
    if (started_.exchange (true))
      throw logic_error ("job already started");

    if (state_.load () != job_state::idle)
      throw logic_error ("job cancelled before it was started");

    prepare_destination (r.destination_dir);

    config_.emplace (fs::path (r.destination_dir), r.base_url, channel_);

    engine_ = factory_ (*config_);
    if (engine_ == nullptr)
      throw logic_error ("engine factory returned no engine");

    // The notifier runs on the job thread. It must not extend our lifetime
    // (the last reference would then be released there), so it only posts
    // and the handler locks on the caller side.
    //
    channel_.on_publish (
      [&ioc = caller_, w = weak_from_this ()] ()
      {
        asio::post (ioc,
                    [w] ()
                    {
                      if (auto self = w.lock ())
                        self->forward_progress ();
                    });
      });

    // A concurrent cancel() may have won the race from idle.
    //
    if (!advance (job_state::idle, job_state::resolving_manifest))
      return;

    post_state (job_state::resolving_manifest);

    asio::co_spawn (job_ioc_, run_job (move (r)), asio::detached);

    thread_ = thread ([this] () {job_ioc_.run ();});
  }

  asio::awaitable<void> job_orchestrator::
  run_job (job_request r)
  {
    try
    {
      manifest_bytes b (co_await source_.resolve (r.manifest_spec));

      diag_.info ("manifest source resolved: " + r.manifest_spec + " (" +
                  std::to_string (b.size ()) + " bytes)");

      decode_result d (decoder_.try_decode (b));

      if (!d)
      {
        diag_.error ("manifest decode failed: " + *d.fallback_error +
                     " (binary: " + *d.primary_error + ")");

        throw manifest_invalid (*d.fallback_error, *d.primary_error);
      }

      if (d.fallback_used ())
        diag_.warning ("manifest decode failed, fallback json used: " +
                       *d.primary_error);

      optional<manifest> previous;

      if (r.previous_manifest_spec)
      {
        try
        {
          manifest_bytes pb (
            co_await source_.resolve (*r.previous_manifest_spec));

          previous = decoder_.decode (pb);
        }
        catch (const job_error& e)
        {
          diag_.warning (string ("ignoring previous manifest: ") + e.what ());
        }
      }

      if (!advance (job_state::resolving_manifest, job_state::downloading))
        co_return;

      post_state (job_state::downloading);

      engine_->analyze (*d.value,
                        previous ? &*previous : nullptr,
                        r.optimize_processing);
      engine_->run ();

      finish (terminal_event::make_finished ());
    }
    catch (const graceful_exit&)
    {
      if (!cancel_requested_.load ())
        finish (terminal_event::make_failed (
                  failure_kind::engine_failure,
                  "transfer engine stopped without being asked to"));
    }
    catch (const job_error& e)
    {
      finish (terminal_event::make_failed (e.kind (), e.what ()));
    }
    catch (const exception& e)
    {
      // Anything that escapes the manifest stages is already a job_error,
      // so this came from the engine.
      //
      finish (terminal_event::make_failed (failure_kind::engine_failure,
                                           e.what ()));
    }
  }

  bool job_orchestrator::
  advance (job_state from, job_state to)
  {
    return state_.compare_exchange_strong (from, to);
  }

  bool job_orchestrator::
  finish (terminal_event e)
  {
    job_state to (e.state ());
    job_state s (state_.load ());

    do
    {
      if (terminal (s))
        return false;
    }
    while (!state_.compare_exchange_weak (s, to));

    if (e.kind == terminal_event::failed)
      diag_.error ("job failed: " + e.message);
    else if (e.kind == terminal_event::finished)
      diag_.info ("job finished");

    {
      lock_guard<mutex> l (result_mutex_);
      result_ = e;
    }

    post_terminal (move (e));
    return true;
  }

  void job_orchestrator::
  cancel ()
  {
    cancel_requested_.store (true);

    job_state s (state_.load ());

    do
    {
      if (terminal (s))
        return;
    }
    while (!state_.compare_exchange_weak (s, job_state::cancelled));

    diag_.info ("job terminated by cancellation");

    {
      lock_guard<mutex> l (result_mutex_);
      result_ = terminal_event::make_cancelled ();
    }

    // Cancelled from idle: start() may still be creating the engine on
    // another thread, but it will not run it. Otherwise the engine was set
    // before the job left idle.
    //
    // Both steps run whatever happens to the other one.
    //
    if (s != job_state::idle && engine_ != nullptr)
    {
      try
      {
        engine_->running (false);
      }
      catch (const exception& e)
      {
        diag_.error (string ("unable to stop transfer engine: ") + e.what ());
      }

      try
      {
        engine_->worker ().terminate ();
      }
      catch (const exception& e)
      {
        diag_.error (string ("unable to terminate worker: ") + e.what ());
      }
    }

    // Abandon whatever the job context is waiting for (manifest fetch). A
    // blocking engine run notices the cleared flag on its own.
    //
    job_ioc_.stop ();

    post_terminal (terminal_event::make_cancelled ());
  }

  optional<string> job_orchestrator::
  failure_reason () const
  {
    lock_guard<mutex> l (result_mutex_);

    if (result_ && result_->kind == terminal_event::failed)
      return result_->message;

    return nullopt;
  }

  void job_orchestrator::
  post_state (job_state s)
  {
    asio::post (caller_,
                [w = weak_from_this (), s] ()
                {
                  auto self (w.lock ());
                  if (self != nullptr &&
                      !self->delivered_ &&
                      self->handlers_.state)
                    self->handlers_.state (s);
                });
  }

  void job_orchestrator::
  post_terminal (terminal_event e)
  {
    asio::post (caller_,
                [w = weak_from_this (), e = move (e)] ()
                {
                  if (auto self = w.lock ())
                    self->deliver_terminal (e);
                });
  }

  void job_orchestrator::
  forward_progress ()
  {
    if (delivered_)
      return;

    while (optional<progress_sample> s = channel_.drain ())
    {
      if (handlers_.progress)
        handlers_.progress (to_event (*s));
    }
  }

  void job_orchestrator::
  deliver_terminal (const terminal_event& e)
  {
    if (delivered_)
      return;

    // Flush whatever the engine published before it stopped so that, for
    // example, the final 100% sample precedes "finished".
    //
    forward_progress ();

    delivered_ = true;

    if (handlers_.state)
      handlers_.state (e.state ());

    if (handlers_.terminal)
      handlers_.terminal (e);
  }
}
