#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <utility>
#include <exception>
#include <filesystem>

#include <depot/manifest/manifest-types.hxx>
#include <depot/progress/progress-channel.hxx>

namespace depot
{
  namespace fs = std::filesystem;

  // Thrown by transfer_engine::run() when it notices that its running flag
  // was cleared. Not an error: the engine stopped because it was asked to.
  //
  class graceful_exit: public std::exception
  {
  public:
    const char*
    what () const noexcept override
    {
      return "transfer interrupted";
    }
  };

  // Handle to the engine's external worker.
  //
  // terminate() may be called from any thread, any number of times, and
  // before the worker is started, in which case it is never started.
  //
  class worker_handle
  {
  public:
    virtual
    ~worker_handle () = default;

    virtual void
    terminate () = 0;

    // True if the worker was started and has not exited yet.
    //
    virtual bool
    active () = 0;
  };

  // Engine construction parameters.
  //
  struct engine_config
  {
    engine_config (fs::path install, std::string base, progress_channel& c)
      : install_dir (std::move (install)),
        base_url (std::move (base)),
        cache_dir (install_dir / ".cache"),
        resume_file (install_dir / ".resumedata"),
        progress (c) {}

    fs::path install_dir;
    std::string base_url;
    fs::path cache_dir;
    fs::path resume_file;

    // Where samples go.
    //
    progress_channel& progress;

    // Chunk download worker executable.
    //
    fs::path worker_program;

    // Concurrent connections the worker may open.
    //
    std::uint32_t max_connections = 8;

    // HTTP timeouts handed to the worker, in milliseconds.
    //
    std::uint32_t connect_timeout = 30000;
    std::uint32_t request_timeout = 60000;

    // Minimum interval between two published samples.
    //
    std::chrono::milliseconds update_interval {500};
  };

  // Transfer engine.
  //
  // Turns a decoded manifest into files under the install directory. The
  // expected call sequence is analyze() followed by run(), both on the same
  // thread. running(false) and worker().terminate() are the only calls that
  // may come from another thread.
  //
  class transfer_engine
  {
  public:
    virtual
    ~transfer_engine () = default;

    // Work out what needs to be done. If previous is not NULL, files that
    // did not change since that manifest and are already in place are
    // skipped. If optimize is true, the work is reordered to improve chunk
    // reuse.
    //
    virtual void
    analyze (const manifest&,
             const manifest* previous = nullptr,
             bool optimize = false) = 0;

    // Do the work, publishing samples along the way. Blocks until done.
    // Throws graceful_exit if the running flag is cleared, std::logic_error
    // if called before analyze(), and engine_failure for anything else.
    //
    virtual void
    run () = 0;

    virtual bool
    running () const noexcept = 0;

    virtual void
    running (bool) = 0;

    virtual worker_handle&
    worker () noexcept = 0;
  };
}
