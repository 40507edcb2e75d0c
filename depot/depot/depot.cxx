#include <string>
#include <memory>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <exception>
#include <filesystem>
#include <system_error>

#include <unistd.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <depot/version.hxx>
#include <depot/diagnostics.hxx>
#include <depot/depot-options.hxx>
#include <depot/job/job-orchestrator.hxx>
#include <depot/engine/chunk-engine.hxx>

namespace depot
{
  using namespace std;

  // Everything derived from the command line, so that we can pass it around
  // as a single unit.
  //
  struct runtime_context
  {
    job_request    request;
    fs::path       worker_program;
    uint32_t       connections;
    uint32_t       update_interval;
    uint32_t       connect_timeout;
    uint32_t       request_timeout;
    bool           show_progress;
  };

  static fs::path
  current_executable_path ()
  {
    error_code ec;

    // On Linux /proc/self/exe is the most reliable way to find where we
    // actually live.
    //
    fs::path r (fs::read_symlink ("/proc/self/exe", ec));
    if (!ec)
      return r;

    return fs::current_path (ec);
  }

  static string
  format_bar (double p, int w)
  {
    string r ("[");

    int filled (static_cast<int> (p * w));

    for (int i (0); i < w; ++i)
    {
      if (i < filled - 1)
        r += '=';
      else if (i == filled - 1)
        r += '>';
      else
        r += ' ';
    }

    r += ']';
    return r;
  }

  // Progress line renderer.
  //
  // On a terminal we keep rewriting the same line, otherwise we print one
  // line per update.
  //
  class progress_printer
  {
  public:
    explicit
    progress_printer (ostream& o)
      : os_ (o), tty_ (::isatty (STDERR_FILENO) != 0) {}

    void
    print (const progress_event& e)
    {
      double b (e.download_mbps * bytes_per_megabyte);
      double w (e.disk_write_mbps * bytes_per_megabyte);

      os_ << (tty_ ? "\r" : "")
          << format_bar (e.fraction_complete, 30) << ' '
          << fixed << setprecision (1) << setw (5)
          << e.fraction_complete * 100.0 << "% "
          << "down " << format_rate (b) << ", "
          << "write " << format_rate (w)
          << (tty_ ? "   " : "\n") << flush;

      dirty_ = tty_;
    }

    // Terminate a rewritten line before anything else goes to the stream.
    //
    void
    finish ()
    {
      if (dirty_)
      {
        os_ << endl;
        dirty_ = false;
      }
    }

  private:
    ostream& os_;
    bool tty_;
    bool dirty_ = false;
  };

  static int
  run (const runtime_context& ctx, diagnostic_sink& diag)
  {
    asio::io_context ioc;
    progress_printer printer (cerr);

    int exit_code (1);

    job_handlers hs;

    if (ctx.show_progress)
      hs.progress = [&printer] (const progress_event& e) {printer.print (e);};

    hs.state = [&diag] (job_state s)
    {
      diag.trace (string ("job state: ") + to_string (s));
    };

    asio::signal_set signals (ioc, SIGINT, SIGTERM);

    hs.terminal = [&] (const terminal_event& e)
    {
      printer.finish ();

      switch (e.kind)
      {
      case terminal_event::finished:
        exit_code = 0;
        break;
      case terminal_event::cancelled:
        cerr << "cancelled" << endl;
        exit_code = 130;
        break;
      case terminal_event::failed:
        cerr << "error: " << e.message << endl;
        exit_code = 1;
        break;
      }

      signals.cancel ();
    };

    job_orchestrator::engine_factory factory (
      [&ctx, &diag] (const engine_config& c)
      {
        engine_config ec (c);
        ec.worker_program = ctx.worker_program;
        ec.max_connections = ctx.connections;
        ec.update_interval = chrono::milliseconds (ctx.update_interval);
        ec.connect_timeout = ctx.connect_timeout;
        ec.request_timeout = ctx.request_timeout;
        return make_unique<chunk_engine> (ec, diag);
      });

    http_client_traits<> ht;
    ht.connect_timeout = ctx.connect_timeout;
    ht.request_timeout = ctx.request_timeout;

    shared_ptr<job_orchestrator> job (
      make_job_orchestrator (ioc,
                             diag,
                             move (factory),
                             move (hs),
                             make_shared<http_fetcher> (ht)));

    signals.async_wait (
      [&job, &printer] (const boost::system::error_code& ec, int)
      {
        if (!ec)
        {
          printer.finish ();
          job->cancel ();
        }
      });

    job->start (ctx.request);

    // The terminal handler cancels the signal wait, after which nothing is
    // left to run.
    //
    ioc.run ();
    return exit_code;
  }
}

int
main (int argc, char* argv[])
{
  using namespace std;
  using namespace depot;

  try
  {
    options opt (argc, argv);

    // Handle --version.
    //
    if (opt.version ())
    {
      cout << "depot " << DEPOT_VERSION_ID << endl;
      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: depot [options]" << "\n"
        << "options:"               << "\n";

      opt.print_usage (o);
      return 0;
    }

    if (!opt.manifest_specified ())
      throw runtime_error ("missing --manifest");

    if (!opt.destination_specified ())
      throw runtime_error ("missing --destination");

    if (!opt.base_url_specified ())
      throw runtime_error ("missing --base-url");

    stream_sink diag (cerr,
                      opt.verbose () ? diagnostic_level::trace :
                      opt.quiet ()   ? diagnostic_level::error :
                                       diagnostic_level::info);

    // Map the command line options to our context.
    //
    runtime_context ctx;
    ctx.request.base_url = opt.base_url ();
    ctx.request.manifest_spec = opt.manifest ();
    ctx.request.destination_dir = opt.destination ();
    ctx.request.optimize_processing = opt.optimize ();

    if (opt.previous_manifest_specified ())
      ctx.request.previous_manifest_spec = opt.previous_manifest ();

    ctx.worker_program = opt.worker_specified ()
      ? fs::path (opt.worker ())
      : current_executable_path ().parent_path () / "depot-worker";

    ctx.connections = opt.jobs ();
    ctx.update_interval = opt.update_interval ();
    ctx.connect_timeout = opt.connect_timeout ();
    ctx.request_timeout = opt.request_timeout ();
    ctx.show_progress = !opt.quiet ();

    return run (ctx, diag);
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
}
