#pragma once

#include <atomic>
#include <mutex>
#include <memory>
#include <thread>
#include <string>
#include <optional>
#include <utility> // std::exchange (boost/asio/awaitable.hpp)
#include <functional>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include <depot/diagnostics.hxx>
#include <depot/job/job-types.hxx>
#include <depot/engine/transfer-engine.hxx>
#include <depot/progress/progress-types.hxx>
#include <depot/progress/progress-channel.hxx>
#include <depot/manifest/manifest-source.hxx>
#include <depot/manifest/manifest-decoder.hxx>

namespace depot
{
  namespace asio = boost::asio;

  // Caller-side callbacks. All of them are invoked on the caller's
  // io_context and any of them may be empty.
  //
  struct job_handlers
  {
    std::function<void (const progress_event&)> progress;
    std::function<void (job_state)> state;
    std::function<void (const terminal_event&)> terminal;
  };

  // Job orchestrator.
  //
  // Runs one download job: resolve the manifest, decode it, and hand it to
  // the transfer engine, all on a dedicated thread with its own io_context
  // so that the caller's context never blocks. Progress, state changes and
  // the final outcome are posted back to the caller's context.
  //
  //   idle --start--> resolving_manifest --decoded--> downloading
  //                          |                            |
  //                          +--> failed                  +--> finished
  //                                                       +--> failed
  //
  //   any non-terminal state --cancel--> cancelled
  //
  // The terminal event is delivered exactly once and after any progress
  // sample published before it. Nothing is delivered after it.
  //
  // Create with make_job_orchestrator(): posted notifications only hold
  // weak references and are dropped if the orchestrator is gone.
  //
  class job_orchestrator:
    public std::enable_shared_from_this<job_orchestrator>
  {
  public:
    using engine_factory =
      std::function<std::unique_ptr<transfer_engine> (const engine_config&)>;

    job_orchestrator (asio::io_context& caller,
                      diagnostic_sink&,
                      engine_factory,
                      job_handlers,
                      std::shared_ptr<remote_fetcher> = nullptr);

    // Cancel the job if it is still running and wait for the job thread.
    //
    ~job_orchestrator ();

    job_orchestrator (const job_orchestrator&) = delete;
    job_orchestrator& operator= (const job_orchestrator&) = delete;

    // Validate the request, create the engine, and start the job. Returns
    // immediately.
    //
    // Throws std::logic_error if the job was already started or cancelled
    // and std::runtime_error if the destination cannot be created or is
    // not writable. Nothing is delivered to the handlers in these cases.
    //
    void
    start (job_request);

    // Request cancellation. Idempotent, callable from any thread and a no-op
    // once the job reached a terminal state. Never blocks on the job.
    //
    void
    cancel ();

    job_state
    state () const noexcept
    {
      return state_.load ();
    }

    // Message of the failure once the job failed.
    //
    std::optional<std::string>
    failure_reason () const;

    // Engine configuration the job was started with.
    //
    const std::optional<engine_config>&
    config () const noexcept
    {
      return config_;
    }

  private:
    asio::awaitable<void>
    run_job (job_request);

    // Move to the terminal state of the event unless already terminal.
    // Return false if somebody else got there first.
    //
    bool
    finish (terminal_event);

    bool
    advance (job_state from, job_state to);

    void
    post_state (job_state);

    void
    post_terminal (terminal_event);

    // Caller context side.
    //
    void
    forward_progress ();

    void
    deliver_terminal (const terminal_event&);

  private:
    asio::io_context& caller_;
    diagnostic_sink& diag_;
    engine_factory factory_;
    job_handlers handlers_;

    manifest_source source_;
    manifest_decoder decoder_;
    progress_channel channel_;
    std::optional<engine_config> config_;
    std::unique_ptr<transfer_engine> engine_;

    std::atomic<job_state> state_ {job_state::idle};
    std::atomic<bool> started_ {false};
    std::atomic<bool> cancel_requested_ {false};

    mutable std::mutex result_mutex_;
    std::optional<terminal_event> result_;

    // Caller context only.
    //
    bool delivered_ = false;

    // Declared last so that an abandoned job coroutine is destroyed before
    // anything it refers to.
    //
    asio::io_context job_ioc_;
    std::thread thread_;
  };

  std::shared_ptr<job_orchestrator>
  make_job_orchestrator (asio::io_context& caller,
                         diagnostic_sink&,
                         job_orchestrator::engine_factory,
                         job_handlers,
                         std::shared_ptr<remote_fetcher> = nullptr);
}
