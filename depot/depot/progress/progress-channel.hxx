#pragma once

#include <atomic>
#include <utility>
#include <optional>
#include <functional>

#include <depot/progress/progress-types.hxx>

namespace depot
{
  // Progress channel.
  //
  // A single slot that holds the most recent sample published by the engine
  // and not yet drained by the observer. Publishing over an unread sample
  // replaces it: the observer only ever cares about the latest state, so
  // intermediate samples are dropped rather than queued.
  //
  // One writer and one reader, on different threads. Neither side ever
  // blocks or takes a lock: the slot is an atomic pointer swap.
  //
  class progress_channel
  {
  public:
    // Called on the publishing thread when a sample lands in a slot that
    // had no wakeup pending, that is, once per burst of samples between two
    // drains. Typically posts a drain to the observer's context.
    //
    using notifier = std::function<void ()>;

    progress_channel () = default;

    explicit
    progress_channel (notifier n)
      : notify_ (std::move (n)) {}

    ~progress_channel ();

    progress_channel (const progress_channel&) = delete;
    progress_channel& operator= (const progress_channel&) = delete;

    // Replace the slot contents. Must not be called concurrently with
    // on_publish().
    //
    void
    publish (const progress_sample&);

    // Take the latest sample, if any. Never blocks.
    //
    std::optional<progress_sample>
    drain ();

    // Install the notifier. Must be done before the writer starts.
    //
    void
    on_publish (notifier n)
    {
      notify_ = std::move (n);
    }

  private:
    std::atomic<progress_sample*> slot_ {nullptr};
    std::atomic<bool> pending_ {false};
    notifier notify_;
  };
}
