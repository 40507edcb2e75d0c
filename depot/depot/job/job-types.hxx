#pragma once

#include <string>
#include <ostream>
#include <utility>
#include <optional>

#include <depot/errors.hxx>

namespace depot
{
  // What to download and where to.
  //
  struct job_request
  {
    std::string base_url;
    std::string manifest_spec;   // URL or local path.
    std::string destination_dir;

    // Manifest of the version currently installed in the destination, if
    // any. Failing to resolve or decode it is not fatal.
    //
    std::optional<std::string> previous_manifest_spec;

    bool optimize_processing = false;
  };

  enum class job_state
  {
    idle,
    resolving_manifest,
    downloading,
    finished,
    cancelled,
    failed
  };

  inline bool
  terminal (job_state s) noexcept
  {
    return s == job_state::finished  ||
           s == job_state::cancelled ||
           s == job_state::failed;
  }

  inline const char*
  to_string (job_state s) noexcept
  {
    switch (s)
    {
    case job_state::idle:               return "idle";
    case job_state::resolving_manifest: return "resolving manifest";
    case job_state::downloading:        return "downloading";
    case job_state::finished:           return "finished";
    case job_state::cancelled:          return "cancelled";
    case job_state::failed:             return "failed";
    }
    return "unknown";
  }

  inline std::ostream&
  operator<< (std::ostream& o, job_state s)
  {
    return o << to_string (s);
  }

  // How a job ended. Delivered exactly once per job.
  //
  struct terminal_event
  {
    enum kind_type
    {
      finished,
      cancelled,
      failed
    };

    kind_type kind = finished;

    // Only meaningful for failed.
    //
    failure_kind failure = failure_kind::engine_failure;
    std::string message;

    static terminal_event
    make_finished ()
    {
      return terminal_event {finished, failure_kind::engine_failure, {}};
    }

    static terminal_event
    make_cancelled ()
    {
      return terminal_event {cancelled, failure_kind::engine_failure, {}};
    }

    static terminal_event
    make_failed (failure_kind k, std::string m)
    {
      return terminal_event {failed, k, std::move (m)};
    }

    job_state
    state () const noexcept
    {
      switch (kind)
      {
      case finished:  return job_state::finished;
      case cancelled: return job_state::cancelled;
      case failed:    break;
      }
      return job_state::failed;
    }
  };

  inline std::ostream&
  operator<< (std::ostream& o, const terminal_event& e)
  {
    o << e.state ();

    if (e.kind == terminal_event::failed)
      o << " (" << e.failure << "): " << e.message;

    return o;
  }
}
