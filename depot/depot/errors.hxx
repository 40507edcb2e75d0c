#pragma once

#include <string>
#include <ostream>
#include <utility>
#include <stdexcept>

namespace depot
{
  // Why a job failed.
  //
  enum class failure_kind
  {
    manifest_unavailable,
    manifest_invalid,
    engine_failure
  };

  inline const char*
  to_string (failure_kind k) noexcept
  {
    switch (k)
    {
    case failure_kind::manifest_unavailable: return "manifest unavailable";
    case failure_kind::manifest_invalid:     return "manifest invalid";
    case failure_kind::engine_failure:       return "engine failure";
    }
    return "unknown failure";
  }

  inline std::ostream&
  operator<< (std::ostream& o, failure_kind k)
  {
    return o << to_string (k);
  }

  // Base of every error that terminates a job.
  //
  class job_error: public std::runtime_error
  {
  public:
    job_error (failure_kind k, const std::string& what)
      : std::runtime_error (what), kind_ (k) {}

    failure_kind
    kind () const noexcept
    {
      return kind_;
    }

  private:
    failure_kind kind_;
  };

  // The manifest could not be fetched or read.
  //
  class manifest_unavailable: public job_error
  {
  public:
    explicit
    manifest_unavailable (const std::string& what)
      : job_error (failure_kind::manifest_unavailable, what) {}
  };

  // Neither decoder accepted the manifest bytes.
  //
  // what() is the fallback (JSON) decoder's message. The primary (binary)
  // decoder's message is kept alongside for diagnostics.
  //
  class manifest_invalid: public job_error
  {
  public:
    manifest_invalid (const std::string& what, std::string primary = {})
      : job_error (failure_kind::manifest_invalid, what),
        primary_error_ (std::move (primary)) {}

    const std::string&
    primary_error () const noexcept
    {
      return primary_error_;
    }

  private:
    std::string primary_error_;
  };

  // The transfer engine failed (or gave up without being asked to).
  //
  class engine_failure: public job_error
  {
  public:
    explicit
    engine_failure (const std::string& what)
      : job_error (failure_kind::engine_failure, what) {}
  };
}
