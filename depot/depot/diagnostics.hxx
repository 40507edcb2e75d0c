#pragma once

#include <mutex>
#include <string>
#include <ostream>
#include <cstdint>

namespace depot
{
  // Diagnostic severity.
  //
  // Ordered from the most to the least important so that a threshold is a
  // simple comparison.
  //
  enum class diagnostic_level : std::uint8_t
  {
    error,
    warning,
    info,
    trace
  };

  const char*
  to_string (diagnostic_level);

  inline std::ostream&
  operator<< (std::ostream& o, diagnostic_level l)
  {
    return o << to_string (l);
  }

  // Diagnostic sink.
  //
  // The orchestrator and the engine never write to the standard streams
  // directly. Instead they are handed a sink at construction and the caller
  // decides where the lines end up (terminal, file, test recorder).
  //
  // Implementations must be callable from any thread.
  //
  class diagnostic_sink
  {
  public:
    virtual
    ~diagnostic_sink () = default;

    virtual void
    write (diagnostic_level, const std::string&) = 0;

    void
    error (const std::string& m)
    {
      write (diagnostic_level::error, m);
    }

    void
    warning (const std::string& m)
    {
      write (diagnostic_level::warning, m);
    }

    void
    info (const std::string& m)
    {
      write (diagnostic_level::info, m);
    }

    void
    trace (const std::string& m)
    {
      write (diagnostic_level::trace, m);
    }
  };

  // Write `<level>: <message>` lines to a stream.
  //
  // Lines below the threshold are dropped. Writes are serialized so that
  // lines from the job thread and the caller thread don't interleave.
  //
  class stream_sink: public diagnostic_sink
  {
  public:
    explicit
    stream_sink (std::ostream& os,
                 diagnostic_level threshold = diagnostic_level::info)
      : os_ (os), threshold_ (threshold) {}

    void
    write (diagnostic_level, const std::string&) override;

    void
    threshold (diagnostic_level l) noexcept
    {
      threshold_ = l;
    }

    diagnostic_level
    threshold () const noexcept
    {
      return threshold_;
    }

  private:
    std::ostream& os_;
    diagnostic_level threshold_;
    std::mutex mutex_;
  };

  // Swallow everything.
  //
  class null_sink: public diagnostic_sink
  {
  public:
    void
    write (diagnostic_level, const std::string&) override {}
  };
}
