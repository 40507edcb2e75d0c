#pragma once

#include <mutex>
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <filesystem>

#include <boost/process.hpp>

#include <depot/engine/transfer-engine.hxx>

namespace depot
{
  namespace fs = std::filesystem;
  namespace bp = boost::process;

  // Worker child process with its standard input and output piped to us.
  //
  // Spawning and termination are serialized so that a terminate() racing
  // with spawn() either prevents the spawn or kills the fresh child, never
  // leaves it running.
  //
  class process_worker: public worker_handle
  {
  public:
    // The child (if still running) is killed on destruction.
    //
    process_worker () = default;

    process_worker (const process_worker&) = delete;
    process_worker& operator= (const process_worker&) = delete;

    // Start the program. Return false without starting anything if the
    // worker was terminated already. Throws std::system_error if the
    // program cannot be started and std::logic_error if called twice.
    //
    bool
    spawn (const fs::path& program, const std::vector<std::string>& args);

    void
    terminate () override;

    bool
    active () override;

    bool
    terminated () const;

    // Worker's stdin and stdout. Only valid after a successful spawn().
    //
    bp::opstream&
    input () noexcept
    {
      return in_;
    }

    bp::ipstream&
    output () noexcept
    {
      return out_;
    }

    // Close the worker's stdin, signalling the end of input.
    //
    void
    close_input ();

    // Wait for the worker to exit and return its exit code, or nullopt if
    // it was killed.
    //
    std::optional<int>
    wait ();

  private:
    mutable std::mutex mutex_;
    bool terminated_ = false;
    bool killed_ = false;
    std::unique_ptr<bp::child> child_;
    bp::opstream in_;
    bp::ipstream out_;
  };
}
