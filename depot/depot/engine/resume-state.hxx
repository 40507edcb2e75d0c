#pragma once

#include <string>
#include <utility>
#include <unordered_map>
#include <filesystem>

#include <depot/manifest/manifest-types.hxx>

namespace depot
{
  namespace fs = std::filesystem;

  // Resume file.
  //
  // One `<sha1>:<file name>` line per file that was completely written and
  // verified. After an interrupted run the engine skips these files.
  //
  class resume_state
  {
  public:
    explicit
    resume_state (fs::path file)
      : file_ (std::move (file)) {}

    const fs::path&
    path () const noexcept
    {
      return file_;
    }

    // Completed files and their hashes. A missing file yields an empty map,
    // malformed lines are ignored. Throws std::runtime_error if the file
    // exists but cannot be read.
    //
    std::unordered_map<std::string, sha1_digest>
    load () const;

    // Record a completed file. Throws std::runtime_error.
    //
    void
    append (const sha1_digest&, const std::string& name) const;

    // Remove the file once the job is complete.
    //
    void
    clear () const;

  private:
    fs::path file_;
  };
}
