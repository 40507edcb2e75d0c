#pragma once

#include <atomic>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <unordered_map>

#include <depot/diagnostics.hxx>
#include <depot/engine/chunk-file.hxx>
#include <depot/engine/resume-state.hxx>
#include <depot/engine/worker-process.hxx>
#include <depot/engine/transfer-engine.hxx>
#include <depot/progress/progress-meter.hxx>

namespace depot
{
  // What analyze() decided to do.
  //
  struct chunk_plan
  {
    // Files to write, in processing order.
    //
    std::vector<file_manifest> files;

    // Chunks these files need, in order of first use.
    //
    std::vector<chunk_info> chunks;

    // Number of parts still to be written from each chunk. Once it drops to
    // zero the cached chunk is deleted.
    //
    std::unordered_map<guid, std::size_t, guid_hash> references;

    // Files skipped because they are already in place.
    //
    std::vector<std::string> skipped;

    // One task per chunk plus one per file.
    //
    std::size_t
    tasks () const noexcept
    {
      return chunks.size () + files.size ();
    }
  };

  // Chunk-based transfer engine.
  //
  // Chunks missing from the cache directory are fetched by the worker
  // process, then each file is assembled from its chunk parts, verified,
  // and recorded in the resume file.
  //
  class chunk_engine: public transfer_engine
  {
  public:
    chunk_engine (const engine_config&, diagnostic_sink&);

    void
    analyze (const manifest&,
             const manifest* previous = nullptr,
             bool optimize = false) override;

    void
    run () override;

    bool
    running () const noexcept override
    {
      return running_.load ();
    }

    void
    running (bool v) override
    {
      running_.store (v);
    }

    worker_handle&
    worker () noexcept override
    {
      return worker_;
    }

    const chunk_plan&
    plan () const noexcept
    {
      return plan_;
    }

    // Where a chunk is (or will be) cached.
    //
    fs::path
    chunk_cache_path (const guid&) const;

  private:
    void
    check_running () const;

    void
    download_chunks (const std::vector<const chunk_info*>&);

    void
    write_file (const file_manifest&);

    const std::vector<std::uint8_t>&
    load_chunk (const guid&);

    void
    release_chunk (const guid&);

    void
    task_done ();

    void
    publish (bool force);

  private:
    engine_config config_;
    diagnostic_sink& diag_;
    resume_state resume_;
    process_worker worker_;
    std::atomic<bool> running_ {true};

    std::optional<manifest> manifest_;
    chunk_plan plan_;

    // Most recently loaded chunk.
    //
    guid current_id_;
    std::vector<std::uint8_t> current_data_;

    std::size_t done_ = 0;
    rate_meter download_meter_;
    rate_meter read_meter_;
    rate_meter write_meter_;
    std::uint64_t last_publish_ = 0;
  };
}
