#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace depot
{
  // Rate meter traits.
  //
  struct rate_meter_traits
  {
    // EWMA smoothing factor (weight of the newest measurement).
    //
    static constexpr double ewma_alpha = 0.2;

    // Minimum interval between two measurements. Updates arriving sooner
    // only accumulate.
    //
    static constexpr std::uint64_t min_update_interval_ms = 500;
  };

  // Current time in microseconds on the steady clock.
  //
  inline std::uint64_t
  current_time_us () noexcept
  {
    using namespace std::chrono;
    auto us (duration_cast<microseconds> (
               steady_clock::now ().time_since_epoch ()));
    return static_cast<std::uint64_t> (us.count ());
  }

  // Smoothed rate of a monotonically growing byte counter.
  //
  // The counter side (add()) may be called from any thread; rate() and
  // update() are meant for the thread that produces samples.
  //
  template <typename T = rate_meter_traits>
  class basic_rate_meter
  {
  public:
    using traits_type = T;

    void
    add (std::uint64_t n) noexcept
    {
      total_.fetch_add (n, std::memory_order_relaxed);
    }

    std::uint64_t
    total () const noexcept
    {
      return total_.load (std::memory_order_relaxed);
    }

    // Take a measurement if enough time has passed since the last one.
    //
    void
    update () noexcept
    {
      update (current_time_us ());
    }

    void
    update (std::uint64_t now_us) noexcept;

    // Bytes per second.
    //
    double
    rate () const noexcept
    {
      return rate_;
    }

    void
    reset () noexcept
    {
      total_.store (0, std::memory_order_relaxed);
      last_total_ = 0;
      last_time_ = 0;
      rate_ = 0.0;
    }

  private:
    std::atomic<std::uint64_t> total_ {0};
    std::uint64_t last_total_ = 0;
    std::uint64_t last_time_ = 0;
    double rate_ = 0.0;
  };

  using rate_meter = basic_rate_meter<>;
}

#include <depot/progress/progress-meter.txx>
