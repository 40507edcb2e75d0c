namespace depot
{
  template <typename T>
  void basic_rate_meter<T>::
  update (std::uint64_t t) noexcept
  {
    std::uint64_t n (total_.load (std::memory_order_relaxed));

    // First call only establishes the baseline.
    //
    if (last_time_ == 0)
    {
      last_time_ = t;
      last_total_ = n;
      return;
    }

    // Throttle.
    //
    // Measuring over very short intervals is mostly noise, so we wait until
    // at least the minimum interval has elapsed.
    //
    std::uint64_t dt (t > last_time_ ? t - last_time_ : 0);
    if (dt < traits_type::min_update_interval_ms * 1000)
      return;

    std::uint64_t dn (n > last_total_ ? n - last_total_ : 0);
    double inst (static_cast<double> (dn) /
                 (static_cast<double> (dt) / 1000000.0));

    // EWMA, seeded with the first measurement.
    //
    if (rate_ == 0.0)
      rate_ = inst;
    else
      rate_ = traits_type::ewma_alpha * inst +
              (1.0 - traits_type::ewma_alpha) * rate_;

    last_time_ = t;
    last_total_ = n;
  }
}
