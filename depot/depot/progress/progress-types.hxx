#pragma once

#include <string>
#include <cstdint>
#include <ostream>

namespace depot
{
  // Raw progress as produced by the transfer engine. Rates are in bytes per
  // second.
  //
  struct progress_sample
  {
    double fraction_complete = 0.0; // [0, 1]
    double download_rate = 0.0;
    double disk_read_rate = 0.0;
    double disk_write_rate = 0.0;
  };

  // Progress as delivered to the observer. Rates are in MiB per second.
  //
  struct progress_event
  {
    double fraction_complete = 0.0;
    double download_mbps = 0.0;
    double disk_read_mbps = 0.0;
    double disk_write_mbps = 0.0;
  };

  constexpr double bytes_per_megabyte = 1024.0 * 1024.0;

  inline progress_event
  to_event (const progress_sample& s) noexcept
  {
    return progress_event {s.fraction_complete,
                           s.download_rate / bytes_per_megabyte,
                           s.disk_read_rate / bytes_per_megabyte,
                           s.disk_write_rate / bytes_per_megabyte};
  }

  // Human-readable sizes and rates (IEC units), for example "1.5 MiB" and
  // "12.3 MiB/s".
  //
  std::string
  format_bytes (std::uint64_t);

  std::string
  format_rate (double bytes_per_second);

  std::ostream&
  operator<< (std::ostream&, const progress_event&);
}
