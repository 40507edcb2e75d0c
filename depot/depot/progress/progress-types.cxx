#include <depot/progress/progress-types.hxx>

#include <iomanip>
#include <sstream>

using namespace std;

namespace depot
{
  static const char* const units[] = {"B", "KiB", "MiB", "GiB", "TiB"};

  // Scale the value down to the largest unit it does not drop below 1 in.
  //
  static size_t
  scale (double& v)
  {
    size_t i (0);
    for (; v >= 1024.0 && i + 1 != sizeof (units) / sizeof (units[0]); ++i)
      v /= 1024.0;
    return i;
  }

  string
  format_bytes (uint64_t n)
  {
    double v (static_cast<double> (n));
    size_t u (scale (v));

    ostringstream o;
    o << fixed << setprecision (u == 0 ? 0 : 1) << v << ' ' << units[u];
    return o.str ();
  }

  string
  format_rate (double bps)
  {
    double v (bps < 0.0 ? 0.0 : bps);
    size_t u (scale (v));

    // No fraction for bytes, "500 B/s" rather than "500.0 B/s".
    //
    ostringstream o;
    o << fixed << setprecision (u == 0 ? 0 : 1) << v << ' ' << units[u]
      << "/s";
    return o.str ();
  }

  ostream&
  operator<< (ostream& o, const progress_event& e)
  {
    ios::fmtflags f (o.flags ());
    streamsize p (o.precision ());

    o << fixed << setprecision (1)
      << e.fraction_complete * 100.0 << "% "
      << setprecision (2)
      << "down " << e.download_mbps << " MiB/s, "
      << "read " << e.disk_read_mbps << " MiB/s, "
      << "write " << e.disk_write_mbps << " MiB/s";

    o.flags (f);
    o.precision (p);
    return o;
  }
}
