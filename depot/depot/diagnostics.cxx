#include <depot/diagnostics.hxx>

using namespace std;

namespace depot
{
  const char*
  to_string (diagnostic_level l)
  {
    switch (l)
    {
    case diagnostic_level::error:   return "error";
    case diagnostic_level::warning: return "warning";
    case diagnostic_level::info:    return "info";
    case diagnostic_level::trace:   return "trace";
    }
    return "info";
  }

  void stream_sink::
  write (diagnostic_level l, const string& m)
  {
    if (l > threshold_)
      return;

    // Note that we flush on every line. The job runs on its own thread and if
    // the process is taken down by a signal we still want to see the last
    // thing it said.
    //
    lock_guard<mutex> g (mutex_);
    os_ << l << ": " << m << endl;
  }
}
