#include <depot/progress/progress-channel.hxx>

#include <memory>

using namespace std;

namespace depot
{
  progress_channel::
  ~progress_channel ()
  {
    unique_ptr<progress_sample> p (slot_.exchange (nullptr));
  }

  void progress_channel::
  publish (const progress_sample& s)
  {
    unique_ptr<progress_sample> p (make_unique<progress_sample> (s));
    unique_ptr<progress_sample> old (slot_.exchange (p.release ()));

    // Only the first sample after a drain triggers a wakeup.
    //
    if (!pending_.exchange (true) && notify_)
      notify_ ();
  }

  optional<progress_sample> progress_channel::
  drain ()
  {
    // Clear the pending flag before taking the slot: a sample published in
    // between is either taken now or triggers another wakeup, never lost.
    //
    pending_.store (false);

    unique_ptr<progress_sample> p (slot_.exchange (nullptr));
    if (p == nullptr)
      return nullopt;

    return *p;
  }
}
