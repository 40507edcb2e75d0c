#include <depot/engine/worker-process.hxx>

#include <thread>
#include <chrono>
#include <stdexcept>

#include <signal.h>

using namespace std;

namespace depot
{
  bool process_worker::
  spawn (const fs::path& p, const vector<string>& args)
  {
    lock_guard<mutex> l (mutex_);

    if (terminated_)
      return false;

    if (child_ != nullptr)
      throw logic_error ("worker process already spawned");

    // Writing to the pipe of a worker that was killed must fail with EPIPE
    // rather than take us down with it.
    //
    ::signal (SIGPIPE, SIG_IGN);

    child_ = make_unique<bp::child> (p.string (),
                                     bp::args (args),
                                     bp::std_in < in_,
                                     bp::std_out > out_);
    return true;
  }

  void process_worker::
  terminate ()
  {
    lock_guard<mutex> l (mutex_);

    terminated_ = true;

    if (child_ != nullptr && child_->running ())
    {
      child_->terminate ();
      killed_ = true;
    }
  }

  bool process_worker::
  active ()
  {
    lock_guard<mutex> l (mutex_);
    return child_ != nullptr && child_->running ();
  }

  bool process_worker::
  terminated () const
  {
    lock_guard<mutex> l (mutex_);
    return terminated_;
  }

  void process_worker::
  close_input ()
  {
    in_.flush ();
    in_.pipe ().close ();
  }

  optional<int> process_worker::
  wait ()
  {
    // Poll rather than block in waitpid() so that terminate() can still get
    // the lock while we wait.
    //
    for (;;)
    {
      {
        lock_guard<mutex> l (mutex_);

        if (child_ == nullptr)
          throw logic_error ("worker process not spawned");

        if (killed_)
          return nullopt;

        if (!child_->running ())
          return child_->exit_code ();
      }

      this_thread::sleep_for (chrono::milliseconds (10));
    }
  }
}
