#include <depot/engine/resume-state.hxx>

#include <fstream>
#include <stdexcept>
#include <system_error>

using namespace std;

namespace depot
{
  unordered_map<string, sha1_digest> resume_state::
  load () const
  {
    unordered_map<string, sha1_digest> r;

    if (!fs::exists (file_))
      return r;

    ifstream ifs (file_);
    if (!ifs)
      throw runtime_error ("unable to open " + file_.string ());

    for (string l; getline (ifs, l); )
    {
      if (!l.empty () && l.back () == '\r')
        l.pop_back ();

      size_t p (l.find (':'));
      if (p == string::npos || p + 1 == l.size ())
        continue;

      try
      {
        r[l.substr (p + 1)] = parse_sha1 (l.substr (0, p));
      }
      catch (const invalid_argument&)
      {
        // A torn last line from an interrupted write. The file will be
        // redone.
      }
    }

    if (ifs.bad ())
      throw runtime_error ("unable to read " + file_.string ());

    return r;
  }

  void resume_state::
  append (const sha1_digest& h, const string& n) const
  {
    ofstream ofs (file_, ios::app);
    ofs << to_hex (h) << ':' << n << '\n';
    ofs.flush ();

    if (!ofs)
      throw runtime_error ("unable to write " + file_.string ());
  }

  void resume_state::
  clear () const
  {
    error_code ec;
    fs::remove (file_, ec);

    if (ec)
      throw runtime_error ("unable to remove " + file_.string () + ": " +
                           ec.message ());
  }
}
