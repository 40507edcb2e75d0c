#include <depot/http/http-types.hxx>

#include <vector>
#include <utility>
#include <stdexcept>

using namespace std;

namespace depot
{
  // Note that we are doing this by hand rather than pulling in a URI library.
  // It handles the scheme://host:port/path shape our endpoints have but will
  // not cope with IPv6 literals or user info.
  //
  url_parts
  parse_url (const string& url)
  {
    url_parts r;
    size_t pos (0);

    size_t p (url.find ("://"));
    if (p != string::npos)
    {
      r.scheme = url.substr (0, p);
      pos = p + 3;
    }
    else
      r.scheme = "http";

    // The authority ends at the first slash, query or fragment.
    //
    size_t end (url.find_first_of ("/?#", pos));
    if (end == string::npos)
      end = url.size ();

    string auth (url.substr (pos, end - pos));
    size_t colon (auth.find (':'));

    if (colon != string::npos)
    {
      r.host = auth.substr (0, colon);
      r.port = auth.substr (colon + 1);
    }
    else
    {
      r.host = auth;
      r.port = r.secure () ? "443" : "80";
    }

    if (r.host.empty ())
      throw invalid_argument ("no host in URL '" + url + "'");

    if (end < url.size ())
    {
      r.target = url.substr (end);

      if (r.target[0] != '/')
        r.target.insert (0, 1, '/');
    }
    else
      r.target = "/";

    return r;
  }

  // Remove `.` and `..` segments from an absolute path.
  //
  static string
  remove_dot_segments (const string& path)
  {
    vector<string> segs;
    size_t pos (1);

    for (;;)
    {
      size_t e (path.find ('/', pos));
      string s (path.substr (pos, e == string::npos ? e : e - pos));
      bool dot (s == "." || s == "..");

      if (s == "..")
      {
        if (!segs.empty ())
          segs.pop_back ();
      }
      else if (s != ".")
        segs.push_back (move (s));

      // A trailing dot segment still denotes a directory.
      //
      if (e == string::npos)
      {
        if (dot)
          segs.emplace_back ();
        break;
      }

      pos = e + 1;
    }

    string r;
    for (const string& s: segs)
      r += '/' + s;

    return r.empty () ? "/" : r;
  }

  string
  resolve_url (const url_parts& b, const string& ref)
  {
    // Has a scheme of its own.
    //
    size_t p (ref.find ("://"));
    if (p != string::npos && ref.find_first_of ("/?#") > p)
      return ref;

    if (ref.compare (0, 2, "//") == 0)
      return b.scheme + ':' + ref;

    string r (b.scheme + "://" + b.host);

    if (b.port != (b.secure () ? "443" : "80"))
      r += ':' + b.port;

    // Target without its query (and fragment).
    //
    string path (b.target.substr (0, b.target.find_first_of ("?#")));

    if (ref.empty ())
      return r + b.target;

    if (ref[0] == '?')
      return r + path + ref;

    // Split off the query so that it does not take part in dot segment
    // removal.
    //
    size_t q (ref.find_first_of ("?#"));
    string rp (ref.substr (0, q));
    string rq (q != string::npos ? ref.substr (q) : string ());

    if (rp.empty ())
      return r + path + rq;

    if (rp[0] != '/')
      rp = path.substr (0, path.rfind ('/') + 1) + rp;

    return r + remove_dot_segments (rp) + rq;
  }

  string
  join_url (const string& b, const string& p)
  {
    if (b.empty ())
      return p;

    if (p.empty ())
      return b;

    bool bs (b.back () == '/');
    bool ps (p.front () == '/');

    if (bs && ps)
      return b + p.substr (1);

    if (!bs && !ps)
      return b + '/' + p;

    return b + p;
  }

  http_error::
  http_error (uint16_t s, string r, string u)
    : runtime_error ("HTTP " + std::to_string (s) +
                     (r.empty () ? string () : ' ' + r) +
                     " for " + u),
      status_ (s),
      reason_ (move (r)),
      url_ (move (u))
  {
  }
}
