#include <depot/http/http-types.hxx>

#include <string>
#include <cassert>
#include <stdexcept>

using namespace std;
using namespace depot;

static void
test_parse ()
{
  url_parts u (parse_url ("https://cdn.example.com/Builds/app.manifest?x=1"));
  assert (u.scheme == "https");
  assert (u.secure ());
  assert (u.host == "cdn.example.com");
  assert (u.port == "443");
  assert (u.target == "/Builds/app.manifest?x=1");

  url_parts p (parse_url ("http://localhost:8080"));
  assert (!p.secure ());
  assert (p.host == "localhost");
  assert (p.port == "8080");
  assert (p.target == "/");

  // What a relative Location header looks like on its own.
  //
  bool thrown (false);
  try
  {
    parse_url ("/Builds/Fortnite/app.manifest");
  }
  catch (const invalid_argument& e)
  {
    thrown = true;
    assert (string (e.what ()).find ("no host") != string::npos);
  }
  assert (thrown);
}

static void
test_resolve ()
{
  url_parts b (parse_url ("https://cdn.example.com/Builds/Live/app.manifest"));

  // Absolute.
  //
  assert (resolve_url (b, "http://mirror.example.org/a.manifest") ==
          "http://mirror.example.org/a.manifest");

  // Scheme-relative.
  //
  assert (resolve_url (b, "//mirror.example.org/a.manifest") ==
          "https://mirror.example.org/a.manifest");

  // Absolute path.
  //
  assert (resolve_url (b, "/Builds/Fortnite/app.manifest") ==
          "https://cdn.example.com/Builds/Fortnite/app.manifest");

  // Relative path, against the directory of the target.
  //
  assert (resolve_url (b, "next.manifest") ==
          "https://cdn.example.com/Builds/Live/next.manifest");

  assert (resolve_url (b, "../Staging/app.manifest?v=2") ==
          "https://cdn.example.com/Builds/Staging/app.manifest?v=2");

  assert (resolve_url (b, "./a/../b.manifest") ==
          "https://cdn.example.com/Builds/Live/b.manifest");

  assert (resolve_url (b, "../../../../top.manifest") ==
          "https://cdn.example.com/top.manifest");

  assert (resolve_url (b, "..") == "https://cdn.example.com/Builds/");

  // Query only.
  //
  assert (resolve_url (b, "?token=abc") ==
          "https://cdn.example.com/Builds/Live/app.manifest?token=abc");

  // The query of the base does not count as part of the path, and a
  // non-default port is carried over.
  //
  url_parts q (parse_url ("http://127.0.0.1:8080/dl/get?id=7"));
  assert (resolve_url (q, "file.manifest") ==
          "http://127.0.0.1:8080/dl/file.manifest");
  assert (resolve_url (q, "/other") == "http://127.0.0.1:8080/other");

  // Whatever comes out parses.
  //
  url_parts r (parse_url (resolve_url (b, "/Builds/Fortnite/app.manifest")));
  assert (r.host == "cdn.example.com");
  assert (r.target == "/Builds/Fortnite/app.manifest");
}

static void
test_join ()
{
  assert (join_url ("https://cdn.example.com/Builds", "ChunksV4/01/a.chunk") ==
          "https://cdn.example.com/Builds/ChunksV4/01/a.chunk");
  assert (join_url ("https://cdn.example.com/Builds/", "/ChunksV4") ==
          "https://cdn.example.com/Builds/ChunksV4");
  assert (join_url ("", "a") == "a");
}

int
main ()
{
  test_parse ();
  test_resolve ();
  test_join ();
}
