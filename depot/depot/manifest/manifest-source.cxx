#include <depot/manifest/manifest-source.hxx>

#include <regex>
#include <fstream>
#include <utility>
#include <iterator>
#include <system_error>
#include <exception>

#include <depot/errors.hxx>

using namespace std;

namespace depot
{
  bool
  is_manifest_url (const string& s)
  {
    static const regex re (
      R"(^https?://(?:www\.)?[-a-zA-Z0-9@:%._\+~#=]{1,256}\.)"
      R"([a-zA-Z0-9()]{1,6}\b(?:[-a-zA-Z0-9()@:%_\+.~#?&=/]*)$)");

    return regex_match (s, re);
  }

  asio::awaitable<manifest_bytes> http_fetcher::
  fetch (const string& url)
  {
    co_return co_await client_.fetch (url, max_manifest_size);
  }

  manifest_source::
  manifest_source ()
    : fetcher_ (make_shared<http_fetcher> ())
  {
  }

  manifest_source::
  manifest_source (shared_ptr<remote_fetcher> f)
    : fetcher_ (f != nullptr ? move (f) : make_shared<http_fetcher> ())
  {
  }

  manifest_bytes manifest_source::
  read_file (const fs::path& p)
  {
    error_code ec;
    if (fs::is_directory (p, ec))
      throw manifest_unavailable ("manifest " + p.string () +
                                  " is a directory");

    ifstream ifs (p, ios::binary);
    if (!ifs)
      throw manifest_unavailable ("unable to open manifest " + p.string ());

    manifest_bytes r ((istreambuf_iterator<char> (ifs)),
                      istreambuf_iterator<char> ());

    if (ifs.bad ())
      throw manifest_unavailable ("unable to read manifest " + p.string ());

    return r;
  }

  asio::awaitable<manifest_bytes> manifest_source::
  resolve (const string& spec)
  {
    if (!is_manifest_url (spec))
      co_return read_file (spec);

    try
    {
      co_return co_await fetcher_->fetch (spec);
    }
    catch (const exception& e)
    {
      throw manifest_unavailable ("unable to fetch manifest from " + spec +
                                  ": " + e.what ());
    }
  }
}
