#include <string>
#include <vector>
#include <cstdint>
#include <iostream>
#include <exception>
#include <filesystem>
#include <system_error>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>

#include <depot/version.hxx>
#include <depot/depot-options.hxx>
#include <depot/engine/chunk-file.hxx>
#include <depot/http/http-client.hxx>

namespace depot
{
  using namespace std;

  // Chunk download worker.
  //
  // Reads `<guid>\t<url>\t<path>` lines from stdin until EOF, then downloads
  // them with a bounded number of concurrent connections and reports each
  // one on stdout as `ok\t<guid>\t<bytes>` or `error\t<guid>\t<message>`.
  // The parent may kill us at any point; a chunk only appears at its final
  // path once it is complete and verified.
  //
  struct work_item
  {
    string id;
    string url;
    fs::path path;
  };

  static vector<work_item>
  read_work (istream& is)
  {
    vector<work_item> r;

    for (string l; getline (is, l); )
    {
      if (l.empty ())
        continue;

      size_t a (l.find ('\t'));
      size_t b (a != string::npos ? l.find ('\t', a + 1) : string::npos);

      if (b == string::npos)
        throw runtime_error ("invalid work line '" + l + "'");

      r.push_back (work_item {l.substr (0, a),
                              l.substr (a + 1, b - a - 1),
                              fs::path (l.substr (b + 1))});
    }

    return r;
  }

  // Messages go into a tab-separated line.
  //
  static string
  sanitize (string s)
  {
    for (char& c: s)
      if (c == '\t' || c == '\n' || c == '\r')
        c = ' ';
    return s;
  }

  static asio::awaitable<uint64_t>
  fetch_chunk (http_client& c, const work_item& w)
  {
    fs::path t (w.path);
    t += ".part";

    uint64_t n (co_await c.download (w.url, t));

    // Make sure it is the chunk we asked for and that it is intact before
    // making it visible.
    //
    chunk_data d (read_chunk_file (t));

    if (d.header.id.string () != w.id)
      throw runtime_error ("server returned chunk " + d.header.id.string ());

    fs::rename (t, w.path);
    co_return n;
  }

  static asio::awaitable<void>
  download_loop (http_client& c,
                 const vector<work_item>& ws,
                 size_t& next,
                 bool& failed)
  {
    while (next != ws.size ())
    {
      const work_item& w (ws[next++]);

      try
      {
        uint64_t n (co_await fetch_chunk (c, w));
        cout << "ok\t" << w.id << '\t' << n << endl;
      }
      catch (const exception& e)
      {
        error_code ec;
        fs::path t (w.path);
        t += ".part";
        fs::remove (t, ec);

        cout << "error\t" << w.id << '\t' << sanitize (e.what ()) << endl;
        failed = true;
      }
    }
  }
}

int
main (int argc, char* argv[])
{
  using namespace std;
  using namespace depot;

  try
  {
    worker_options opt (argc, argv);

    if (opt.version ())
    {
      cout << "depot-worker " << DEPOT_VERSION_ID << endl;
      return 0;
    }

    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: depot-worker [options] <work"  << "\n"
        << "options:"                             << "\n";

      opt.print_usage (o);
      return 0;
    }

    vector<work_item> ws (read_work (cin));

    http_client_traits<> t;
    t.connect_timeout = opt.connect_timeout ();
    t.request_timeout = opt.request_timeout ();

    http_client c (t);
    asio::io_context ioc;

    size_t next (0);
    bool failed (false);

    size_t n (opt.jobs () == 0 ? 1 : opt.jobs ());
    for (size_t i (0); i != n && i != ws.size (); ++i)
      asio::co_spawn (ioc,
                      download_loop (c, ws, next, failed),
                      asio::detached);

    ioc.run ();
    return failed ? 1 : 0;
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << endl;
    return 1;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << endl;
    return 1;
  }
}
