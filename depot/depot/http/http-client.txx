#include <chrono>
#include <limits>
#include <stdexcept>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace depot
{
  template <typename T>
  asio::awaitable<std::uint64_t> basic_http_client<T>::
  get (const string_type& url,
       const body_handler& h,
       std::uint8_t redirect_count)
  {
    using namespace std::chrono;
    using tcp = asio::ip::tcp;

    const auto& tr (session_->traits ());

    if (redirect_count >= tr.max_redirects)
      throw std::runtime_error ("maximum redirects exceeded for " + url);

    url_parts parts (parse_url (url));
    auto ex (co_await asio::this_coro::executor);

    tcp::resolver rslv (ex);
    auto addrs (co_await rslv.async_resolve (parts.host,
                                             parts.port,
                                             asio::use_awaitable));

    // Depending on the scheme we either talk plain TCP or wrap it into TLS.
    // Note that for TLS the handshake has to happen before we can say
    // anything in HTTP.
    //
    if (parts.secure ())
    {
      beast::ssl_stream<beast::tcp_stream> s (ex, session_->ssl_context ());

      // Without SNI a lot of CDNs will hand us the wrong certificate or
      // refuse the handshake outright. Beast doesn't wrap this so drop down
      // to OpenSSL.
      //
      if (!SSL_set_tlsext_host_name (s.native_handle (), parts.host.c_str ()))
      {
        beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                              asio::error::get_ssl_category ());
        throw beast::system_error (ec, "unable to set SNI hostname");
      }

      auto& layer (beast::get_lowest_layer (s));
      layer.expires_after (milliseconds (tr.connect_timeout));
      co_await layer.async_connect (addrs, asio::use_awaitable);

      co_await s.async_handshake (ssl::stream_base::client,
                                  asio::use_awaitable);

      std::uint64_t r (
        co_await transfer (s, parts, url, h, redirect_count));

      // Many servers never send close_notify and waiting for it can block
      // until the timeout, so just drop the socket.
      //
      beast::error_code ec;
      layer.socket ().shutdown (tcp::socket::shutdown_both, ec);
      co_return r;
    }
    else
    {
      beast::tcp_stream s (ex);
      s.expires_after (milliseconds (tr.connect_timeout));
      co_await s.async_connect (addrs, asio::use_awaitable);

      std::uint64_t r (
        co_await transfer (s, parts, url, h, redirect_count));

      beast::error_code ec;
      s.socket ().shutdown (tcp::socket::shutdown_both, ec);
      co_return r;
    }
  }

  template <typename T>
  template <typename Stream>
  asio::awaitable<std::uint64_t> basic_http_client<T>::
  transfer (Stream& s,
            const url_parts& parts,
            const string_type& url,
            const body_handler& h,
            std::uint8_t redirect_count)
  {
    using namespace std::chrono;
    namespace http = beast::http;

    const auto& tr (session_->traits ());
    auto& layer (beast::get_lowest_layer (s));

    http::request<http::empty_body> req;
    req.method (http::verb::get);
    req.target (parts.target);
    req.version (11);
    req.set (http::field::host, parts.host);
    req.set (http::field::user_agent, tr.user_agent);
    req.set (http::field::accept, "*/*");

    layer.expires_after (milliseconds (tr.request_timeout));
    co_await http::async_write (s, req, asio::use_awaitable);

    beast::flat_buffer b;
    http::response_parser<http::buffer_body> p;
    p.body_limit (std::numeric_limits<std::uint64_t>::max ());

    co_await http::async_read_header (s, b, p, asio::use_awaitable);

    std::uint16_t st (static_cast<std::uint16_t> (p.get ().result_int ()));

    // Follow redirects by starting over on the new location. The stream of
    // this frame is torn down by its destructor once we return.
    //
    if (is_redirection (st))
    {
      auto loc (p.get ()[http::field::location]);
      if (!loc.empty ())
        co_return co_await get (
          string_type (resolve_url (parts, std::string (loc))),
          h,
          redirect_count + 1);
    }

    if (!is_success (st))
      throw http_error (st, std::string (p.get ().reason ()), url);

    std::uint64_t total (p.content_length () ? *p.content_length () : 0);
    std::uint64_t n (0);

    char buf[16384];

    while (!p.is_done ())
    {
      p.get ().body ().data = buf;
      p.get ().body ().size = sizeof (buf);

      // Re-arm the timeout for every read so a large but healthy transfer
      // is not cut off half way.
      //
      layer.expires_after (milliseconds (tr.request_timeout));

      beast::error_code ec;
      co_await http::async_read (
        s, b, p, asio::redirect_error (asio::use_awaitable, ec));

      // need_buffer only means our buffer is full, which is the whole point.
      //
      if (ec && ec != http::error::need_buffer)
        throw beast::system_error (ec, "unable to read body of " + url);

      std::size_t k (sizeof (buf) - p.get ().body ().size);

      if (k != 0)
      {
        if (!h (buf, k, total))
          throw std::runtime_error ("transfer of " + url + " aborted");

        n += k;
      }
    }

    co_return n;
  }
}
