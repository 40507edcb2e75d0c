#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include <utility> // std::exchange (boost/asio/awaitable.hpp)
#include <functional>
#include <filesystem>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>

#include <depot/http/http-types.hxx>

namespace depot
{
  namespace fs    = std::filesystem;
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  // HTTP client options.
  //
  template <typename S = std::string>
  struct http_client_traits
  {
    using string_type = S;

    // Connection timeout in milliseconds.
    //
    std::uint32_t connect_timeout = 30000;

    // Per-read timeout in milliseconds. Re-armed for every read so that a
    // slow but steady transfer is never cut off.
    //
    std::uint32_t request_timeout = 60000;

    // Maximum number of redirects to follow.
    //
    std::uint8_t max_redirects = 10;

    // Whether to verify peer certificates.
    //
    bool verify_ssl = true;

    // CA bundle (empty = system default verify paths).
    //
    string_type ssl_cert_file;

    string_type user_agent = string_type ("depot/1.0");
  };

  // Per-client state shared by all requests: options and the TLS context.
  //
  template <typename T = http_client_traits<>>
  class basic_http_session
  {
  public:
    using traits_type = T;

    explicit
    basic_http_session (const traits_type& traits)
      : traits_ (traits), ssl_ctx_ (ssl::context::tlsv12_client)
    {
      configure_ssl ();
    }

    basic_http_session (const basic_http_session&) = delete;
    basic_http_session& operator= (const basic_http_session&) = delete;

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

    ssl::context&
    ssl_context () noexcept
    {
      return ssl_ctx_;
    }

  private:
    void
    configure_ssl ();

  private:
    traits_type traits_;
    ssl::context ssl_ctx_;
  };

  // HTTP GET client on top of Boost.Beast and coroutines.
  //
  // Streams are created on the executor of the calling coroutine so the
  // same client can be used from whatever io_context happens to run the
  // job.
  //
  template <typename T = http_client_traits<>>
  class basic_http_client
  {
  public:
    using traits_type  = T;
    using string_type  = typename traits_type::string_type;
    using session_type = basic_http_session<traits_type>;

    // Progress callback: (bytes_transferred, total_bytes). The total is 0 if
    // the server did not announce a length.
    //
    using progress_callback =
      std::function<void (std::uint64_t, std::uint64_t)>;

    basic_http_client ()
      : session_ (std::make_unique<session_type> (traits_type ())) {}

    explicit
    basic_http_client (const traits_type& traits)
      : session_ (std::make_unique<session_type> (traits)) {}

    basic_http_client (const basic_http_client&) = delete;
    basic_http_client& operator= (const basic_http_client&) = delete;

    // Fetch a resource into memory.
    //
    // The body is consumed chunk by chunk as it arrives and the transfer is
    // aborted as soon as it grows past `limit` bytes. Throws http_error for a
    // non-success status.
    //
    asio::awaitable<std::vector<std::uint8_t>>
    fetch (const string_type& url, std::uint64_t limit);

    // Download a resource into a file, truncating it.
    //
    // Returns the number of bytes written.
    //
    asio::awaitable<std::uint64_t>
    download (const string_type& url,
              const fs::path& file,
              progress_callback progress = nullptr);

    const session_type&
    session () const noexcept
    {
      return *session_;
    }

  private:
    // Body consumer: (data, size, total). Returns false to abort.
    //
    using body_handler =
      std::function<bool (const char*, std::size_t, std::uint64_t)>;

    asio::awaitable<std::uint64_t>
    get (const string_type& url,
         const body_handler&,
         std::uint8_t redirect_count);

    template <typename Stream>
    asio::awaitable<std::uint64_t>
    transfer (Stream&,
              const url_parts&,
              const string_type& url,
              const body_handler&,
              std::uint8_t redirect_count);

  private:
    std::unique_ptr<session_type> session_;
  };

  using http_session = basic_http_session<>;
  using http_client  = basic_http_client<>;
}

#include <depot/http/http-client.ixx>
#include <depot/http/http-client.txx>
