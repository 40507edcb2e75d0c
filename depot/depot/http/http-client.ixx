#include <fstream>
#include <stdexcept>

#include <openssl/ssl.h>

namespace depot
{
  template <typename T>
  inline void basic_http_session<T>::
  configure_ssl ()
  {
    if (!traits_.ssl_cert_file.empty ())
      ssl_ctx_.load_verify_file (traits_.ssl_cert_file);
    else
      ssl_ctx_.set_default_verify_paths ();

    ssl_ctx_.set_verify_mode (traits_.verify_ssl
                              ? ssl::verify_peer
                              : ssl::verify_none);

    ssl_ctx_.set_options (ssl::context::default_workarounds |
                          ssl::context::no_sslv2 |
                          ssl::context::no_sslv3 |
                          ssl::context::single_dh_use);
  }

  template <typename T>
  inline asio::awaitable<std::vector<std::uint8_t>> basic_http_client<T>::
  fetch (const string_type& url, std::uint64_t limit)
  {
    std::vector<std::uint8_t> r;

    body_handler h (
      [&r, limit] (const char* d, std::size_t n, std::uint64_t total)
      {
        // If the server told us up front that this is too big, don't even
        // start.
        //
        if (total > limit || r.size () + n > limit)
          return false;

        if (r.empty () && total != 0)
          r.reserve (static_cast<std::size_t> (total));

        r.insert (r.end (),
                  reinterpret_cast<const std::uint8_t*> (d),
                  reinterpret_cast<const std::uint8_t*> (d) + n);
        return true;
      });

    co_await get (url, h, 0);
    co_return r;
  }

  template <typename T>
  inline asio::awaitable<std::uint64_t> basic_http_client<T>::
  download (const string_type& url,
            const fs::path& file,
            progress_callback progress)
  {
    std::ofstream ofs (file, std::ios::binary | std::ios::trunc);
    if (!ofs)
      throw std::runtime_error ("unable to open " + file.string () +
                                " for writing");

    std::uint64_t off (0);

    body_handler h (
      [&ofs, &off, &progress] (const char* d,
                               std::size_t n,
                               std::uint64_t total)
      {
        if (!ofs.write (d, static_cast<std::streamsize> (n)))
          return false;

        off += n;

        if (progress)
          progress (off, total);

        return true;
      });

    std::uint64_t r (co_await get (url, h, 0));

    ofs.flush ();
    if (!ofs)
      throw std::runtime_error ("unable to write " + file.string ());

    co_return r;
  }
}
