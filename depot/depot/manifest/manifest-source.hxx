#pragma once

#include <string>
#include <memory>
#include <cstdint>
#include <utility> // std::exchange (boost/asio/awaitable.hpp)

#include <boost/asio/awaitable.hpp>

#include <depot/http/http-client.hxx>
#include <depot/manifest/manifest-types.hxx>

namespace depot
{
  namespace asio = boost::asio;

  // Return true if the manifest spec is an http(s) URL.
  //
  // Recognition is deliberately strict: anything that does not look like a
  // complete URL (host with a top-level domain) is treated as a path.
  //
  bool
  is_manifest_url (const std::string&);

  // Remote fetch strategy.
  //
  class remote_fetcher
  {
  public:
    virtual
    ~remote_fetcher () = default;

    // Fetch the resource or throw (http_error, system_error, ...).
    //
    virtual asio::awaitable<manifest_bytes>
    fetch (const std::string& url) = 0;
  };

  // Fetch over HTTP(S) with the Beast client.
  //
  class http_fetcher: public remote_fetcher
  {
  public:
    static constexpr std::uint64_t max_manifest_size = 256 * 1024 * 1024;

    http_fetcher () = default;

    explicit
    http_fetcher (const http_client_traits<>& t)
      : client_ (t) {}

    asio::awaitable<manifest_bytes>
    fetch (const std::string&) override;

  private:
    http_client client_;
  };

  // Manifest source.
  //
  // Turn a manifest spec into raw bytes: fetch it if it is a URL, read it
  // otherwise. Exactly one of the two is attempted and it is never retried.
  // Any failure is reported as manifest_unavailable.
  //
  class manifest_source
  {
  public:
    // Use the default HTTP fetcher.
    //
    manifest_source ();

    explicit
    manifest_source (std::shared_ptr<remote_fetcher>);

    asio::awaitable<manifest_bytes>
    resolve (const std::string& spec);

    // Synchronous local read. Throws manifest_unavailable.
    //
    static manifest_bytes
    read_file (const fs::path&);

  private:
    std::shared_ptr<remote_fetcher> fetcher_;
  };
}
