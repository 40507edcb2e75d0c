#pragma once

#include <string>
#include <cstdint>
#include <ostream>
#include <stdexcept>

namespace depot
{
  // HTTP status code.
  //
  // Only the codes we actually make decisions on are spelled out. Anything
  // else is carried around as its numeric value.
  //
  enum class http_status : std::uint16_t
  {
    ok                    = 200,
    partial_content       = 206,
    moved_permanently     = 301,
    found                 = 302,
    see_other             = 303,
    temporary_redirect    = 307,
    permanent_redirect    = 308,
    bad_request           = 400,
    forbidden             = 403,
    not_found             = 404,
    internal_server_error = 500,
    service_unavailable   = 503
  };

  inline std::ostream&
  operator<< (std::ostream& o, http_status s)
  {
    return o << static_cast<std::uint16_t> (s);
  }

  inline bool
  is_success (std::uint16_t s) noexcept
  {
    return s >= 200 && s < 300;
  }

  inline bool
  is_redirection (std::uint16_t s) noexcept
  {
    return s >= 300 && s < 400;
  }

  // URL components as far as the client is concerned.
  //
  struct url_parts
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;

    bool
    secure () const noexcept
    {
      return scheme == "https";
    }
  };

  // Split `scheme://host[:port][/target]`.
  //
  // A missing scheme defaults to http, a missing target to "/". Throws
  // std::invalid_argument if there is no host.
  //
  url_parts
  parse_url (const std::string&);

  // Resolve a reference, such as the Location of a redirect, against the
  // URL it was received from. Absolute URLs are returned as is. Relative
  // ones (`//host/p`, `/p`, `?q`, `p`, `../p`) take what they lack from the
  // base, with dot segments removed.
  //
  std::string
  resolve_url (const url_parts& base, const std::string& ref);

  // Join a base URL and a relative path with exactly one slash in between.
  //
  std::string
  join_url (const std::string& base, const std::string& path);

  // Server answered with something other than success.
  //
  class http_error: public std::runtime_error
  {
  public:
    http_error (std::uint16_t status, std::string reason, std::string url);

    std::uint16_t
    status () const noexcept
    {
      return status_;
    }

    const std::string&
    reason () const noexcept
    {
      return reason_;
    }

    const std::string&
    url () const noexcept
    {
      return url_;
    }

  private:
    std::uint16_t status_;
    std::string reason_;
    std::string url_;
  };
}
