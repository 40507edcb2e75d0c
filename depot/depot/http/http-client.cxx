#include <depot/http/http-client.hxx>

namespace depot
{
  // Explicit instantiations for the default traits so that the bulk of the
  // Beast machinery is compiled once.
  //
  template class basic_http_session<http_client_traits<>>;
  template class basic_http_client<http_client_traits<>>;
}
