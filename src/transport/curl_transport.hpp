#ifndef SMSGATE_TRANSPORT_CURL_TRANSPORT_HPP
#define SMSGATE_TRANSPORT_CURL_TRANSPORT_HPP

#include "interfaces/http_transport_if.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace smsgate {
namespace transport {

//! \brief HTTP transport backed by libcurl
class curl_transport_c : public smsgate::http_transport_if {
public:
  //! \brief Configuration for the transport
  struct configuration_c {
    uint64_t timeout_ms{0};         // Whole request timeout, 0 for none
    uint64_t connect_timeout_ms{0}; // Connection timeout, 0 for curl default
  };

  curl_transport_c();

  //! \brief Create the transport with a given
  //!        configuration struct
  curl_transport_c(configuration_c config);

  // From http_transport_if
  virtual http_response_s get(const std::string &url,
                              const query_parameters_t &parameters) override final;

  //! \brief Build the full url with an encoded query string
  //! \param url Url without a query string
  //! \param parameters Parameters to percent encode and append
  //! \returns url?key=value&... or the url itself if
  //!          there are no parameters. Empty if a parameter
  //!          could not be encoded
  static std::optional<std::string> encode_url(const std::string &url,
                                const query_parameters_t &parameters);

private:
  configuration_c _config;

  // Write curl response to a stringstream
  static size_t _stream_write(char *, size_t, size_t, void *);
};

} // namespace transport
} // namespace smsgate

#endif
