#ifndef SMSGATE_GATEWAY_CLIENT_HPP
#define SMSGATE_GATEWAY_CLIENT_HPP

#include <memory>
#include <string>

#include "interfaces/http_transport_if.hpp"
#include "sms/request.hpp"
#include "sms/result.hpp"

namespace smsgate {
namespace gateway {

//! \brief Client for the SMS gateway. Each send is a single
//!        HTTP GET to {base_url}/send
class client_c {
public:
  client_c() = delete;

  //! \brief Create a client that talks to the gateway over
  //!        its own curl transport
  //! \param base_url The gateway base url
  //! \note Trailing '/' characters are removed from base_url, both
  //!       "https://gw/api" and "https://gw/api/" send to "https://gw/api/send"
  client_c(std::string base_url);

  //! \brief Create a client that uses a given transport
  //! \param base_url The gateway base url, normalized as above
  //! \param transport The transport to issue requests on,
  //!        it must outlive the client
  client_c(std::string base_url, smsgate::http_transport_if *transport);

  //! \brief Send a message
  //! \param request The message to send
  //! \returns The gateway assigned id, or the reason the message
  //!          could not be sent
  //! \note Safe to call from multiple threads at once
  sms::send_result_c send(const sms::request_c &request) const;

  //! \brief Url requests are sent to
  const std::string &endpoint() const { return _endpoint; }

  //! \brief Build the query parameters for a request
  static query_parameters_t build_parameters(const sms::request_c &request);

  //! \brief Format a timestamp the way the gateway expects it
  //! \returns YYYY-MM-DDTHH:MM:SS in UTC, fractions of a second dropped
  static std::string format_time(const sms::request_c::time_point_t &time);

  //! \brief Turn a gateway response body into a result
  //! \param number The destination the response is for
  //! \param body The raw response body
  static sms::send_result_c interpret_response(const std::string &number,
                                               const std::string &body);

private:
  std::string _base_url;
  std::string _endpoint;
  std::unique_ptr<smsgate::http_transport_if> _owned_transport;
  smsgate::http_transport_if *_transport{nullptr};
};

} // namespace gateway
} // namespace smsgate

#endif
