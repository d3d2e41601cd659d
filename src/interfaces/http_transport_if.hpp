#ifndef SMSGATE_INTERFACE_HTTP_TRANSPORT_HPP
#define SMSGATE_INTERFACE_HTTP_TRANSPORT_HPP

#include <string>
#include <utility>
#include <vector>

namespace smsgate {

//! \brief Ordered key/value pairs sent as a query string
using query_parameters_t = std::vector<std::pair<std::string, std::string>>;

//! \brief Error raised by a transport when a round trip
//!        could not be completed
struct transport_error_s {
   int code{0};             // Transport specific code (CURLcode for curl)
   std::string description; // Human readable description
};

//! \brief Result of a completed (or failed) HTTP exchange
struct http_response_s {
   bool completed{false};   // true iff a response was received
   long status_code{0};     // HTTP status, only meaningful if completed
   std::string body;        // Raw response body
   transport_error_s error; // Populated iff !completed
};

//! \brief An interface representing an http transport
class http_transport_if {
public:
   virtual ~http_transport_if() {}

   //! \brief Issue a GET request
   //! \param url The url to request, without a query string
   //! \param parameters Parameters to encode into the query string
   //! \returns The response. A response with any HTTP status is
   //!          considered completed, only failures to exchange
   //!          data with the server are reported as errors
   //! \note Implementations must be safe to call from multiple threads
   virtual http_response_s get(const std::string &url,
                               const query_parameters_t &parameters) = 0;
};

} // namespace smsgate

#endif
