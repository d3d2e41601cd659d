#ifndef SMSGATE_SMS_RESULT_HPP
#define SMSGATE_SMS_RESULT_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

#include "interfaces/http_transport_if.hpp"

namespace smsgate {
namespace sms {

//! \brief Id the gateway assigns to an accepted message
using message_id_t = int32_t;

//! \brief Category of a failed send
enum class error_kind_e {
  SEND_FAILED,    // The gateway answered but refused the message
  REQUEST_FAILED  // The HTTP round trip could not be completed
};

//! \brief A failed send
class sms_error_c {
public:
  sms_error_c() = delete;

  //! \brief Create a gateway reported failure
  //! \param number The destination of the message
  //! \param message Reason given for the failure
  static sms_error_c send_failed(std::string number, std::string message);

  //! \brief Create a transport failure
  //! \param transport_error The error reported by the transport
  static sms_error_c request_failed(transport_error_s transport_error);

  error_kind_e kind() const { return _kind; }

  //! \brief Destination number, empty for REQUEST_FAILED
  const std::string &number() const { return _number; }

  //! \brief Reason of the failure
  const std::string &message() const { return _message; }

  //! \brief Underlying transport error, only meaningful for REQUEST_FAILED
  const transport_error_s &transport_error() const { return _transport_error; }

  //! \brief Full single line description of the error
  std::string describe() const;

private:
  sms_error_c(error_kind_e kind, std::string number, std::string message,
              transport_error_s transport_error);

  error_kind_e _kind;
  std::string _number;
  std::string _message;
  transport_error_s _transport_error;
};

//! \brief Outcome of a single send, either a message id or an error
class send_result_c {
public:
  send_result_c(message_id_t id) : _value(id) {}
  send_result_c(sms_error_c error) : _value(std::move(error)) {}

  bool is_success() const {
    return std::holds_alternative<message_id_t>(_value);
  }

  //! \throws std::bad_variant_access if the send failed
  message_id_t message_id() const { return std::get<message_id_t>(_value); }

  //! \throws std::bad_variant_access if the send succeeded
  const sms_error_c &error() const { return std::get<sms_error_c>(_value); }

private:
  std::variant<message_id_t, sms_error_c> _value;
};

} // namespace sms
} // namespace smsgate

#endif
