#include "result.hpp"

#include <utility>

namespace smsgate {
namespace sms {

sms_error_c::sms_error_c(error_kind_e kind, std::string number,
                         std::string message,
                         transport_error_s transport_error)
    : _kind(kind), _number(std::move(number)), _message(std::move(message)),
      _transport_error(std::move(transport_error)) {}

sms_error_c sms_error_c::send_failed(std::string number, std::string message) {
   return sms_error_c(error_kind_e::SEND_FAILED, std::move(number),
                      std::move(message), transport_error_s{});
}

sms_error_c sms_error_c::request_failed(transport_error_s transport_error) {
   std::string message = transport_error.description;
   return sms_error_c(error_kind_e::REQUEST_FAILED, "", std::move(message),
                      std::move(transport_error));
}

std::string sms_error_c::describe() const {
   if (_kind == error_kind_e::REQUEST_FAILED) {
      return "HTTP request failed: " + _message;
   }
   return "SMS sending failed to: " + _number + ", " + _message;
}

} // namespace sms
} // namespace smsgate
