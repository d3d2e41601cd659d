#ifndef SMSGATE_SMS_RESPONSE_CODES_HPP
#define SMSGATE_SMS_RESPONSE_CODES_HPP

#include <cstdint>

namespace smsgate {
namespace sms {

//! \brief Highest value the gateway uses for an error code.
//!        Anything above is the id of an accepted message
constexpr int32_t MAX_ERROR_CODE = 100;

//! \brief Message used for codes without an entry and for unreadable responses
constexpr char UNKNOWN_ERROR_MESSAGE[] = "unknown error";

//! \brief Retrieve the human readable meaning of a gateway error code
//! \param code The code returned by the gateway
//! \returns The message for the code, or UNKNOWN_ERROR_MESSAGE
//!          if the gateway does not document it
const char *response_code_message(const int32_t code);

} // namespace sms
} // namespace smsgate

#endif
