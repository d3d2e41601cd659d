#include "response_codes.hpp"

namespace smsgate {
namespace sms {

namespace {

struct response_code_s {
   int32_t code;
   const char *message;
};

constexpr response_code_s RESPONSE_CODES[] = {
   {1, "system internal error"},
   {2, "missing PARAM_NAME parameter"},
   {3, "unable to authenticate"},
   {4, "IP ADDRESS is not allowed"},
   {5, "invalid SENDER parameter"},
   {6, "SENDER is not allowed"},
   {7, "invalid NUMBER parameter"},
   {8, "invalid CODING parameter"},
   {9, "unable to convert TEXT"},
   {10, "length of UDH and TEXT too long"},
   {11, "empty TEXT parameter"},
   {12, "invalid TIME parameter"},
   {13, "invalid EXPIRED parameter"},
   {14, "invalid DLR-URL parameter"},
   {15, "Invalid FLAG-FLASH parameter"},
   {16, "invalid FLAG-NOLOG parameter"},
   {17, "invalid FLAG-TEST parameter"},
   {18, "invalid FLAG-NOBL parameter"},
   {19, "invalid FLAG-CONVERT parameter"},
};

} // namespace

const char *response_code_message(const int32_t code) {
   for (auto &entry : RESPONSE_CODES) {
      if (entry.code == code) {
         return entry.message;
      }
   }
   return UNKNOWN_ERROR_MESSAGE;
}

} // namespace sms
} // namespace smsgate
