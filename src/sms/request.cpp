#include "request.hpp"

#include <utility>

namespace smsgate {
namespace sms {

namespace {

struct flag_name_s {
   flag_e flag;
   const char *name;
};

constexpr flag_name_s FLAG_NAMES[] = {
   {flag_e::DEBUG, "debug"},
   {flag_e::NOLOG, "nolog"},
   {flag_e::FLASH, "flash"},
   {flag_e::TEST, "test"},
   {flag_e::NOBL, "nobl"},
   {flag_e::CONVERT, "convert"},
};

void require(const std::string &value, const char *field) {
   if (value.empty()) {
      throw validation_error_c(field);
   }
}

} // namespace

std::optional<flag_e> flag_from_string(const std::string &name) {
   for (auto &entry : FLAG_NAMES) {
      if (name == entry.name) {
         return {entry.flag};
      }
   }
   return {};
}

std::optional<encoding_e> encoding_from_string(const std::string &name) {
   if (name == "default") {
      return {encoding_e::DEFAULT};
   }
   if (name == "8bit") {
      return {encoding_e::EIGHT_BIT};
   }
   if (name == "udh") {
      return {encoding_e::UDH};
   }
   return {};
}

std::string to_string(const flag_e flag) {
   for (auto &entry : FLAG_NAMES) {
      if (entry.flag == flag) {
         return entry.name;
      }
   }
   return "unknown";
}

std::string to_string(const encoding_e encoding) {
   switch (encoding) {
   case encoding_e::DEFAULT:
      return "default";
   case encoding_e::EIGHT_BIT:
      return "8bit";
   case encoding_e::UDH:
      return "udh";
   }
   return "unknown";
}

validation_error_c::validation_error_c(const std::string &field)
    : std::invalid_argument("Request field '" + field + "' can not be empty"),
      _field(field) {}

request_c::request_c(std::string api_key, std::string sender,
                     std::string number, std::string text)
    : _api_key(std::move(api_key)), _sender(std::move(sender)),
      _number(std::move(number)), _text(std::move(text)) {

   require(_api_key, "api_key");
   require(_sender, "sender");
   require(_number, "number");
   require(_text, "text");
}

request_c &request_c::set_time(time_point_t time) {
   _time = time;
   return *this;
}

request_c &request_c::set_dlr_url(std::string url) {
   _dlr_url = std::move(url);
   return *this;
}

request_c &request_c::set_expiry_minutes(int32_t minutes) {
   _expiry_minutes = minutes;
   return *this;
}

request_c &request_c::set_user_key(std::string user_key) {
   _user_key = std::move(user_key);
   return *this;
}

request_c &request_c::set_encoding(encoding_e encoding) {
   _encoding = encoding;
   return *this;
}

request_c &request_c::set_flag(flag_e flag) {
   _flags.insert(flag);
   return *this;
}

request_c &request_c::set_flags(std::set<flag_e> flags) {
   _flags = std::move(flags);
   return *this;
}

request_c &request_c::clear_flag(flag_e flag) {
   _flags.erase(flag);
   return *this;
}

bool request_c::has_flag(flag_e flag) const {
   return _flags.find(flag) != _flags.end();
}

std::string request_c::wire_number() const {
   if (!_number.empty() && _number.front() == '+') {
      return _number.substr(1);
   }
   return _number;
}

} // namespace sms
} // namespace smsgate
