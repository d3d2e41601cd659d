#include "client.hpp"

#include <crate/externals/aixlog/logger.hpp>
#include <cctype>
#include <charconv>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <utility>

#include "sms/response_codes.hpp"
#include "transport/curl_transport.hpp"

namespace smsgate {
namespace gateway {

namespace {

constexpr char SEND_PATH[] = "/send";

struct flag_parameter_s {
   sms::flag_e flag;
   const char *key;
   const char *value;
};

// The gateway expects 3 for nolog, every other flag is enabled with 1
constexpr flag_parameter_s FLAG_PARAMETERS[] = {
   {sms::flag_e::DEBUG, "flag-debug", "1"},
   {sms::flag_e::NOLOG, "flag-nolog", "3"},
   {sms::flag_e::FLASH, "flag-flash", "1"},
   {sms::flag_e::TEST, "flag-test", "1"},
   {sms::flag_e::NOBL, "flag-nobl", "1"},
   {sms::flag_e::CONVERT, "flag-convert", "1"},
};

std::string trim(const std::string &value) {
   auto begin = value.begin();
   auto end = value.end();
   while (begin != end && std::isspace(static_cast<unsigned char>(*begin))) {
      ++begin;
   }
   while (end != begin && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
      --end;
   }
   return std::string(begin, end);
}

// The whole string has to be a 32 bit number, "12abc" and
// values out of range are not accepted
std::optional<int32_t> parse_code(const std::string &text) {
   if (text.empty()) {
      return {};
   }

   const char *first = text.data();
   const char *last = text.data() + text.size();

   // from_chars does not accept a leading '+'
   if (*first == '+') {
      ++first;
      if (first == last || *first == '-') {
         return {};
      }
   }

   int32_t value{0};
   auto [ptr, ec] = std::from_chars(first, last, value);
   if (ec != std::errc() || ptr != last) {
      return {};
   }
   return {value};
}

} // namespace

client_c::client_c(std::string base_url)
    : client_c(std::move(base_url), nullptr) {
   _owned_transport = std::make_unique<transport::curl_transport_c>();
   _transport = _owned_transport.get();
}

client_c::client_c(std::string base_url, smsgate::http_transport_if *transport)
    : _base_url(std::move(base_url)), _transport(transport) {

   while (!_base_url.empty() && _base_url.back() == '/') {
      _base_url.pop_back();
   }
   _endpoint = _base_url + SEND_PATH;
}

std::string client_c::format_time(const sms::request_c::time_point_t &time) {
   std::time_t seconds = std::chrono::system_clock::to_time_t(
      std::chrono::floor<std::chrono::seconds>(time));

   std::tm utc{};
   gmtime_r(&seconds, &utc);

   std::stringstream ss;
   ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
   return ss.str();
}

query_parameters_t client_c::build_parameters(const sms::request_c &request) {
   query_parameters_t parameters;

   parameters.emplace_back("api-key", request.api_key());
   parameters.emplace_back("sender", request.sender());
   parameters.emplace_back("number", request.wire_number());
   parameters.emplace_back("text", request.text());

   if (request.time().has_value()) {
      parameters.emplace_back("time", format_time(*request.time()));
   }

   if (request.dlr_url().has_value()) {
      parameters.emplace_back("dlr-url", *request.dlr_url());
   }

   if (request.expiry_minutes().has_value()) {
      parameters.emplace_back("expired",
                              std::to_string(*request.expiry_minutes()));
   }

   for (auto &entry : FLAG_PARAMETERS) {
      if (request.has_flag(entry.flag)) {
         parameters.emplace_back(entry.key, entry.value);
      }
   }

   if (request.user_key().has_value()) {
      parameters.emplace_back("user-key", *request.user_key());
   }

   switch (request.encoding()) {
   case sms::encoding_e::UDH:
      parameters.emplace_back("udh", "1");
      parameters.emplace_back("coding", "1");
      break;
   case sms::encoding_e::EIGHT_BIT:
      parameters.emplace_back("coding", "1");
      break;
   case sms::encoding_e::DEFAULT:
      break;
   }

   return parameters;
}

sms::send_result_c client_c::interpret_response(const std::string &number,
                                                const std::string &body) {
   auto code = parse_code(trim(body));

   if (!code.has_value()) {
      LOG(ERROR) << TAG("client_c::interpret_response")
                 << "SMS sending failed to: " << number << ", "
                 << sms::UNKNOWN_ERROR_MESSAGE << "\n";
      return sms::sms_error_c::send_failed(number, sms::UNKNOWN_ERROR_MESSAGE);
   }

   if (*code > sms::MAX_ERROR_CODE) {
      return sms::send_result_c(*code);
   }

   std::string message = sms::response_code_message(*code);
   LOG(ERROR) << TAG("client_c::interpret_response")
              << "SMS sending failed to: " << number << ", " << message << "\n";
   return sms::sms_error_c::send_failed(number, message);
}

sms::send_result_c client_c::send(const sms::request_c &request) const {

   if (!_transport) {
      LOG(ERROR) << TAG("client_c::send") << "No transport set\n";
      return sms::sms_error_c::request_failed({0, "no transport available"});
   }

   auto response = _transport->get(_endpoint, build_parameters(request));

   if (!response.completed) {
      LOG(ERROR) << TAG("client_c::send") << "HTTP request failed: "
                 << response.error.description << "\n";
      return sms::sms_error_c::request_failed(response.error);
   }

   auto result = interpret_response(request.number(), response.body);

   if (result.is_success()) {
      LOG(DEBUG) << TAG("client_c::send") << "Message to " << request.number()
                 << " accepted with id " << result.message_id() << "\n";
   }
   return result;
}

} // namespace gateway
} // namespace smsgate
