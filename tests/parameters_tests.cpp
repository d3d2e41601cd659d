#include <crate/common/common.hpp>
#include "gateway/client.hpp"
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

// This has to be included last as there is a known issue
// described here: https://github.com/cpputest/cpputest/issues/982
//
#include "CppUTest/TestHarness.h"

namespace {
   static constexpr char LOGS[] = "test_parameters";

   struct expected_flag_s {
      smsgate::sms::flag_e flag;
      const char *key;
      const char *value;
   };

   const std::vector<expected_flag_s> ALL_FLAGS = {
      {smsgate::sms::flag_e::DEBUG, "flag-debug", "1"},
      {smsgate::sms::flag_e::NOLOG, "flag-nolog", "3"},
      {smsgate::sms::flag_e::FLASH, "flag-flash", "1"},
      {smsgate::sms::flag_e::TEST, "flag-test", "1"},
      {smsgate::sms::flag_e::NOBL, "flag-nobl", "1"},
      {smsgate::sms::flag_e::CONVERT, "flag-convert", "1"},
   };

   smsgate::sms::request_c make_request() {
      return smsgate::sms::request_c("secret", "ACME", "+15551234567", "hi there");
   }

   size_t count_key(const smsgate::query_parameters_t &params, const std::string &key) {
      size_t count = 0;
      for (auto &[k, v] : params) {
         if (k == key) {
            count++;
         }
      }
      return count;
   }

   std::optional<std::string> find_key(const smsgate::query_parameters_t &params,
                                       const std::string &key) {
      for (auto &[k, v] : params) {
         if (k == key) {
            return {v};
         }
      }
      return {};
   }
}

TEST_GROUP(parameters_test)
{
   void setup() {
      crate::common::setup_logger(LOGS, AixLog::Severity::error);
   }

   void teardown() {
      std::filesystem::remove_all(std::string(LOGS) + std::string(".log"));
   }
};

TEST(parameters_test, required_parameters)
{
   auto request = make_request();
   request.set_encoding(smsgate::sms::encoding_e::DEFAULT);

   auto params = smsgate::gateway::client_c::build_parameters(request);

   LONGS_EQUAL(4, params.size());
   STRCMP_EQUAL("secret", find_key(params, "api-key")->c_str());
   STRCMP_EQUAL("ACME", find_key(params, "sender")->c_str());
   STRCMP_EQUAL("15551234567", find_key(params, "number")->c_str());
   STRCMP_EQUAL("hi there", find_key(params, "text")->c_str());

   CHECK_FALSE(find_key(params, "time").has_value());
   CHECK_FALSE(find_key(params, "dlr-url").has_value());
   CHECK_FALSE(find_key(params, "expired").has_value());
   CHECK_FALSE(find_key(params, "user-key").has_value());
}

TEST(parameters_test, number_without_plus_is_unchanged)
{
   smsgate::sms::request_c request("secret", "ACME", "15551234567", "hi");
   auto params = smsgate::gateway::client_c::build_parameters(request);
   STRCMP_EQUAL("15551234567", find_key(params, "number")->c_str());
}

TEST(parameters_test, every_flag_combination)
{
   for (unsigned mask = 0; mask < (1u << ALL_FLAGS.size()); mask++) {

      auto request = make_request();
      size_t expected_flags = 0;
      for (size_t i = 0; i < ALL_FLAGS.size(); i++) {
         if (mask & (1u << i)) {
            request.set_flag(ALL_FLAGS[i].flag);
            expected_flags++;
         }
      }

      auto params = smsgate::gateway::client_c::build_parameters(request);

      size_t flag_params = 0;
      for (auto &[k, v] : params) {
         if (k.rfind("flag-", 0) == 0) {
            flag_params++;
         }
      }
      LONGS_EQUAL(expected_flags, flag_params);

      for (size_t i = 0; i < ALL_FLAGS.size(); i++) {
         auto value = find_key(params, ALL_FLAGS[i].key);
         if (mask & (1u << i)) {
            CHECK_TRUE(value.has_value());
            LONGS_EQUAL(1, count_key(params, ALL_FLAGS[i].key));
            STRCMP_EQUAL(ALL_FLAGS[i].value, value->c_str());
         } else {
            CHECK_FALSE(value.has_value());
         }
      }
   }
}

TEST(parameters_test, encodings)
{
   {
      auto request = make_request();
      request.set_encoding(smsgate::sms::encoding_e::DEFAULT);
      auto params = smsgate::gateway::client_c::build_parameters(request);
      LONGS_EQUAL(0, count_key(params, "udh"));
      LONGS_EQUAL(0, count_key(params, "coding"));
   }
   {
      auto request = make_request();
      request.set_encoding(smsgate::sms::encoding_e::EIGHT_BIT);
      auto params = smsgate::gateway::client_c::build_parameters(request);
      LONGS_EQUAL(0, count_key(params, "udh"));
      LONGS_EQUAL(1, count_key(params, "coding"));
      STRCMP_EQUAL("1", find_key(params, "coding")->c_str());
   }
   {
      auto request = make_request();
      request.set_encoding(smsgate::sms::encoding_e::UDH);
      auto params = smsgate::gateway::client_c::build_parameters(request);
      LONGS_EQUAL(1, count_key(params, "udh"));
      LONGS_EQUAL(1, count_key(params, "coding"));
      STRCMP_EQUAL("1", find_key(params, "udh")->c_str());
      STRCMP_EQUAL("1", find_key(params, "coding")->c_str());
   }
}

TEST(parameters_test, optional_parameters)
{
   auto request = make_request();
   request.set_dlr_url("https://example.com/dlr?id=5")
      .set_expiry_minutes(90)
      .set_user_key("batch-12");

   auto params = smsgate::gateway::client_c::build_parameters(request);

   STRCMP_EQUAL("https://example.com/dlr?id=5", find_key(params, "dlr-url")->c_str());
   STRCMP_EQUAL("90", find_key(params, "expired")->c_str());
   STRCMP_EQUAL("batch-12", find_key(params, "user-key")->c_str());
}

TEST(parameters_test, scheduled_time_format)
{
   using namespace std::chrono;

   // 2024-02-29T13:45:07Z plus some milliseconds
   auto time = system_clock::time_point(seconds(1709214307)) + milliseconds(987);

   auto request = make_request();
   request.set_time(time);

   auto params = smsgate::gateway::client_c::build_parameters(request);
   auto formatted = find_key(params, "time");

   CHECK_TRUE(formatted.has_value());
   STRCMP_EQUAL("2024-02-29T13:45:07", formatted->c_str());
}

TEST(parameters_test, time_formatting)
{
   using namespace std::chrono;

   STRCMP_EQUAL("1970-01-01T00:00:00",
      smsgate::gateway::client_c::format_time(system_clock::time_point()).c_str());

   STRCMP_EQUAL("1999-12-31T23:59:59",
      smsgate::gateway::client_c::format_time(
         system_clock::time_point(seconds(946684799)) + microseconds(999999)).c_str());
}
