#include <crate/common/common.hpp>
#include "gateway/client.hpp"
#include "interfaces/http_transport_if.hpp"
#include <filesystem>
#include <string>

// This has to be included last as there is a known issue
// described here: https://github.com/cpputest/cpputest/issues/982
//
#include "CppUTest/TestHarness.h"

namespace {
   static constexpr char LOGS[] = "test_gateway_client";
   static constexpr char BASE_URL[] = "https://gateway.example/api";

   //! \brief Transport that records the last request and
   //!        answers with a preset response
   class recording_transport_c : public smsgate::http_transport_if {
   public:
      virtual smsgate::http_response_s get(
         const std::string &url,
         const smsgate::query_parameters_t &parameters) override final {
         calls++;
         last_url = url;
         last_parameters = parameters;
         return response;
      }

      void respond_with(long status, const std::string &body) {
         response = smsgate::http_response_s{};
         response.completed = true;
         response.status_code = status;
         response.body = body;
      }

      void fail_with(int code, const std::string &description) {
         response = smsgate::http_response_s{};
         response.error = {code, description};
      }

      size_t calls{0};
      std::string last_url;
      smsgate::query_parameters_t last_parameters;
      smsgate::http_response_s response;
   };

   recording_transport_c *transport {nullptr};
   smsgate::gateway::client_c *client {nullptr};

   smsgate::sms::request_c make_request() {
      return smsgate::sms::request_c("secret", "ACME", "+15551234567", "hello");
   }
}

TEST_GROUP(gateway_client_test)
{
   void setup() {
      crate::common::setup_logger(LOGS, AixLog::Severity::error);
      transport = new recording_transport_c();
      client = new smsgate::gateway::client_c(BASE_URL, transport);
   }

   void teardown() {
      delete client;
      delete transport;
      std::filesystem::remove_all(std::string(LOGS) + std::string(".log"));
   }
};

TEST(gateway_client_test, endpoint)
{
   STRCMP_EQUAL("https://gateway.example/api/send", client->endpoint().c_str());

   smsgate::gateway::client_c trailing("https://gateway.example/api/", transport);
   STRCMP_EQUAL("https://gateway.example/api/send", trailing.endpoint().c_str());
}

TEST(gateway_client_test, success)
{
   transport->respond_with(200, "4711\n");

   auto request = make_request();
   request.set_flag(smsgate::sms::flag_e::NOLOG);

   auto result = client->send(request);

   CHECK_TRUE(result.is_success());
   LONGS_EQUAL(4711, result.message_id());
   LONGS_EQUAL(1, transport->calls);
   STRCMP_EQUAL("https://gateway.example/api/send", transport->last_url.c_str());

   auto expected = smsgate::gateway::client_c::build_parameters(request);
   CHECK_TRUE(expected == transport->last_parameters);
}

TEST(gateway_client_test, gateway_error)
{
   transport->respond_with(200, "7");

   auto result = client->send(make_request());

   CHECK_FALSE(result.is_success());
   CHECK_TRUE(result.error().kind() == smsgate::sms::error_kind_e::SEND_FAILED);
   STRCMP_EQUAL("+15551234567", result.error().number().c_str());
   STRCMP_EQUAL("invalid NUMBER parameter", result.error().message().c_str());
   LONGS_EQUAL(1, transport->calls);
}

TEST(gateway_client_test, http_status_does_not_decide_outcome)
{
   transport->respond_with(500, "3");

   auto result = client->send(make_request());
   CHECK_TRUE(result.error().kind() == smsgate::sms::error_kind_e::SEND_FAILED);
   STRCMP_EQUAL("unable to authenticate", result.error().message().c_str());

   transport->respond_with(404, "555");
   result = client->send(make_request());
   CHECK_TRUE(result.is_success());
   LONGS_EQUAL(555, result.message_id());
}

TEST(gateway_client_test, transport_failure)
{
   transport->fail_with(7, "Couldn't connect to server");

   auto result = client->send(make_request());

   CHECK_FALSE(result.is_success());
   CHECK_TRUE(result.error().kind() == smsgate::sms::error_kind_e::REQUEST_FAILED);
   LONGS_EQUAL(7, result.error().transport_error().code);
   STRCMP_EQUAL("Couldn't connect to server",
                result.error().transport_error().description.c_str());
   STRCMP_EQUAL("HTTP request failed: Couldn't connect to server",
                result.error().describe().c_str());
   LONGS_EQUAL(1, transport->calls);
}

TEST(gateway_client_test, transport_failure_with_numeric_body)
{
   // A body left over from a failed exchange must never be read as a code
   transport->fail_with(28, "Timeout was reached");
   transport->response.body = "7";

   auto result = client->send(make_request());
   CHECK_TRUE(result.error().kind() == smsgate::sms::error_kind_e::REQUEST_FAILED);
}

TEST(gateway_client_test, missing_transport)
{
   smsgate::gateway::client_c detached(BASE_URL, nullptr);

   auto result = detached.send(make_request());
   CHECK_TRUE(result.error().kind() == smsgate::sms::error_kind_e::REQUEST_FAILED);
}
