#include <iostream>
#include <optional>

#include <crate/common/common.hpp>
#include <crate/externals/aixlog/logger.hpp>

#include "config/config.hpp"
#include "gateway/client.hpp"
#include "transport/curl_transport.hpp"

#include "version.hpp"

namespace {

enum class exit_codes_e {
   OKAY = 0,
   USAGE_OR_CONFIG = 1,
   SEND_FAILED = 2,
   REQUEST_FAILED = 3
};

int to_exit(exit_codes_e code) {
   return static_cast<int>(code);
}

} // namespace

void display_version_info() {
   auto [name, hash, semver] = smsgate::get_version_info().get_data();

   std::cout << name << " | Version: " << semver.major << "." << semver.minor
             << "." << semver.patch << " | Build hash: " << hash << std::endl;
}

int main(int argc, char **argv) {

   if (argc != 4) {
      std::cout << "Usage : " << argv[0] << " <config>.toml <number> <text>"
                << std::endl;
      return to_exit(exit_codes_e::USAGE_OR_CONFIG);
   }

   auto config = smsgate::config::load_configuration(argv[1]);
   if (!config.has_value()) {
      std::cerr << "Unable to load configuration : " << argv[1] << std::endl;
      return to_exit(exit_codes_e::USAGE_OR_CONFIG);
   }

   crate::common::setup_logger(config->app.log_name, AixLog::Severity::debug);

   display_version_info();

   std::optional<smsgate::sms::request_c> request;
   try {
      request = smsgate::config::make_request(*config, argv[2], argv[3]);
   } catch (const smsgate::sms::validation_error_c &e) {
      LOG(ERROR) << TAG("main") << e.what() << "\n";
      return to_exit(exit_codes_e::USAGE_OR_CONFIG);
   }

   smsgate::transport::curl_transport_c transport(config->transport);
   smsgate::gateway::client_c client(config->gateway.base_url, &transport);

   LOG(INFO) << TAG("main") << "Sending message to " << request->number()
             << " via " << client.endpoint() << "\n";

   auto result = client.send(*request);

   if (result.is_success()) {
      std::cout << "Message id: " << result.message_id() << std::endl;
      return to_exit(exit_codes_e::OKAY);
   }

   std::cerr << result.error().describe() << std::endl;

   if (result.error().kind() == smsgate::sms::error_kind_e::REQUEST_FAILED) {
      return to_exit(exit_codes_e::REQUEST_FAILED);
   }
   return to_exit(exit_codes_e::SEND_FAILED);
}
