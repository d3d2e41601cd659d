#ifndef SMSGATE_CONFIG_HPP
#define SMSGATE_CONFIG_HPP

#include <cstdint>
#include <optional>
#include <set>
#include <string>

#include "sms/request.hpp"
#include "transport/curl_transport.hpp"

namespace smsgate {
namespace config {

/*
      Application configuration
*/
struct app_configuration_s {
   std::string log_name;
};

/*
      Gateway configuration
*/
struct gateway_configuration_s {
   std::string base_url;
   std::string api_key;
   std::string sender;
};

/*
      Defaults applied to every outgoing message
*/
struct message_configuration_s {
   std::optional<std::string> dlr_url;
   std::optional<int32_t> expiry_minutes;
   std::optional<std::string> user_key;
   sms::encoding_e encoding{sms::encoding_e::EIGHT_BIT};
   std::set<sms::flag_e> flags;
};

//! \brief Complete configuration of the application
struct configuration_c {
   app_configuration_s app;
   gateway_configuration_s gateway;
   message_configuration_s message;
   transport::curl_transport_c::configuration_c transport;
};

//! \brief Load a configuration file
//! \param file Path to a toml file
//! \returns The configuration, empty if the file could not
//!          be read or is incomplete. Problems are logged
std::optional<configuration_c> load_configuration(const std::string &file);

//! \brief Load a configuration from toml text
std::optional<configuration_c> parse_configuration(const std::string &text);

//! \brief Create a request for a destination using the gateway
//!        credentials and message defaults of a configuration
//! \throws sms::validation_error_c if number or text are empty
sms::request_c make_request(const configuration_c &config,
                            const std::string &number,
                            const std::string &text);

} // namespace config
} // namespace smsgate

#endif
