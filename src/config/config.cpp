#include "config.hpp"

#include <crate/externals/aixlog/logger.hpp>
#include <toml++/toml.h>

namespace smsgate {
namespace config {

namespace {

bool load_required_string(const toml::table &tbl, const char *section,
                          const char *key, std::string &out) {
   std::optional<std::string> value = tbl[section][key].value<std::string>();
   if (!value.has_value()) {
      LOG(ERROR) << TAG("load_config") << "Missing " << section
                 << " config for '" << key << "'\n";
      return false;
   }

   if (value->empty()) {
      LOG(ERROR) << TAG("load_config") << "Config '" << section << "." << key
                 << "' can not be empty\n";
      return false;
   }

   out = *value;
   return true;
}

bool load_timeout(const toml::table &tbl, const char *key, uint64_t &out) {
   auto node = tbl["transport"][key];
   if (!node) {
      return true;
   }

   std::optional<int64_t> value = node.value<int64_t>();
   if (!value.has_value() || *value < 0) {
      LOG(ERROR) << TAG("load_config") << "Transport config '" << key
                 << "' must be a positive integer\n";
      return false;
   }

   out = static_cast<uint64_t>(*value);
   return true;
}

bool load_message(const toml::table &tbl, message_configuration_s &message) {

   if (!tbl["message"]) {
      return true;
   }

   if (auto node = tbl["message"]["dlr_url"]) {
      std::optional<std::string> dlr_url = node.value<std::string>();
      if (!dlr_url.has_value()) {
         LOG(ERROR) << TAG("load_config") << "Message 'dlr_url' must be a string\n";
         return false;
      }
      message.dlr_url = *dlr_url;
   }

   if (auto node = tbl["message"]["expiry_minutes"]) {
      std::optional<int32_t> expiry = node.value<int32_t>();
      if (!expiry.has_value()) {
         LOG(ERROR) << TAG("load_config") << "Message 'expiry_minutes' must be an integer\n";
         return false;
      }
      message.expiry_minutes = *expiry;
   }

   if (auto node = tbl["message"]["user_key"]) {
      std::optional<std::string> user_key = node.value<std::string>();
      if (!user_key.has_value()) {
         LOG(ERROR) << TAG("load_config") << "Message 'user_key' must be a string\n";
         return false;
      }
      message.user_key = *user_key;
   }

   if (auto node = tbl["message"]["encoding"]) {
      std::optional<std::string> name = node.value<std::string>();
      std::optional<sms::encoding_e> encoding;
      if (name.has_value()) {
         encoding = sms::encoding_from_string(*name);
      }

      if (!encoding.has_value()) {
         LOG(ERROR) << TAG("load_config")
                    << "Message 'encoding' must be one of \"default\", \"8bit\" or \"udh\"\n";
         return false;
      }
      message.encoding = *encoding;
   }

   // Obtain the flags
   //
   if (auto node = tbl["message"]["flags"]) {
      auto arr = node.as_array();
      if (!arr) {
         LOG(ERROR) << TAG("load_config") << "Message 'flags' must be an array\n";
         return false;
      }

      for (auto &&element : *arr) {
         auto name = element.value<std::string>();
         if (!name.has_value()) {
            LOG(ERROR) << TAG("load_config") << "Message 'flags' items must be strings\n";
            return false;
         }

         auto flag = sms::flag_from_string(*name);
         if (!flag.has_value()) {
            LOG(ERROR) << TAG("load_config") << "Unknown message flag '" << *name << "'\n";
            return false;
         }
         message.flags.insert(*flag);
      }
   }

   return true;
}

std::optional<configuration_c> load_table(const toml::table &tbl) {
   configuration_c config;

   /*

         Load smsgate configurations

   */
   std::optional<std::string> log_name =
       tbl["smsgate"]["log_name"].value<std::string>();
   if (log_name.has_value()) {
      config.app.log_name = *log_name;
   } else {
      LOG(ERROR) << TAG("load_config") << "Missing smsgate config for 'log_name'\n";
      return {};
   }

   /*

         Load gateway configurations

   */
   if (!load_required_string(tbl, "gateway", "base_url", config.gateway.base_url) ||
       !load_required_string(tbl, "gateway", "api_key", config.gateway.api_key) ||
       !load_required_string(tbl, "gateway", "sender", config.gateway.sender)) {
      return {};
   }

   /*

         Load optional message defaults

   */
   if (!load_message(tbl, config.message)) {
      return {};
   }

   /*

         Load optional transport configurations

   */
   if (!load_timeout(tbl, "timeout_ms", config.transport.timeout_ms) ||
       !load_timeout(tbl, "connect_timeout_ms", config.transport.connect_timeout_ms)) {
      return {};
   }

   return {config};
}

} // namespace

std::optional<configuration_c> load_configuration(const std::string &file) {
   toml::table tbl;
   try {
      tbl = toml::parse_file(file);
   } catch (const toml::parse_error &err) {
      LOG(ERROR) << TAG("load_configs")
                 << "Unable to parse file : " << file
                 << ". Description: " << err.description() << " ("
                 << err.source().begin << ")\n";
      return {};
   }
   return load_table(tbl);
}

std::optional<configuration_c> parse_configuration(const std::string &text) {
   toml::table tbl;
   try {
      tbl = toml::parse(text);
   } catch (const toml::parse_error &err) {
      LOG(ERROR) << TAG("load_configs")
                 << "Unable to parse configuration. Description: "
                 << err.description() << " (" << err.source().begin << ")\n";
      return {};
   }
   return load_table(tbl);
}

sms::request_c make_request(const configuration_c &config,
                            const std::string &number,
                            const std::string &text) {
   sms::request_c request(config.gateway.api_key, config.gateway.sender, number,
                          text);

   request.set_encoding(config.message.encoding)
       .set_flags(config.message.flags);

   if (config.message.dlr_url.has_value()) {
      request.set_dlr_url(*config.message.dlr_url);
   }

   if (config.message.expiry_minutes.has_value()) {
      request.set_expiry_minutes(*config.message.expiry_minutes);
   }

   if (config.message.user_key.has_value()) {
      request.set_user_key(*config.message.user_key);
   }

   return request;
}

} // namespace config
} // namespace smsgate
