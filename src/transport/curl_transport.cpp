#include "curl_transport.hpp"
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <crate/externals/aixlog/logger.hpp>
#include <curl/curl.h>

namespace smsgate {
namespace transport {

namespace {

std::once_flag curl_init_flag;

// curl_global_init is not thread safe and must only run once per process
void ensure_curl_initialized() {
   std::call_once(curl_init_flag, []() {
      curl_global_init(CURL_GLOBAL_ALL);
   });
}

// Percent encode a string without needing an easy handle
std::optional<std::string> escape(const std::string &value) {
   if (value.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
      return {};
   }

   char *escaped = curl_easy_escape(nullptr, value.c_str(),
                                    static_cast<int>(value.size()));
   if (!escaped) {
      return {};
   }
   std::string result(escaped);
   curl_free(escaped);
   return {result};
}

struct curl_deleter_s {
   void operator()(CURL *curl) const { curl_easy_cleanup(curl); }
};

} // namespace anonymous

// Write curl response to a stringstream
size_t curl_transport_c::_stream_write(char *ptr,
                                       size_t size,
                                       size_t nmemb,
                                       void *userdata) {
   size_t response_size = size * nmemb;
   std::stringstream *ss = static_cast<std::stringstream *>(userdata);
   ss->write(ptr, response_size);
   return response_size;
}

curl_transport_c::curl_transport_c() : curl_transport_c(configuration_c{}) {}

curl_transport_c::curl_transport_c(curl_transport_c::configuration_c config)
    : _config(config) {
   ensure_curl_initialized();
}

std::optional<std::string>
curl_transport_c::encode_url(const std::string &url,
                             const query_parameters_t &parameters) {
   std::stringstream ss;
   ss << url;

   char separator = '?';
   for (auto &[key, value] : parameters) {
      auto escaped_key = escape(key);
      auto escaped_value = escape(value);
      if (!escaped_key.has_value() || !escaped_value.has_value()) {
         LOG(ERROR) << TAG("curl_transport_c::encode_url")
                    << "Unable to encode parameter '" << key << "'\n";
         return {};
      }
      ss << separator << *escaped_key << "=" << *escaped_value;
      separator = '&';
   }
   return {ss.str()};
}

http_response_s curl_transport_c::get(const std::string &url,
                                      const query_parameters_t &parameters) {
   http_response_s response;

   // Each request gets its own handle as easy handles
   // can not be used by multiple threads at once
   std::unique_ptr<CURL, curl_deleter_s> curl(curl_easy_init());
   if (!curl) {
      LOG(ERROR) << TAG("curl_transport_c::get") << "Unable to create curl handle\n";
      response.error = {CURLE_FAILED_INIT, curl_easy_strerror(CURLE_FAILED_INIT)};
      return response;
   }

   auto url_string = encode_url(url, parameters);
   if (!url_string.has_value()) {
      response.error = {CURLE_OUT_OF_MEMORY, "unable to encode query parameters"};
      return response;
   }

   std::stringstream response_stream;
   char error_buffer[CURL_ERROR_SIZE] = {0};

   curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
   curl_easy_setopt(curl.get(), CURLOPT_URL, url_string->c_str());
   curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
   curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
   curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, _stream_write);
   curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_stream);

   if (_config.timeout_ms) {
      curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS,
                       static_cast<long>(_config.timeout_ms));
   }

   if (_config.connect_timeout_ms) {
      curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
                       static_cast<long>(_config.connect_timeout_ms));
   }

   LOG(DEBUG) << TAG("curl_transport_c::get") << "GET " << url << "\n";

   CURLcode res = curl_easy_perform(curl.get());

   if (res != CURLE_OK) {
      std::string description = error_buffer[0] ? std::string(error_buffer)
                                                : curl_easy_strerror(res);
      LOG(ERROR) << TAG("curl_transport_c::get") << description << "\n";
      response.error = {static_cast<int>(res), description};
      return response;
   }

   curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);

   response.completed = true;
   response.body = response_stream.str();

   LOG(DEBUG) << TAG("curl_transport_c::get") << "HTTP " << response.status_code
              << " (" << response.body.size() << " bytes)\n";
   return response;
}

} // namespace transport
} // namespace smsgate
