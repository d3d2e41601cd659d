#ifndef SMSGATE_SMS_REQUEST_HPP
#define SMSGATE_SMS_REQUEST_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>

namespace smsgate {
namespace sms {

//! \brief Optional behaviours understood by the gateway.
//!        Each one set on a request emits a single wire parameter
enum class flag_e {
  DEBUG,
  NOLOG,
  FLASH,
  TEST,
  NOBL,
  CONVERT
};

//! \brief Payload encoding of a message
enum class encoding_e {
  DEFAULT,
  EIGHT_BIT,
  UDH
};

//! \brief Convert a configuration name ("flash", "nolog", ...) to a flag
std::optional<flag_e> flag_from_string(const std::string &name);

//! \brief Convert a configuration name ("default", "8bit", "udh") to an encoding
std::optional<encoding_e> encoding_from_string(const std::string &name);

std::string to_string(const flag_e flag);
std::string to_string(const encoding_e encoding);

//! \brief Thrown when a request is built without a required field
class validation_error_c : public std::invalid_argument {
public:
  validation_error_c(const std::string &field);

  //! \brief Name of the field that failed validation
  const std::string &field() const { return _field; }

private:
  std::string _field;
};

//! \brief A single message to be sent through the gateway
class request_c {
public:
  using time_point_t = std::chrono::system_clock::time_point;

  request_c() = delete;

  //! \brief Create a request
  //! \param api_key Gateway credential
  //! \param sender The sender id or name
  //! \param number Destination number, may carry a leading '+'
  //! \param text Message body
  //! \throws validation_error_c if any of the parameters are empty
  request_c(std::string api_key, std::string sender, std::string number,
            std::string text);

  //! \brief Schedule the message for a later delivery (UTC)
  request_c &set_time(time_point_t time);
  request_c &set_dlr_url(std::string url);
  request_c &set_expiry_minutes(int32_t minutes);
  request_c &set_user_key(std::string user_key);
  request_c &set_encoding(encoding_e encoding);

  //! \brief Add a flag to the request, setting it twice has no effect
  request_c &set_flag(flag_e flag);

  //! \brief Replace the entire flag set
  request_c &set_flags(std::set<flag_e> flags);
  request_c &clear_flag(flag_e flag);

  const std::string &api_key() const { return _api_key; }
  const std::string &sender() const { return _sender; }
  const std::string &number() const { return _number; }
  const std::string &text() const { return _text; }

  //! \brief The destination number as it goes on the wire
  //! \returns number with a single leading '+' removed
  std::string wire_number() const;

  const std::optional<time_point_t> &time() const { return _time; }
  const std::optional<std::string> &dlr_url() const { return _dlr_url; }
  const std::optional<int32_t> &expiry_minutes() const {
    return _expiry_minutes;
  }
  const std::optional<std::string> &user_key() const { return _user_key; }
  encoding_e encoding() const { return _encoding; }
  const std::set<flag_e> &flags() const { return _flags; }
  bool has_flag(flag_e flag) const;

private:
  std::string _api_key;
  std::string _sender;
  std::string _number;
  std::string _text;
  std::optional<time_point_t> _time;
  std::optional<std::string> _dlr_url;
  std::optional<int32_t> _expiry_minutes;
  std::optional<std::string> _user_key;
  std::set<flag_e> _flags;
  encoding_e _encoding{encoding_e::EIGHT_BIT};
};

} // namespace sms
} // namespace smsgate

#endif
