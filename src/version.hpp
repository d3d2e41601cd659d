#ifndef SMSGATE_VERSION_HPP
#define SMSGATE_VERSION_HPP

#include <crate/app/version_v1.hpp>
#include <string>

namespace smsgate {

//! \brief Retrieve the version information
extern crate::app::version_v1_c get_version_info();

} // namespace smsgate

#endif
