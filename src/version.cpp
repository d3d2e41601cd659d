#include "version.hpp"

// Build information is provided by the build system, the
// fallbacks only apply to builds outside of it
#ifndef COMPILED_GIT_HASH
#define COMPILED_GIT_HASH "unknown"
#endif

#ifndef SMSGATE_VERSION_MAJOR
#define SMSGATE_VERSION_MAJOR "0"
#endif

#ifndef SMSGATE_VERSION_MINOR
#define SMSGATE_VERSION_MINOR "0"
#endif

#ifndef SMSGATE_VERSION_PATCH
#define SMSGATE_VERSION_PATCH "0"
#endif

namespace smsgate {

crate::app::version_v1_c get_version_info() {
   static constexpr char name[] = "smsgate";

   return crate::app::version_v1_c(
       name, std::string(COMPILED_GIT_HASH),
       {SMSGATE_VERSION_MAJOR, SMSGATE_VERSION_MINOR, SMSGATE_VERSION_PATCH});
}

} // namespace smsgate
