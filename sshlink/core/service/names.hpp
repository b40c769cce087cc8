#ifndef SSHLINK_CORE_SERVICE_NAMES_HEADER
#define SSHLINK_CORE_SERVICE_NAMES_HEADER

#include <string_view>

namespace sshlink::ssh {

std::string_view const user_auth_service_name{"ssh-userauth"};
std::string_view const connection_service_name{"ssh-connection"};

std::string_view const password_auth_method{"password"};
std::string_view const session_channel_type{"session"};

}

#endif
