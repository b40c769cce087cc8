#ifndef SSHLINK_CORE_AUTH_PROTOCOL_HEADER
#define SSHLINK_CORE_AUTH_PROTOCOL_HEADER

#include "sshlink/core/packet_ser.hpp"
#include "sshlink/core/packet_types.hpp"

// user authentication messages, rfc4252
namespace sshlink::ssh {

// method specific message number for the password method (section 8)
enum password_auth_packet_type : std::uint8_t {
	ssh_userauth_passwd_changereq = 60
};

namespace ser {

// 8
using userauth_password_request = ssh_packet_ser<ssh_userauth_request,
	string,    // user name
	string,    // service name
	string,    // "password"
	boolean,   // false, no password change
	string>;   // password

// 5.1
using userauth_failure = ssh_packet_ser<ssh_userauth_failure,
	name_list, // methods that can continue
	boolean>;  // partial success

using userauth_success = ssh_packet_ser<ssh_userauth_success>;

// 5.4
using userauth_banner = ssh_packet_ser<ssh_userauth_banner,
	string,    // message
	string>;   // language tag

// 8
using userauth_passwd_changereq = ssh_packet_ser<ssh_userauth_passwd_changereq,
	string,    // prompt
	string>;   // language tag

}
}

#endif
