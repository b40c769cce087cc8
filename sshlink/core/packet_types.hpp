#ifndef SSHLINK_CORE_PACKET_TYPES_HEADER
#define SSHLINK_CORE_PACKET_TYPES_HEADER

#include "sshlink/common/types.hpp"

#include <iosfwd>

namespace sshlink::ssh {

// message numbers, rfc4250 section 4.1
enum ssh_packet_type : std::uint8_t {
	// transport layer generic, 1-19
	ssh_disconnect = 1,
	ssh_ignore,
	ssh_unimplemented,
	ssh_debug,
	ssh_service_request,
	ssh_service_accept,

	// algorithm negotiation 20-29, key exchange method specific 30-49
	ssh_kexinit = 20,
	ssh_newkeys,

	// user authentication generic 50-59, method specific 60-79
	ssh_userauth_request = 50,
	ssh_userauth_failure,
	ssh_userauth_success,
	ssh_userauth_banner,

	// connection protocol generic, 80-89
	ssh_global_request = 80,
	ssh_request_success,
	ssh_request_failure,

	// channel related, 90-127
	ssh_channel_open = 90,
	ssh_channel_open_confirmation,
	ssh_channel_open_failure,
	ssh_channel_window_adjust,
	ssh_channel_data,
	ssh_channel_extended_data,
	ssh_channel_eof,
	ssh_channel_close,
	ssh_channel_request,
	ssh_channel_success,
	ssh_channel_failure
};

/// key exchange range, the only messages allowed while a kex is in progress
bool is_kex_packet(ssh_packet_type);
bool is_auth_packet(ssh_packet_type);
bool is_connection_packet(ssh_packet_type);

/// the rfc name without the SSH_MSG_ prefix, e.g. "CHANNEL_DATA"
std::string_view to_string(ssh_packet_type);
std::ostream& operator<<(std::ostream&, ssh_packet_type);

}

#endif
