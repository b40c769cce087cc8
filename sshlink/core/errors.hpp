#ifndef SSHLINK_CORE_ERRORS_HEADER
#define SSHLINK_CORE_ERRORS_HEADER

#include "sshlink/common/types.hpp"

#include <string_view>

namespace sshlink::ssh {

enum ssh_error_code : std::uint32_t {
	ssh_noerror                        = 0,
	ssh_host_not_allowed_to_connect    = 1,
	ssh_protocol_error                 = 2,
	ssh_key_exchange_failed            = 3,
	ssh_reserved                       = 4,
	ssh_mac_error                      = 5,
	ssh_compression_error              = 6,
	ssh_service_not_available          = 7,
	ssh_protocol_version_not_supported = 8,
	ssh_host_key_not_verifiable        = 9,
	ssh_connection_lost                = 10,
	ssh_disconnect_by_application      = 11,
	ssh_too_many_connections           = 12,
	ssh_auth_cancelled_by_user         = 13,
	ssh_no_more_auth_methods_available = 14,
	ssh_illegal_user_name              = 15,

	//0x00000010-0xFDFFFFFF	Unassigned
	//0xFE000000-0xFFFFFFFF	Reserved for Private Use

	//sshlink defined errors
	sshlink_invalid_setup              = 0xFFFF0001,
	sshlink_memory_error               = 0xFFFF0002,
	sshlink_invalid_packet             = 0xFFFF0003,
	sshlink_crypto_error               = 0xFFFF0004,
	sshlink_invalid_data               = 0xFFFF0005,
	sshlink_io_error                   = 0xFFFF0006,
	sshlink_connection_closed          = 0xFFFF0007,
	sshlink_no_common_algorithm        = 0xFFFF0008,
	sshlink_host_signature_error       = 0xFFFF0009,
	sshlink_auth_failed                = 0xFFFF000A,
	sshlink_user_null                  = 0xFFFF000B,
	sshlink_password_null              = 0xFFFF000C,
	sshlink_channel_open_failed        = 0xFFFF000D,
	sshlink_channel_request_failed     = 0xFFFF000E,
	sshlink_channel_failure            = 0xFFFF000F,
	sshlink_timeout                    = 0xFFFF0010,
	sshlink_invalid_state              = 0xFFFF0011
};

std::string_view to_string(ssh_error_code);

/// coarse classification of errors, used by callers to decide what to do with a failure
enum class error_kind {
	none,
	io,
	framing,
	integrity,
	negotiation,
	credential,
	channel,
	timeout,
	protocol
};

std::string_view to_string(error_kind);

error_kind to_error_kind(ssh_error_code);

/// reason code to send in SSH_MSG_DISCONNECT for the given error
ssh_error_code to_disconnect_reason(ssh_error_code);

}

#endif
