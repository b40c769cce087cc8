#include "errors.hpp"

namespace sshlink::ssh {

std::string_view to_string(ssh_error_code code) {
	switch(code) {
		case ssh_noerror:                        return "no error";
		case ssh_host_not_allowed_to_connect:    return "host not allowed to connect";
		case ssh_protocol_error:                 return "protocol error";
		case ssh_key_exchange_failed:            return "key exchange failed";
		case ssh_reserved:                       return "reserved";
		case ssh_mac_error:                      return "mac error";
		case ssh_compression_error:              return "compression error";
		case ssh_service_not_available:          return "service not available";
		case ssh_protocol_version_not_supported: return "protocol version not supported";
		case ssh_host_key_not_verifiable:        return "host key not verifiable";
		case ssh_connection_lost:                return "connection lost";
		case ssh_disconnect_by_application:      return "disconnected by application";
		case ssh_too_many_connections:           return "too many connections";
		case ssh_auth_cancelled_by_user:         return "authentication cancelled by user";
		case ssh_no_more_auth_methods_available: return "no more authentication methods available";
		case ssh_illegal_user_name:              return "illegal user name";
		case sshlink_invalid_setup:              return "invalid setup";
		case sshlink_memory_error:               return "memory error";
		case sshlink_invalid_packet:             return "invalid packet";
		case sshlink_crypto_error:               return "crypto error";
		case sshlink_invalid_data:               return "invalid data";
		case sshlink_io_error:                   return "i/o error";
		case sshlink_connection_closed:          return "connection closed";
		case sshlink_no_common_algorithm:        return "no common algorithm";
		case sshlink_host_signature_error:       return "host signature verification failed";
		case sshlink_auth_failed:                return "authentication failed";
		case sshlink_user_null:                  return "user name not set";
		case sshlink_password_null:              return "password not set";
		case sshlink_channel_open_failed:        return "channel open failed";
		case sshlink_channel_request_failed:     return "channel request failed";
		case sshlink_channel_failure:            return "channel failure";
		case sshlink_timeout:                    return "timeout";
		case sshlink_invalid_state:              return "invalid state";
	}
	return "unknown error";
}

std::string_view to_string(error_kind k) {
	using enum error_kind;
	switch(k) {
		case none:        return "none";
		case io:          return "io";
		case framing:     return "framing";
		case integrity:   return "integrity";
		case negotiation: return "negotiation";
		case credential:  return "credential";
		case channel:     return "channel";
		case timeout:     return "timeout";
		case protocol:    return "protocol";
	}
	return "unknown";
}

error_kind to_error_kind(ssh_error_code code) {
	switch(code) {
		case ssh_noerror:
			return error_kind::none;

		case ssh_connection_lost:
		case sshlink_io_error:
		case sshlink_connection_closed:
			return error_kind::io;

		case sshlink_invalid_packet:
			return error_kind::framing;

		case ssh_mac_error:
		case ssh_host_key_not_verifiable:
		case sshlink_crypto_error:
		case sshlink_host_signature_error:
			return error_kind::integrity;

		case ssh_key_exchange_failed:
		case ssh_protocol_version_not_supported:
		case sshlink_no_common_algorithm:
			return error_kind::negotiation;

		case ssh_auth_cancelled_by_user:
		case ssh_no_more_auth_methods_available:
		case ssh_illegal_user_name:
		case sshlink_auth_failed:
		case sshlink_user_null:
		case sshlink_password_null:
			return error_kind::credential;

		case sshlink_channel_open_failed:
		case sshlink_channel_request_failed:
		case sshlink_channel_failure:
			return error_kind::channel;

		case sshlink_timeout:
			return error_kind::timeout;

		default: break;
	}
	return error_kind::protocol;
}

ssh_error_code to_disconnect_reason(ssh_error_code code) {
	if(code > 0 && code <= ssh_illegal_user_name) {
		return code;
	}

	switch(code) {
		case sshlink_crypto_error:
			return ssh_mac_error;
		case sshlink_no_common_algorithm:
			return ssh_key_exchange_failed;
		case sshlink_host_signature_error:
			return ssh_host_key_not_verifiable;
		case sshlink_auth_failed:
		case sshlink_user_null:
		case sshlink_password_null:
			return ssh_no_more_auth_methods_available;
		case sshlink_io_error:
		case sshlink_connection_closed:
		case sshlink_timeout:
			return ssh_connection_lost;
		default: break;
	}
	return ssh_protocol_error;
}

}
