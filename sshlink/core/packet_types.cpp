#include "packet_types.hpp"

#include <ostream>

namespace sshlink::ssh {

static bool in_range(ssh_packet_type t, unsigned first, unsigned last) {
	return t >= first && t <= last;
}

bool is_kex_packet(ssh_packet_type t) { return in_range(t, 20, 49); }
bool is_auth_packet(ssh_packet_type t) { return in_range(t, 50, 79); }
bool is_connection_packet(ssh_packet_type t) { return in_range(t, 80, 127); }

std::string_view to_string(ssh_packet_type t) {
	switch(t) {
		case ssh_disconnect:                return "DISCONNECT";
		case ssh_ignore:                    return "IGNORE";
		case ssh_unimplemented:             return "UNIMPLEMENTED";
		case ssh_debug:                     return "DEBUG";
		case ssh_service_request:           return "SERVICE_REQUEST";
		case ssh_service_accept:            return "SERVICE_ACCEPT";
		case ssh_kexinit:                   return "KEXINIT";
		case ssh_newkeys:                   return "NEWKEYS";
		case ssh_userauth_request:          return "USERAUTH_REQUEST";
		case ssh_userauth_failure:          return "USERAUTH_FAILURE";
		case ssh_userauth_success:          return "USERAUTH_SUCCESS";
		case ssh_userauth_banner:           return "USERAUTH_BANNER";
		case ssh_global_request:            return "GLOBAL_REQUEST";
		case ssh_request_success:           return "REQUEST_SUCCESS";
		case ssh_request_failure:           return "REQUEST_FAILURE";
		case ssh_channel_open:              return "CHANNEL_OPEN";
		case ssh_channel_open_confirmation: return "CHANNEL_OPEN_CONFIRMATION";
		case ssh_channel_open_failure:      return "CHANNEL_OPEN_FAILURE";
		case ssh_channel_window_adjust:     return "CHANNEL_WINDOW_ADJUST";
		case ssh_channel_data:              return "CHANNEL_DATA";
		case ssh_channel_extended_data:     return "CHANNEL_EXTENDED_DATA";
		case ssh_channel_eof:               return "CHANNEL_EOF";
		case ssh_channel_close:             return "CHANNEL_CLOSE";
		case ssh_channel_request:           return "CHANNEL_REQUEST";
		case ssh_channel_success:           return "CHANNEL_SUCCESS";
		case ssh_channel_failure:           return "CHANNEL_FAILURE";
	}
	return "UNKNOWN";
}

std::ostream& operator<<(std::ostream& out, ssh_packet_type t) {
	return out << to_string(t) << '(' << unsigned(t) << ')';
}

}
