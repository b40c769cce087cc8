#include "ssh_state.hpp"

#include <ostream>

namespace sshlink::ssh {

std::string_view to_string(ssh_state s) {
	using enum ssh_state;
	switch(s) {
		case none:             return "none";
		case version_exchange: return "version_exchange";
		case kex:              return "kex";
		case transport:        return "transport";
		case disconnected:     return "disconnected";
	}
	return "unknown";
}

std::ostream& operator<<(std::ostream& out, ssh_state state) {
	return out << to_string(state);
}

std::string_view to_string(handler_result r) {
	using enum handler_result;
	switch(r) {
		case unknown: return "unknown";
		case handled: return "handled";
		case pending: return "pending";
	}
	return "invalid";
}

}
