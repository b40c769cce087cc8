#ifndef SSHLINK_CORE_STATE_HEADER
#define SSHLINK_CORE_STATE_HEADER

#include <iosfwd>
#include <string_view>

namespace sshlink::ssh {

enum class ssh_state {
	none,
	version_exchange,
	kex,
	transport,
	disconnected,
};
std::string_view to_string(ssh_state);
std::ostream& operator<<(std::ostream&, ssh_state);

enum class handler_result {
	unknown, //unknown packet type, cannot handle
	handled, //the packet was handled
	pending  //handling the packet is still in progress
};
std::string_view to_string(handler_result);

}

#endif
