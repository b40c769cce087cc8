#include "ssh_service.hpp"

namespace sshlink::ssh {

std::string_view to_string(service_state s) {
	using enum service_state;
	switch(s) {
		case none:       return "none";
		case inprogress: return "inprogress";
		case done:       return "done";
		case error:      return "error";
	}
	return "unknown";
}

}
