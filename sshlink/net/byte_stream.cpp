#include "byte_stream.hpp"

namespace sshlink::ssh {

std::string_view to_string(io_result r) {
	using enum io_result;
	switch(r) {
		case data:        return "data";
		case would_block: return "would_block";
		case eof:         return "eof";
		case error:       return "error";
	}
	return "unknown";
}

}
