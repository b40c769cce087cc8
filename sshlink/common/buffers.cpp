#include "buffers.hpp"

#include <cstring>

namespace sshlink::ssh {

bool out_buffer::write(std::string_view s) {
	auto out = get(s.size());
	bool ret = out.size() >= s.size();
	if(ret) {
		std::memcpy(out.data(), s.data(), s.size());
		commit(s.size());
	}
	return ret;
}

}
