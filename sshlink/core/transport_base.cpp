#include "transport_base.hpp"

namespace sshlink::ssh {

bool transport_base::send_payload(const_span payload) {
	log().log(logger::debug_trace, "SSH sending payload [size={}]", payload.size());

	auto rec = alloc_out_packet(payload.size());
	if(rec) {
		copy(payload, rec->data);
		return write_alloced_out_packet(*rec);
	}

	set_error(sshlink_memory_error, "Could not allocate buffer for sending payload");
	return false;
}

}
