#include "ssh_config.hpp"
#include "ssh_constants.hpp"

namespace sshlink::ssh {

bool ssh_config::valid() const {
	return algorithms.valid()
		&& max_in_packet_size > packet_header_size + minimum_padding_size
		&& max_out_packet_size > packet_header_size + minimum_padding_size
		&& max_out_buffer_size >= max_out_packet_size;
}

}
