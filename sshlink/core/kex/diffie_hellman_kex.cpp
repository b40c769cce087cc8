#include "diffie_hellman_kex.hpp"
#include "dh.hpp"

#include "sshlink/common/util.hpp"
#include "sshlink/core/packet_ser_impl.hpp"

namespace sshlink::ssh {

diffie_hellman_kex_client::diffie_hellman_kex_client(kex_context kex_c, kex_type type)
: kex_common(kex_c, type)
{
	context_.logger().log(logger::debug_trace, "constructing diffie_hellman_kex_client [type={}]", to_string(type));
}

kex_state diffie_hellman_kex_client::initiate() {
	if(exchange_ && context_.send_packet<ser::kexdh_init>(to_umpint(exchange_->public_key()))) {
		return set_state(kex_state::inprogress);
	}
	return set_error(ssh_key_exchange_failed, "Failed to initiate kex");
}

kex_state diffie_hellman_kex_client::handle(ssh_packet_type type, const_span payload) {
	if(state_ != kex_state::inprogress) {
		return set_error(ssh_key_exchange_failed, "Invalid state");
	}

	if(type != ssh_packet_type(ssh_kexdh_reply)) {
		return set_error(ssh_protocol_error, "Wrong kex packet [type={}]", type);
	}

	ser::kexdh_reply::load packet(ser::match_type_t, payload);
	if(!packet) {
		return set_error(sshlink_invalid_packet, "Invalid kex packet");
	}

	auto& [host_key, f, sig] = packet;

	// 1 < f < p-1 is checked by the key agreement
	return finish_client(
		to_span(host_key),
		to_umpint(exchange_->public_key()),
		f,
		exchange_->agree(f.data),
		to_span(sig));
}

}
