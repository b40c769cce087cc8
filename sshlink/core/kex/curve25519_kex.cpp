#include "curve25519_kex.hpp"
#include "ecdh.hpp"

#include "sshlink/core/packet_ser_impl.hpp"

namespace sshlink::ssh {

curve25519_kex_client::curve25519_kex_client(kex_context kex_c, kex_type type)
: kex_common(kex_c, type)
{
	context_.logger().log(logger::debug_trace, "constructing curve25519_kex_client [type={}]", to_string(type));
}

kex_state curve25519_kex_client::initiate() {
	if(exchange_ && context_.send_packet<ser::kex_ecdh_init>(to_string_view(exchange_->public_key()))) {
		return set_state(kex_state::inprogress);
	}
	return set_error(ssh_key_exchange_failed, "Failed to initiate kex");
}

kex_state curve25519_kex_client::handle(ssh_packet_type type, const_span payload) {
	if(state_ != kex_state::inprogress) {
		return set_error(ssh_key_exchange_failed, "Invalid state");
	}

	if(type != ssh_packet_type(ssh_kex_ecdh_reply)) {
		return set_error(ssh_protocol_error, "Wrong kex packet [type={}]", type);
	}

	ser::kex_ecdh_reply::load packet(ser::match_type_t, payload);
	if(!packet) {
		return set_error(sshlink_invalid_packet, "Invalid kex packet");
	}

	auto& [host_key, server_eph_key, sig] = packet;

	return finish_client(
		to_span(host_key),
		to_string_view(exchange_->public_key()),
		server_eph_key,
		exchange_->agree(to_span(server_eph_key)),
		to_span(sig));
}

}
