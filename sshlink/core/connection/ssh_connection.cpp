#include "ssh_connection.hpp"
#include "conn_protocol.hpp"

#include "sshlink/common/util.hpp"
#include "sshlink/core/packet_ser_impl.hpp"
#include "sshlink/core/transport_base.hpp"
#include "sshlink/core/service/names.hpp"

namespace sshlink::ssh {

ssh_connection::ssh_connection(transport_base& t, channel_config conf)
: transport_(t)
, log_(transport_.log())
, config_(std::move(conf))
{
}

std::string_view ssh_connection::name() const {
	return connection_service_name;
}

service_state ssh_connection::state() const {
	return state_;
}

bool ssh_connection::init() {
	state_ = service_state::done;
	return true;
}

std::unique_ptr<channel> ssh_connection::construct_channel(channel_side_info local) {
	return std::make_unique<channel>(transport_, std::move(local));
}

channel* ssh_connection::open_channel(std::string_view type) {
	channel_side_info local{next_id_, config_.window_size, config_.max_packet_size};
	auto ch = construct_channel(std::move(local));
	if(!ch || !ch->send_open(type)) {
		log_.log(logger::error, "failed to open channel [type={}]", type);
		return nullptr;
	}
	++next_id_;
	channel* res = ch.get();
	channels_[res->id()] = std::move(ch);
	return res;
}

channel* ssh_connection::find_channel(channel_id id) const {
	auto it = channels_.find(id);
	return it != channels_.end() ? it->second.get() : nullptr;
}

void ssh_connection::remove_channel(channel_id id) {
	channels_.erase(id);
}

handler_result ssh_connection::invalid_packet(ssh_packet_type type) {
	log_.log(logger::error, "Invalid {} packet", type);
	transport_.set_error_and_disconnect(ssh_protocol_error, log_.format("invalid {} packet", type));
	return handler_result::handled;
}

// every channel message starts with our channel id, unknown ids are logged and dropped
template<typename Packet, typename Func>
handler_result ssh_connection::to_channel(const_span payload, Func&& f) {
	ssh_packet_type const type{Packet::packet_type};
	typename Packet::load packet(payload);
	if(!packet) {
		return invalid_packet(type);
	}
	channel_id id = packet.template get<0>();
	if(channel* ch = find_channel(id)) {
		f(*ch, packet);
	} else {
		log_.log(logger::error, "Invalid channel id with {} [id={}]", type, id);
	}
	return handler_result::handled;
}

handler_result ssh_connection::handle_open(const_span payload) {
	ser::channel_open::load packet(payload);
	if(!packet) {
		return invalid_packet(ssh_channel_open);
	}
	auto& [type, sender_channel, initial_window, max_packet] = packet;
	log_.log(logger::info, "refusing channel open from server [type={}, sender={}]", type, sender_channel);
	transport_.send_packet<ser::channel_open_failure>(sender_channel, ser::administratively_prohibited,
		std::string_view("channel open not allowed"), std::string_view(""));
	return handler_result::handled;
}

handler_result ssh_connection::handle_global_request(const_span payload) {
	ser::global_request::load packet(payload);
	if(!packet) {
		return invalid_packet(ssh_global_request);
	}
	auto& [request_name, reply] = packet;
	if(!on_global_request(request_name, reply, safe_subspan(payload, packet.size())) && reply) {
		transport_.send_packet<ser::request_failure>();
	}
	return handler_result::handled;
}

handler_result ssh_connection::process(ssh_packet_type type, const_span payload) {
	using namespace ser;
	switch(type) {
		case ssh_channel_open:
			return handle_open(payload);
		case ssh_global_request:
			return handle_global_request(payload);
		case ssh_channel_open_confirmation:
			return to_channel<channel_open_confirmation>(payload, [&](channel& ch, auto& p) {
				auto& [id, remote_id, window, max_packet] = p;
				ch.on_confirm(channel_side_info{remote_id, window, max_packet}, safe_subspan(payload, p.size()));
			});
		case ssh_channel_open_failure:
			return to_channel<channel_open_failure>(payload, [](channel& ch, auto& p) {
				auto& [id, code, message, lang] = p;
				ch.on_open_failure(code, message);
			});
		case ssh_channel_window_adjust:
			return to_channel<channel_window_adjust>(payload, [](channel& ch, auto& p) {
				ch.on_window_adjust(p.template get<1>());
			});
		case ssh_channel_data:
			return to_channel<channel_data>(payload, [](channel& ch, auto& p) {
				ch.on_data(to_span(p.template get<1>()));
			});
		case ssh_channel_extended_data:
			return to_channel<channel_extended_data>(payload, [](channel& ch, auto& p) {
				auto& [id, data_type, data] = p;
				ch.on_extended_data(data_type, to_span(data));
			});
		case ssh_channel_request:
			return to_channel<channel_request>(payload, [&](channel& ch, auto& p) {
				auto& [id, name, reply] = p;
				ch.on_request(name, reply, safe_subspan(payload, p.size()));
			});
		case ssh_channel_eof:
			return to_channel<channel_eof>(payload, [](channel& ch, auto&) { ch.on_eof(); });
		case ssh_channel_close:
			return to_channel<channel_close>(payload, [](channel& ch, auto&) { ch.on_close(); });
		case ssh_channel_success:
			return to_channel<channel_success>(payload, [](channel& ch, auto&) { ch.on_request_success(); });
		case ssh_channel_failure:
			return to_channel<channel_failure>(payload, [](channel& ch, auto&) { ch.on_request_failure(); });
		// we never send global requests
		case ssh_request_success:
		case ssh_request_failure:
			log_.log(logger::debug, "ignoring unsolicited global request reply [type={}]", type);
			return handler_result::handled;
		default:
			break;
	}

	log_.log(logger::error, "Unknown packet type for ssh_connection [type={}]", type);
	return handler_result::unknown;
}

bool ssh_connection::on_global_request(std::string_view name, bool reply, const_span) {
	log_.log(logger::debug, "received global request '{}' [reply={}]", name, reply);
	return false;
}

}
