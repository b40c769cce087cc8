#include "ssh_client.hpp"

#include "sshlink/core/kex.hpp"
#include "sshlink/core/packet_ser_impl.hpp"
#include "sshlink/core/protocol.hpp"
#include "sshlink/core/connection/conn_protocol.hpp"
#include "sshlink/core/service/names.hpp"

#include <ostream>

namespace sshlink::ssh {

std::string_view to_string(session_state s) {
	using enum session_state;
	switch(s) {
		case connected:         return "connected";
		case version_exchanged: return "version_exchanged";
		case key_exchanged:     return "key_exchanged";
		case service_requested: return "service_requested";
		case authenticated:     return "authenticated";
		case disconnected:      return "disconnected";
	}
	return "unknown";
}

std::ostream& operator<<(std::ostream& out, session_state s) {
	return out << to_string(s);
}

ssh_client::ssh_client(client_config const& conf, logger& log, out_buffer& out, crypto_context cc)
: ssh_transport(conf, log, out, std::move(cc))
, config_(conf)
{
}

void ssh_client::set_session_state(session_state s) {
	if(session_state_ != s && session_state_ != session_state::disconnected) {
		logger_.log(logger::info, "SSH session state [{} -> {}]", session_state_, s);
		session_state_ = s;
	}
}

void ssh_client::on_version_exchange(ssh_version const& v) {
	ssh_transport::on_version_exchange(v);
	if(error() == ssh_noerror) {
		set_session_state(session_state::version_exchanged);
	}
}

void ssh_client::on_state_change(ssh_state old_s, ssh_state new_s) {
	if(new_s == ssh_state::disconnected) {
		set_session_state(session_state::disconnected);
	} else if(old_s == ssh_state::kex && new_s == ssh_state::transport && session_state_ == session_state::version_exchanged) {
		// first key exchange done, request user auth
		set_session_state(session_state::key_exchanged);
		if(send_packet<ser::service_request>(user_auth_service_name)) {
			set_session_state(session_state::service_requested);
		} else {
			set_error_and_disconnect(error() ? error() : sshlink_memory_error, "failed to send service request");
		}
	}
}

handler_result ssh_client::handle_kex_done(kex const& k) {
	/*
		check here if k.server_host_key() is key we allow and call the base class function if so.
		Otherwise set error and disconnect state.
	*/
	return ssh_transport::handle_kex_done(k);
}

handler_result ssh_client::handle_service_accept(const_span payload) {
	logger_.log(logger::debug_trace, "SSH handle_service_accept");

	ser::service_accept::load packet(payload);
	if(!packet) {
		logger_.log(logger::error, "SSH Invalid service accept packet from remote");
		set_error_and_disconnect(sshlink_invalid_packet);
		return handler_result::handled;
	}

	auto& [service] = packet;

	if(session_state_ == session_state::service_requested && !auth_ && service == user_auth_service_name) {
		logger_.log(logger::debug_trace, "SSH user auth service accepted");
		start_user_auth();
	} else {
		logger_.log(logger::error, "SSH Received service accept in invalid state [service={}]", service);
		set_error_and_disconnect(ssh_protocol_error, "unexpected service accept");
	}
	return handler_result::handled;
}

void ssh_client::start_user_auth() {
	auth_ = construct_auth();
	if(!auth_) {
		logger_.log(logger::error, "Failed to construct authentication service");
		set_error_and_disconnect(ssh_service_not_available);
	} else if(!auth_->init()) {
		set_error_and_disconnect(auth_->error(), auth_->error_message());
	}
}

void ssh_client::start_connection() {
	connection_ = construct_connection();
	if(!connection_) {
		logger_.log(logger::error, "Failed to construct connection service");
		set_error_and_disconnect(ssh_service_not_available);
	} else if(!connection_->init()) {
		logger_.log(logger::error, "Failed to initialise connection service");
		set_error_and_disconnect(ssh_service_not_available);
	}
}

handler_result ssh_client::process_auth(ssh_packet_type type, const_span payload) {
	auto res = auth_->process(type, payload);
	if(res == handler_result::handled) {
		auto s_state = auth_->state();
		if(s_state == service_state::done) {
			set_session_state(session_state::authenticated);
			start_connection();
		} else if(s_state == service_state::error) {
			set_error_and_disconnect(auth_->error(), auth_->error_message());
		}
	}
	return res;
}

handler_result ssh_client::handle_pre_auth_global_request(const_span payload) {
	ser::global_request::load packet(payload);
	if(packet) {
		auto& [name, reply] = packet;
		logger_.log(logger::debug, "SSH refusing global request before authentication [name={}, reply={}]", name, reply);
		if(reply) {
			send_packet<ser::request_failure>();
		}
	} else {
		set_error_and_disconnect(sshlink_invalid_packet, "invalid global request packet");
	}
	return handler_result::handled;
}

handler_result ssh_client::handle_transport_packet(ssh_packet_type type, const_span payload) {
	if(type == ssh_service_accept) {
		return handle_service_accept(payload);
	}

	if(is_auth_packet(type)) {
		if(!auth_ || session_state_ != session_state::service_requested) {
			logger_.log(logger::error, "SSH Received packet in wrong state [type={}]", type);
			set_error_and_disconnect(ssh_protocol_error);
			return handler_result::handled;
		}
		return process_auth(type, payload);
	}

	if(is_connection_packet(type)) {
		if(connection_) {
			return connection_->process(type, payload);
		}
		if(type == ssh_global_request) {
			return handle_pre_auth_global_request(payload);
		}
		logger_.log(logger::error, "SSH Received packet in wrong state [type={}]", type);
		set_error_and_disconnect(ssh_protocol_error);
		return handler_result::handled;
	}

	return handler_result::unknown;
}

std::unique_ptr<client_auth_service> ssh_client::construct_auth() {
	return std::make_unique<client_auth_service>(*this, config_.username, config_.service, config_.password);
}

std::unique_ptr<ssh_connection> ssh_client::construct_connection() {
	if(config_.service == connection_service_name) {
		return std::make_unique<ssh_connection>(*this, config_.channel);
	}
	return nullptr;
}

}
