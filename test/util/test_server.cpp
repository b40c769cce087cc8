#include "test_server.hpp"

#include "sshlink/core/kex/kex_common.hpp"
#include "sshlink/core/kex/dh.hpp"
#include "sshlink/core/kex/ecdh.hpp"
#include "sshlink/core/auth/auth_protocol.hpp"
#include "sshlink/core/connection/conn_protocol.hpp"
#include "sshlink/core/packet_ser_impl.hpp"
#include "sshlink/core/protocol.hpp"
#include "sshlink/core/service/names.hpp"

#include <algorithm>

namespace sshlink::ssh::test {
namespace {

class server_kex_base : public kex_common {
public:
	server_kex_base(kex_context c, kex_type t, ed25519_host_key const& key)
	: kex_common(c, t)
	, host_key_(key)
	{}

	// the server waits for the client's init packet
	kex_state initiate() override {
		if(!exchange_) {
			return set_error(ssh_key_exchange_failed, "Failed to initiate kex");
		}
		return set_state(kex_state::inprogress);
	}

protected:
	ed25519_host_key const& host_key_;
};

class curve25519_kex_server : public server_kex_base {
public:
	using server_kex_base::server_kex_base;

	kex_state handle(ssh_packet_type type, const_span payload) override {
		if(state_ != kex_state::inprogress) {
			return set_error(ssh_key_exchange_failed, "Invalid state");
		}
		if(type != ssh_packet_type(ssh_kex_ecdh_init)) {
			return set_error(ssh_protocol_error, "Wrong kex packet [type={}]", type);
		}
		ser::kex_ecdh_init::load packet(ser::match_type_t, payload);
		if(!packet) {
			return set_error(sshlink_invalid_packet, "Invalid kex packet");
		}
		auto& [client_eph] = packet;

		byte_vector secret = exchange_->agree(to_span(client_eph));
		if(secret.empty()) {
			return set_error(ssh_key_exchange_failed, "Invalid client key");
		}

		byte_vector hkey = host_key_.public_key_blob();
		std::string_view server_eph = to_string_view(exchange_->public_key());
		byte_vector hash = calculate_exchange_hash(const_span(hkey), client_eph, server_eph, secret);
		byte_vector sig = host_key_.sign(hash);

		if(!context_.send_packet<ser::kex_ecdh_reply>(to_string_view(hkey), server_eph, to_string_view(sig))) {
			return set_error(ssh_key_exchange_failed, "Failed to send kex reply");
		}

		set_data(std::move(hash), std::move(secret), std::move(hkey));
		return set_state(kex_state::succeeded);
	}
};

class diffie_hellman_kex_server : public server_kex_base {
public:
	using server_kex_base::server_kex_base;

	kex_state handle(ssh_packet_type type, const_span payload) override {
		if(state_ != kex_state::inprogress) {
			return set_error(ssh_key_exchange_failed, "Invalid state");
		}
		if(type != ssh_packet_type(ssh_kexdh_init)) {
			return set_error(ssh_protocol_error, "Wrong kex packet [type={}]", type);
		}
		ser::kexdh_init::load packet(ser::match_type_t, payload);
		if(!packet) {
			return set_error(sshlink_invalid_packet, "Invalid kex packet");
		}
		auto& [e] = packet;

		byte_vector secret = exchange_->agree(e.data);
		if(secret.empty()) {
			return set_error(ssh_key_exchange_failed, "Invalid client key");
		}

		byte_vector hkey = host_key_.public_key_blob();
		const_mpint_span f = to_umpint(exchange_->public_key());
		byte_vector hash = calculate_exchange_hash(const_span(hkey), e, f, secret);
		byte_vector sig = host_key_.sign(hash);

		if(!context_.send_packet<ser::kexdh_reply>(to_string_view(hkey), f, to_string_view(sig))) {
			return set_error(ssh_key_exchange_failed, "Failed to send kex reply");
		}

		set_data(std::move(hash), std::move(secret), std::move(hkey));
		return set_state(kex_state::succeeded);
	}
};

}

test_server::test_server(ssh_config const& c, logger& l, out_buffer& out, crypto_context cc, ed25519_host_key const& key, server_options opts)
: ssh_transport(c, l, out, std::move(cc))
, host_key_(key)
, opts_(std::move(opts))
{
}

bool test_server::has_received(ssh_packet_type t) const {
	return std::find(received_.begin(), received_.end(), t) != received_.end();
}

std::size_t test_server::count_received(ssh_packet_type t) const {
	return std::size_t(std::count(received_.begin(), received_.end(), t));
}

std::unique_ptr<kex> test_server::construct_kex(kex_type t) {
	using enum kex_type;
	if(t == curve25519_sha256 || t == libssh_curve25519_sha256) {
		return std::make_unique<curve25519_kex_server>(kex_ctx(), t, host_key_);
	} else if(t == dh_group14_sha256) {
		return std::make_unique<diffie_hellman_kex_server>(kex_ctx(), t, host_key_);
	}
	return nullptr;
}

void test_server::on_version_exchange(ssh_version const& v) {
	versions_.push_back(remote_version_line());
	ssh_transport::on_version_exchange(v);
}

bool test_server::send_data(std::string_view data) {
	return client_channel_ && send_packet<ser::channel_data>(*client_channel_, data);
}

bool test_server::send_close() {
	if(!client_channel_ || sent_close_) {
		return false;
	}
	sent_close_ = send_packet<ser::channel_close>(*client_channel_);
	return sent_close_;
}

void test_server::handle_service_request(const_span payload) {
	ser::service_request::load packet(payload);
	if(!packet) {
		set_error_and_disconnect(sshlink_invalid_packet);
		return;
	}
	auto& [service] = packet;
	if(service != user_auth_service_name) {
		set_error_and_disconnect(ssh_service_not_available);
		return;
	}
	if(opts_.global_request_before_auth) {
		send_packet<ser::global_request>(std::string_view("keepalive@openssh.com"), true);
	}
	send_packet<ser::service_accept>(service);
}

void test_server::handle_userauth_request(const_span payload) {
	ser::userauth_password_request::load packet(payload);
	if(!packet) {
		send_packet<ser::userauth_failure>(ser::name_list_t{"password"}, false);
		return;
	}
	auto& [user, service, method, change, password] = packet;

	if(!opts_.banner.empty()) {
		send_packet<ser::userauth_banner>(std::string_view(opts_.banner), std::string_view(""));
	}

	if(method == password_auth_method && user == opts_.username && password == opts_.password && service == connection_service_name) {
		send_packet<ser::userauth_success>();
	} else {
		send_packet<ser::userauth_failure>(ser::name_list_t{"password"}, false);
	}
}

void test_server::handle_channel_open(const_span payload) {
	ser::channel_open::load packet(payload);
	if(!packet) {
		set_error_and_disconnect(sshlink_invalid_packet);
		return;
	}
	auto& [type, sender, window, max_packet] = packet;
	if(opts_.refuse_open || type != session_channel_type || client_channel_) {
		send_packet<ser::channel_open_failure>(sender, ser::administratively_prohibited, std::string_view("not allowed"), std::string_view(""));
		return;
	}
	client_channel_ = sender;
	client_window_ = window;
	send_packet<ser::channel_open_confirmation>(sender, opts_.server_channel, opts_.window_size, opts_.max_packet_size);
}

void test_server::run_command() {
	if(!opts_.exec_output.empty()) {
		send_packet<ser::channel_data>(*client_channel_, std::string_view(opts_.exec_output));
	}
	if(!opts_.exec_stderr.empty()) {
		send_packet<ser::channel_extended_data>(*client_channel_, ser::extended_data_stderr, std::string_view(opts_.exec_stderr));
	}

	byte_vector status;
	ssh_bf_writer w(status);
	w.write(opts_.exit_status);
	status.resize(w.used_size());

	byte_vector req;
	ser::serialise_to_vector<ser::channel_request>(req, *client_channel_, std::string_view("exit-status"), false);
	req.insert(req.end(), status.begin(), status.end());
	send_payload(req);

	send_packet<ser::channel_eof>(*client_channel_);
	send_close();
}

void test_server::handle_channel_request(const_span payload) {
	ser::channel_request::load packet(payload);
	if(!packet) {
		set_error_and_disconnect(sshlink_invalid_packet);
		return;
	}
	auto& [recipient, name, want_reply] = packet;
	if(recipient != opts_.server_channel || !client_channel_) {
		set_error_and_disconnect(ssh_protocol_error, "channel request for unknown channel");
		return;
	}
	requests_.emplace_back(name);

	bool ok = false;
	if(name == "pty-req") {
		ser::channel_pty_request::load pty(payload);
		if(pty) {
			auto& [r, n, wr, term, w, h, wp, hp, modes] = pty;
			pty_term_ = term;
			pty_dims_ = {w, h, wp, hp};
			pty_modes_ = std::string(modes);
			ok = true;
		}
	} else if(name == "shell") {
		ok = opts_.accept_shell;
	} else if(name == "exec") {
		ser::channel_exec_request::load exec(payload);
		if(exec) {
			auto& [r, n, wr, command] = exec;
			exec_command_ = command;
			ok = opts_.accept_exec;
		}
	}

	if(want_reply) {
		if(ok) {
			send_packet<ser::channel_success>(*client_channel_);
		} else {
			send_packet<ser::channel_failure>(*client_channel_);
		}
	}

	if(ok && name == "exec") {
		run_command();
	}
}

void test_server::handle_channel_data(const_span payload) {
	ser::channel_data::load packet(payload);
	if(!packet) {
		set_error_and_disconnect(sshlink_invalid_packet);
		return;
	}
	auto& [recipient, data] = packet;
	data_.append(data);

	if(opts_.echo_data) {
		send_packet<ser::channel_data>(*client_channel_, data);
	}

	unadjusted_ += std::uint32_t(data.size());
	if(opts_.adjust_after && unadjusted_ >= opts_.adjust_after) {
		send_packet<ser::channel_window_adjust>(*client_channel_, unadjusted_);
		unadjusted_ = 0;
	}
}

void test_server::handle_channel_close(const_span payload) {
	ser::channel_close::load packet(payload);
	if(!packet) {
		set_error_and_disconnect(sshlink_invalid_packet);
		return;
	}
	if(opts_.answer_close) {
		send_close();
	}
	// closed on both sides, new channel can be opened
	if(sent_close_) {
		client_channel_.reset();
		sent_close_ = false;
		unadjusted_ = 0;
	}
}

handler_result test_server::handle_transport_packet(ssh_packet_type type, const_span payload) {
	received_.push_back(type);

	switch(std::uint8_t(type)) {
		case ssh_service_request:      handle_service_request(payload); break;
		case ssh_userauth_request:     handle_userauth_request(payload); break;
		case ssh_channel_open:         handle_channel_open(payload); break;
		case ssh_channel_request:      handle_channel_request(payload); break;
		case ssh_channel_data:         handle_channel_data(payload); break;
		case ssh_channel_close:        handle_channel_close(payload); break;
		case ssh_channel_window_adjust: {
			ser::channel_window_adjust::load packet(payload);
			if(packet) {
				auto& [recipient, bytes] = packet;
				window_adjust_ += bytes;
			}
		} break;
		case ssh_channel_eof:
		case ssh_request_success:
		case ssh_request_failure:
			break;
		default:
			return handler_result::unknown;
	}
	return handler_result::handled;
}

}
