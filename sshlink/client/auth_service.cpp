#include "auth_service.hpp"

#include "sshlink/core/auth/auth_protocol.hpp"
#include "sshlink/core/packet_ser_impl.hpp"
#include "sshlink/core/service/names.hpp"
#include "sshlink/core/transport_base.hpp"

namespace sshlink::ssh {

client_auth_service::client_auth_service(transport_base& transport, std::string username, std::string service, std::string password)
: transport_(transport)
, log_(transport_.log())
, username_(std::move(username))
, service_(std::move(service))
, password_(std::move(password))
{
}

std::string_view client_auth_service::name() const {
	return user_auth_service_name;
}

service_state client_auth_service::state() const {
	return state_;
}

void client_auth_service::fail(ssh_error_code code, std::string msg) {
	log_.log(logger::error, "user authentication failed: {}", msg);
	set_error(code, std::move(msg));
	state_ = service_state::error;
}

bool client_auth_service::init() {
	if(username_.empty()) {
		fail(sshlink_user_null, "username is not set");
		return false;
	}
	if(password_.empty()) {
		fail(sshlink_password_null, "password is not set");
		return false;
	}

	log_.log(logger::debug, "sending password authentication [user={}, service={}]", username_, service_);
	if(!transport_.send_packet<ser::userauth_password_request>(username_, service_, password_auth_method, false, password_)) {
		fail(transport_.error() ? transport_.error() : sshlink_memory_error, "failed to send authentication request");
		return false;
	}
	state_ = service_state::inprogress;
	return true;
}

void client_auth_service::on_banner(std::string_view msg) {
	log_.log(logger::info, "authentication banner: {}", msg);
}

void client_auth_service::handle_banner(const_span payload) {
	ser::userauth_banner::load packet(payload);
	if(packet) {
		auto& [msg, lang] = packet;
		banner_.append(msg);
		on_banner(msg);
	} else {
		log_.log(logger::error, "Invalid banner packet from server");
		transport_.set_error_and_disconnect(ssh_protocol_error);
	}
}

void client_auth_service::handle_success() {
	log_.log(logger::info, "user authenticated [user={}, service={}]", username_, service_);
	state_ = service_state::done;
}

void client_auth_service::handle_failure(const_span payload) {
	ser::userauth_failure::load packet(payload);
	if(packet) {
		auto& [auths, partial_success] = packet;
		// partial success would need another method, which we do not have
		fail(sshlink_auth_failed, log_.format("server rejected the password [methods left={}, partial success={}]",
			auths.size(), partial_success));
	} else {
		log_.log(logger::error, "Invalid auth failure packet from server");
		transport_.set_error_and_disconnect(ssh_protocol_error);
	}
}

void client_auth_service::handle_change_password(const_span payload) {
	ser::userauth_passwd_changereq::load packet(payload);
	if(packet) {
		auto& [prompt, lang] = packet;
		fail(sshlink_auth_failed, log_.format("server requires password change: {}", prompt));
	} else {
		log_.log(logger::error, "Invalid password change request packet from server");
		transport_.set_error_and_disconnect(ssh_protocol_error);
	}
}

handler_result client_auth_service::process(ssh_packet_type type, const_span payload) {
	if(state_ != service_state::inprogress) {
		log_.log(logger::debug, "authentication packet in wrong state [type={}, state={}]", type, to_string(state_));
		return handler_result::unknown;
	}

	switch(std::uint8_t(type)) {
		case ssh_userauth_banner:           handle_banner(payload); break;
		case ssh_userauth_success:          handle_success(); break;
		case ssh_userauth_failure:          handle_failure(payload); break;
		case ssh_userauth_passwd_changereq: handle_change_password(payload); break;
		default: return handler_result::unknown;
	}
	return handler_result::handled;
}

}
