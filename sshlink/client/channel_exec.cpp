#include "channel_exec.hpp"
#include "ssh_session.hpp"

namespace sshlink::ssh {

channel_exec::channel_exec(ssh_session& s, channel& ch)
: session_(s)
, channel_(ch)
{
}

channel_exec::~channel_exec() {
	std::lock_guard lock(session_.mutex_);
	session_.release_channel(channel_);
}

channel_id channel_exec::client_channel() const {
	return channel_.id();
}

channel_id channel_exec::server_channel() const {
	return channel_.remote_id();
}

channel_state channel_exec::state() const {
	std::lock_guard lock(session_.mutex_);
	return channel_.state();
}

std::optional<std::uint32_t> channel_exec::exit_status() const {
	std::lock_guard lock(session_.mutex_);
	return channel_.exit_status();
}

void channel_exec::take_error() {
	if(channel_.error()) {
		error_ = channel_.error();
		err_message_ = channel_.error_message();
	} else {
		error_ = session_.error_;
		err_message_ = session_.err_message_;
	}
}

bool channel_exec::send_command(std::string_view command) {
	std::lock_guard lock(session_.mutex_);
	session_.log_.log(logger::debug, "sending exec request [channel={}, command={}]", channel_.id(), command);

	if(!channel_.send_exec_request(command)) {
		take_error();
		return false;
	}

	bool res = session_.wait_until([&]{ return !channel_.pending_requests() || !channel_.is_usable(); },
		session_.config_.operation_timeout, "exec request reply");

	if(!res || !channel_.exec_accepted()) {
		take_error();
		if(!error_) {
			error_ = sshlink_channel_request_failed;
			err_message_ = "exec request was not accepted";
		}
		return false;
	}
	return true;
}

std::optional<std::string> channel_exec::get_output() {
	std::lock_guard lock(session_.mutex_);

	std::string out;
	auto collect = [&] {
		auto data = channel_.take_data();
		out.append(to_string_view(data));
		auto ext = channel_.take_extended_data();
		stderr_.append(to_string_view(ext));
	};

	bool res = session_.wait_until([&]{ collect(); return channel_.close_received(); },
		session_.config_.operation_timeout, "command output");
	collect();

	if(!res) {
		take_error();
		return std::nullopt;
	}

	// the close was already acknowledged when received
	if(!session_.close_channel(channel_)) {
		take_error();
		return std::nullopt;
	}
	return out;
}

}
