#include "channel_shell.hpp"
#include "ssh_session.hpp"

#include "sshlink/common/util.hpp"

namespace sshlink::ssh {

channel_shell::channel_shell(ssh_session& s, channel& ch)
: session_(s)
, channel_(ch)
{
}

channel_shell::~channel_shell() {
	std::lock_guard lock(session_.mutex_);
	session_.release_channel(channel_);
}

channel_id channel_shell::client_channel() const {
	return channel_.id();
}

channel_id channel_shell::server_channel() const {
	return channel_.remote_id();
}

channel_state channel_shell::state() const {
	std::lock_guard lock(session_.mutex_);
	return channel_.state();
}

void channel_shell::take_error() {
	if(channel_.error()) {
		error_ = channel_.error();
		err_message_ = channel_.error_message();
	} else {
		error_ = session_.error_;
		err_message_ = session_.err_message_;
	}
}

bool channel_shell::write(const_span data) {
	std::lock_guard lock(session_.mutex_);
	auto& log = session_.log_;

	std::size_t pos = 0;
	while(pos < data.size()) {
		if(!channel_.is_usable()) {
			error_ = sshlink_invalid_state;
			err_message_ = log.format("channel is not usable [state={}]", channel_.state());
			return false;
		}

		if(!channel_.out_window()) {
			log.log(logger::debug_trace, "waiting for window adjust [channel={}]", channel_.id());
			if(!session_.wait_until([&]{ return channel_.out_window() || !channel_.is_usable(); },
				session_.config_.operation_timeout, "window adjust"))
			{
				take_error();
				return false;
			}
			continue;
		}

		// one packet at time so that the output buffer does not fill up
		auto chunk = safe_subspan(data, pos, channel_.max_out_data_size());
		std::uint32_t sent = channel_.send_data(chunk);
		if(!sent || !session_.write_output() || !session_.check_transport()) {
			take_error();
			if(!error_) {
				error_ = sshlink_channel_failure;
				err_message_ = "failed to send channel data";
			}
			return false;
		}
		pos += sent;
	}
	return true;
}

byte_vector channel_shell::read() {
	std::lock_guard lock(session_.mutex_);
	if(!session_.poll_once()) {
		take_error();
	}
	return channel_.take_data();
}

bool channel_shell::close() {
	std::lock_guard lock(session_.mutex_);
	if(!session_.close_channel(channel_)) {
		take_error();
		return false;
	}
	return true;
}

}
