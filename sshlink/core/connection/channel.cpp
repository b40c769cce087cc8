#include "channel.hpp"

#include "sshlink/common/util.hpp"
#include "sshlink/core/packet_ser_impl.hpp"
#include "sshlink/core/service/names.hpp"

#include <algorithm>
#include <limits>
#include <ostream>

namespace sshlink::ssh {

namespace {
// terminal mode opcodes (rfc4254 section 8)
std::uint8_t const tty_op_end{0};
std::uint8_t const tty_op_ispeed{128};
std::uint8_t const tty_op_ospeed{129};

// message number, recipient channel and data length of channel data packet
std::uint32_t const data_packet_overhead = 9;
}

byte_vector encode_terminal_modes(pty_config const& pty) {
	byte_vector modes;
	ssh_bf_writer w(modes);
	w.write(tty_op_ispeed);
	w.write(pty.input_speed);
	w.write(tty_op_ospeed);
	w.write(pty.output_speed);
	w.write(tty_op_end);
	modes.resize(w.used_size());
	return modes;
}

std::string_view to_string(channel_state s) {
	using enum channel_state;
	switch(s) {
		case none:        return "none";
		case requested:   return "requested";
		case open:        return "open";
		case shell_ready: return "shell_ready";
		case exec_ready:  return "exec_ready";
		case closing:     return "closing";
		case closed:      return "closed";
	}
	return "unknown";
}

std::ostream& operator<<(std::ostream& out, channel_state s) {
	return out << to_string(s);
}

channel::channel(transport_base& transport, channel_side_info local)
: transport_(transport)
, log_(transport_.log())
, local_info_(std::move(local))
{
	log_.log(logger::debug_trace, "channel id={} constructed", local_info_.id);
	local_info_.max_packet_size =
		std::min(local_info_.max_packet_size, transport_.max_in_packet_size() - data_packet_overhead);
	in_available_ = local_info_.window_size;
}

channel::~channel()
{
	log_.log(logger::debug_trace, "channel id={} destroyed", local_info_.id);
}

void channel::set_error(ssh_error_code code, std::string msg) {
	log_.log(logger::error, "channel id={} error: {} [{}]", local_info_.id, msg, to_string(code));
	if(!error_) {
		error_ = code;
		err_message_ = std::move(msg);
	}
}

bool channel::send_open(std::string_view type) {
	bool res = transport_.send_packet<ser::channel_open>(
		type,
		local_info_.id,
		local_info_.window_size,
		local_info_.max_packet_size);
	if(res) {
		set_state(channel_state::requested);
	}
	return res;
}

bool channel::send_pty_request(pty_config const& pty) {
	if(!is_usable()) {
		set_error(sshlink_invalid_state, "pty request on unusable channel");
		return false;
	}
	byte_vector modes = encode_terminal_modes(pty);
	return transport_.send_packet<ser::channel_pty_request>(
		remote_info_.id,
		std::string_view("pty-req"),
		false,
		std::string_view(pty.term),
		pty.width_chars,
		pty.height_rows,
		pty.width_pixels,
		pty.height_pixels,
		to_string_view(modes));
}

bool channel::send_shell_request() {
	if(state_ != channel_state::open) {
		set_error(sshlink_invalid_state, "shell request on channel that is not open");
		return false;
	}
	bool res = transport_.send_packet<ser::channel_request>(remote_info_.id, std::string_view("shell"), true);
	if(res) {
		pending_requests_.push_back(request_type::shell);
	}
	return res;
}

bool channel::send_exec_request(std::string_view command) {
	if(state_ != channel_state::exec_ready) {
		set_error(sshlink_invalid_state, "exec request on channel that is not in exec mode");
		return false;
	}
	bool res = transport_.send_packet<ser::channel_exec_request>(remote_info_.id, std::string_view("exec"), true, command);
	if(res) {
		exec_accepted_ = false;
		pending_requests_.push_back(request_type::exec);
	}
	return res;
}

bool channel::set_exec_ready() {
	if(state_ != channel_state::open) {
		set_error(sshlink_invalid_state, "channel is not open");
		return false;
	}
	set_state(channel_state::exec_ready);
	return true;
}

std::uint32_t channel::send_data(const_span s) {
	if(!is_usable() || sent_eof_) {
		// we are closing or already closed, abort sending
		return 0;
	}

	// bounded by the out window, so the total always fits in 32 bits
	std::uint32_t pos = 0;
	while(out_window_ && pos < s.size()) {
		std::uint32_t size = std::uint32_t(std::min<std::size_t>(std::min(out_window_, max_out_size_), s.size() - pos));
		if(!size) {
			break;
		}

		auto data_span = safe_subspan(s, pos, size);
		if(!transport_.send_packet<ser::channel_data>(remote_info_.id, to_string_view(data_span))) {
			log_.log(logger::debug_trace, "could not send channel data [id={}, pos={}, size={}]", local_info_.id, pos, size);
			break;
		}
		pos += size;
		out_window_ -= size;
	}

	return pos;
}

bool channel::send_eof() {
	bool res = true;
	if(!sent_eof_ && !sent_close_) {
		res = transport_.send_packet<ser::channel_eof>(remote_info_.id);
		sent_eof_ = res;
	}
	return res;
}

bool channel::send_close() {
	bool res = true;
	if(!sent_close_ && state_ >= channel_state::open && state_ < channel_state::closed) {
		res = transport_.send_packet<ser::channel_close>(remote_info_.id);
		if(res) {
			sent_close_ = true;
			if(received_close_) {
				set_state(channel_state::closed);
			} else if(state_ != channel_state::closing) {
				set_state(channel_state::closing);
			}
		}
	}
	return res;
}

bool channel::send_window_adjust(std::uint32_t n) {
	bool ret = transport_.send_packet<ser::channel_window_adjust>(remote_info_.id, n);
	if(ret) {
		in_available_ += n;
		in_consumed_ -= std::min(n, in_consumed_);
	}
	return ret;
}

void channel::close_timed_out() {
	if(state_ != channel_state::closed) {
		set_error(sshlink_timeout, "timeout while waiting channel close");
		set_state(channel_state::closed);
	}
}

void channel::on_confirm(channel_side_info remote, const_span /*extra_data*/) {
	if(state_ != channel_state::requested) {
		transport_.set_error_and_disconnect(ssh_protocol_error, "unexpected channel open confirmation");
		return;
	}
	log_.log(logger::info, "channel open confirmed id={} ({}) [out window={}]", local_info_.id, remote.id, remote.window_size);
	remote_info_ = remote;
	out_window_ = remote_info_.window_size;
	max_out_size_ = std::min(remote_info_.max_packet_size, transport_.max_out_packet_size() - data_packet_overhead);
	set_state(channel_state::open);
}

void channel::on_open_failure(std::uint32_t code, std::string_view message) {
	if(state_ != channel_state::requested) {
		transport_.set_error_and_disconnect(ssh_protocol_error, "unexpected channel open failure");
		return;
	}
	log_.log(logger::info, "failed to open channel id={} (remote refuses) [code={}, msg={}]", local_info_.id, code, message);
	set_error(sshlink_channel_open_failed, log_.format("channel open failed (code={}): {}", code, message));
	set_state(channel_state::closed);
}

bool channel::check_in_data(std::size_t size) {
	if(received_close_ || eof_received_) {
		transport_.set_error_and_disconnect(ssh_protocol_error, "channel data after eof or close");
		return false;
	}
	if(size > in_available_ || size > local_info_.max_packet_size) {
		transport_.set_error_and_disconnect(ssh_protocol_error,
			log_.format("channel data exceeds window [size={}, window={}]", size, in_available_));
		return false;
	}
	return true;
}

void channel::on_data(const_span d) {
	if(check_in_data(d.size())) {
		in_data_.insert(in_data_.end(), d.begin(), d.end());
		adjust_in_window(std::uint32_t(d.size()));
	}
}

void channel::on_extended_data(std::uint32_t data_type, const_span d) {
	if(check_in_data(d.size())) {
		if(data_type == ser::extended_data_stderr) {
			in_ext_data_.insert(in_ext_data_.end(), d.begin(), d.end());
		} else {
			log_.log(logger::debug, "ignoring extended data [id={}, type={}, size={}]", local_info_.id, data_type, d.size());
		}
		adjust_in_window(std::uint32_t(d.size()));
	}
}

void channel::on_window_adjust(std::uint32_t bytes) {
	log_.log(logger::debug_trace, "adjusting out window id={} [bytes={}]", local_info_.id, bytes);
	// lets not increase the size over 2^32-1
	out_window_ += std::min(bytes, std::numeric_limits<std::uint32_t>::max() - out_window_);
}

void channel::on_eof() {
	log_.log(logger::debug, "received eof for channel id={}", local_info_.id);
	eof_received_ = true;
}

void channel::on_close() {
	log_.log(logger::debug_trace, "received close for channel id={}", local_info_.id);
	if(!received_close_) {
		received_close_ = true;
		if(state_ == channel_state::requested) {
			// no remote id to answer to yet
			set_error(sshlink_channel_open_failed, "channel closed before open confirmation");
			set_state(channel_state::closed);
			return;
		}
		if(!sent_close_) {
			// acknowledge the close
			sent_close_ = transport_.send_packet<ser::channel_close>(remote_info_.id);
		}
		if(state_ != channel_state::closed) {
			set_state(channel_state::closed);
		}
	}
}

void channel::on_request(std::string_view name, bool reply, const_span extra_data) {
	log_.log(logger::debug_trace, "received channel request [name={}, reply={}]", name, reply);
	bool handled = false;
	if(name == "exit-status") {
		ssh_bf_reader r(extra_data);
		std::uint32_t status{};
		if(r.read(status)) {
			log_.log(logger::debug, "exit status for channel id={} [status={}]", local_info_.id, status);
			exit_status_ = status;
			handled = true;
		}
	} else if(name == "exit-signal") {
		ssh_bf_reader r(extra_data);
		std::string_view signal;
		if(r.read(signal)) {
			log_.log(logger::info, "remote process terminated by signal {} [id={}]", signal, local_info_.id);
			handled = true;
		}
	}

	if(reply) {
		if(handled) {
			transport_.send_packet<ser::channel_success>(remote_info_.id);
		} else {
			transport_.send_packet<ser::channel_failure>(remote_info_.id);
		}
	}
}

void channel::on_request_success() {
	if(pending_requests_.empty()) {
		log_.log(logger::debug, "channel request success without request [id={}]", local_info_.id);
		return;
	}
	request_type t = pending_requests_.front();
	pending_requests_.pop_front();

	if(t == request_type::shell) {
		log_.log(logger::debug, "shell request accepted [id={}]", local_info_.id);
		if(state_ == channel_state::open) {
			set_state(channel_state::shell_ready);
		}
	} else {
		log_.log(logger::debug, "exec request accepted [id={}]", local_info_.id);
		exec_accepted_ = true;
	}
}

void channel::on_request_failure() {
	if(pending_requests_.empty()) {
		set_error(sshlink_channel_failure, "channel failure without request");
		return;
	}
	request_type t = pending_requests_.front();
	pending_requests_.pop_front();

	set_error(sshlink_channel_request_failed,
		t == request_type::shell ? "shell request rejected" : "exec request rejected");
}

// wait for half of the window and then adjust
void channel::adjust_in_window(std::uint32_t s) {
	in_available_ -= std::min(s, in_available_);
	in_consumed_ += s;
	if(in_consumed_ >= local_info_.window_size/2 && !sent_close_) {
		log_.log(logger::debug_trace, "adjusting in window [consumed={}, window_size={}]", in_consumed_, local_info_.window_size);
		send_window_adjust(in_consumed_);
	}
}

byte_vector channel::take_data() {
	byte_vector res;
	res.swap(in_data_);
	return res;
}

byte_vector channel::take_extended_data() {
	byte_vector res;
	res.swap(in_ext_data_);
	return res;
}

void channel::set_state(channel_state s) {
	SSHLINK_ASSERT(state_ < s, "invalid state change");
	log_.log(logger::debug_trace, "changing state for channel id={} [{} -> {}]", local_info_.id, state_, s);
	state_ = s;
	on_state_change();
}

}
