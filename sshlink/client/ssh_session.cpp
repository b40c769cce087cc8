#include "ssh_session.hpp"
#include "channel_exec.hpp"
#include "channel_shell.hpp"

#include "sshlink/common/util.hpp"

#include <thread>

namespace sshlink::ssh {

std::size_t const read_buffer_size{32*1024};

ssh_session::ssh_session(client_config conf, byte_stream& stream, logger& log, crypto_context cc)
: config_(std::move(conf))
, stream_(stream)
, log_(log)
, crypto_(std::move(cc))
, out_(config_.max_out_buffer_size)
{
	read_buffer_.resize(read_buffer_size);
}

ssh_session::~ssh_session() = default;

void ssh_session::set_error(ssh_error_code code, std::string msg) {
	log_.log(logger::debug, "session error [code={}, msg={}]", to_string(code), msg);
	error_ = code;
	err_message_ = std::move(msg);
}

ssh_error_code ssh_session::error() const {
	std::lock_guard lock(mutex_);
	return error_;
}

std::string ssh_session::error_message() const {
	std::lock_guard lock(mutex_);
	return err_message_;
}

session_state ssh_session::state() const {
	std::lock_guard lock(mutex_);
	return client_ ? client_->state_of_session() : session_state::connected;
}

bool ssh_session::set_user_and_password(std::string user, std::string password) {
	std::lock_guard lock(mutex_);
	if(user.empty()) {
		set_error(sshlink_user_null, "username is empty");
		return false;
	}
	if(password.empty()) {
		set_error(sshlink_password_null, "password is empty");
		return false;
	}
	config_.username = std::move(user);
	config_.password = std::move(password);
	return true;
}

bool ssh_session::check_transport() {
	if(client_->state() == ssh_state::disconnected) {
		set_error(client_->error() ? client_->error() : sshlink_connection_closed,
			client_->error_message().empty() ? std::string(to_string(client_->error())) : client_->error_message());
		return false;
	}
	return true;
}

bool ssh_session::write_output() {
	while(!out_.empty()) {
		io_result r = stream_.write(out_.committed());
		if(r == io_result::data) {
			out_.extract_committed();
		} else if(r == io_result::would_block) {
			std::this_thread::yield();
		} else {
			log_.log(logger::error, "failed to write to stream [{}]", to_string(r));
			client_->set_state(ssh_state::disconnected, r == io_result::eof ? sshlink_connection_closed : sshlink_io_error);
			return check_transport();
		}
	}
	return true;
}

io_result ssh_session::read_input() {
	std::size_t size{};
	io_result r = stream_.read(read_buffer_, size);
	if(r == io_result::data) {
		log_.log(logger::debug_trace, "read {} bytes from stream", size);
		in_.add(safe_subspan(read_buffer_, 0, size));
	}
	return r;
}

bool ssh_session::process_input() {
	bool progress = false;
	do {
		std::size_t size = in_.size();
		bool had_output = !out_.empty();
		transport_op op = client_->process(in_);
		if(!write_output()) {
			return false;
		}
		if(op == transport_op::disconnected) {
			break;
		}
		progress = in_.size() != size || (op == transport_op::want_write_more && had_output);
	} while(progress);

	return check_transport();
}

bool ssh_session::poll_once() {
	if(!process_input()) {
		return false;
	}
	io_result r = read_input();
	if(r == io_result::data) {
		return process_input();
	}
	if(r == io_result::eof || r == io_result::error) {
		client_->set_state(ssh_state::disconnected, r == io_result::eof ? sshlink_connection_closed : sshlink_io_error);
		return check_transport();
	}
	return true;
}

bool ssh_session::wait_until(std::function<bool()> const& done, std::chrono::milliseconds timeout, std::string_view what) {
	auto const start = std::chrono::steady_clock::now();
	while(true) {
		if(!process_input()) {
			return false;
		}
		if(done()) {
			return true;
		}
		if(timeout.count() && std::chrono::steady_clock::now() - start >= timeout) {
			set_error(sshlink_timeout, log_.format("timeout while waiting for {}", what));
			return false;
		}

		io_result r = read_input();
		if(r == io_result::would_block) {
			std::this_thread::yield();
		} else if(r == io_result::eof || r == io_result::error) {
			log_.log(logger::info, "stream closed while waiting for {} [{}]", what, to_string(r));
			client_->set_state(ssh_state::disconnected, r == io_result::eof ? sshlink_connection_closed : sshlink_io_error);
			return check_transport();
		}
	}
}

bool ssh_session::connect() {
	std::lock_guard lock(mutex_);
	if(client_) {
		set_error(sshlink_invalid_state, "already connected");
		return false;
	}
	// nothing is sent with invalid credentials
	if(config_.username.empty()) {
		set_error(sshlink_user_null, "username is empty");
		return false;
	}
	if(config_.password.empty()) {
		set_error(sshlink_password_null, "password is empty");
		return false;
	}

	client_ = std::make_unique<ssh_client>(config_, log_, out_, crypto_);
	bool res = wait_until([&]{ return client_->state_of_session() == session_state::authenticated; },
		config_.operation_timeout, "authentication");

	if(res) {
		log_.log(logger::info, "connected [remote={}]", client_->remote_version_line());
	}
	return res;
}

void ssh_session::close() {
	std::lock_guard lock(mutex_);
	if(client_ && client_->state() != ssh_state::disconnected) {
		client_->disconnect(ssh_disconnect_by_application, "closed by application");
		write_output();
	}
}

bool ssh_session::rekey() {
	std::lock_guard lock(mutex_);
	if(!client_ || !client_->start_rekey()) {
		set_error(sshlink_invalid_state, "cannot start key exchange");
		return false;
	}
	std::size_t count = client_->completed_kex_count();
	return wait_until([&]{ return client_->completed_kex_count() > count; }, config_.operation_timeout, "key exchange");
}

channel* ssh_session::do_open_channel(std::string_view type) {
	if(!client_ || client_->state_of_session() != session_state::authenticated || !client_->connection()) {
		set_error(sshlink_invalid_state, "not authenticated");
		return nullptr;
	}

	channel* ch = client_->connection()->open_channel(type);
	if(!ch) {
		set_error(sshlink_channel_open_failed, "failed to send channel open");
		return nullptr;
	}

	if(!wait_until([&]{ return ch->state() != channel_state::requested; }, config_.operation_timeout, "channel open")) {
		return nullptr;
	}

	if(ch->state() != channel_state::open) {
		set_error(ch->error() ? ch->error() : sshlink_channel_open_failed, ch->error_message());
		release_channel(*ch);
		return nullptr;
	}

	log_.log(logger::debug, "channel opened [client={}, server={}]", ch->id(), ch->remote_id());
	return ch;
}

channel* ssh_session::open_channel(std::string_view type) {
	std::lock_guard lock(mutex_);
	return do_open_channel(type);
}

std::unique_ptr<channel_shell> ssh_session::open_shell() {
	std::lock_guard lock(mutex_);
	channel* ch = do_open_channel(session_channel_type);
	if(!ch) {
		return nullptr;
	}

	bool res = ch->send_pty_request(config_.pty) && ch->send_shell_request();
	if(res) {
		res = wait_until([&]{ return !ch->pending_requests() || !ch->is_usable(); }, config_.operation_timeout, "shell request reply");
	}

	if(!res || ch->state() != channel_state::shell_ready) {
		if(res || ch->error()) {
			set_error(ch->error() ? ch->error() : sshlink_channel_request_failed, ch->error_message());
		}
		if(client_->state() != ssh_state::disconnected) {
			close_channel(*ch);
		}
		release_channel(*ch);
		return nullptr;
	}

	return std::make_unique<channel_shell>(*this, *ch);
}

std::unique_ptr<channel_exec> ssh_session::open_exec() {
	std::lock_guard lock(mutex_);
	channel* ch = do_open_channel(session_channel_type);
	if(!ch) {
		return nullptr;
	}

	if(!ch->send_pty_request(config_.pty) || !ch->set_exec_ready() || !write_output()) {
		set_error(ch->error() ? ch->error() : sshlink_channel_request_failed, "failed to request pty");
		release_channel(*ch);
		return nullptr;
	}

	return std::make_unique<channel_exec>(*this, *ch);
}

bool ssh_session::close_channel(channel& ch) {
	if(ch.state() == channel_state::closed) {
		return true;
	}
	if(!ch.send_close()) {
		set_error(sshlink_channel_failure, "failed to send channel close");
		return false;
	}

	bool res = wait_until([&]{ return ch.state() == channel_state::closed; }, config_.close_timeout, "channel close");
	if(!res && error_ == sshlink_timeout) {
		ch.close_timed_out();
	}
	return res;
}

void ssh_session::release_channel(channel& ch) {
	if(client_ && client_->connection()) {
		client_->connection()->remove_channel(ch.id());
	}
}

}
