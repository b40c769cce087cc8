#ifndef SSHLINK_CLIENT_CHANNEL_SHELL_HEADER
#define SSHLINK_CLIENT_CHANNEL_SHELL_HEADER

#include "sshlink/core/connection/channel.hpp"

namespace sshlink::ssh {

class ssh_session;

/// interactive shell channel, created by ssh_session::open_shell
class channel_shell {
public:
	channel_shell(ssh_session&, channel&);
	~channel_shell();

	channel_shell(channel_shell const&) = delete;
	channel_shell& operator=(channel_shell const&) = delete;

	channel_id client_channel() const;
	channel_id server_channel() const;
	channel_state state() const;

	/// send all of the data, waits for window adjust if the remote window is used up
	bool write(const_span data);
	bool write(std::string_view data) { return write(to_span(data)); }

	/// process what has arrived without blocking and return the received data
	byte_vector read();

	/// closing handshake, fails with timeout if the remote does not answer in time
	bool close();

	ssh_error_code error() const { return error_; }
	std::string const& error_message() const { return err_message_; }

private:
	void take_error();

private:
	ssh_session& session_;
	channel& channel_;

	ssh_error_code error_{ssh_noerror};
	std::string err_message_;
};

}

#endif
