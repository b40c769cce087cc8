#ifndef SSHLINK_CLIENT_CHANNEL_EXEC_HEADER
#define SSHLINK_CLIENT_CHANNEL_EXEC_HEADER

#include "sshlink/core/connection/channel.hpp"

#include <optional>

namespace sshlink::ssh {

class ssh_session;

/// remote command execution channel, created by ssh_session::open_exec
class channel_exec {
public:
	channel_exec(ssh_session&, channel&);
	~channel_exec();

	channel_exec(channel_exec const&) = delete;
	channel_exec& operator=(channel_exec const&) = delete;

	channel_id client_channel() const;
	channel_id server_channel() const;
	channel_state state() const;

	/// send exec request and wait for the reply
	bool send_command(std::string_view command);

	/// collect output until the remote closes the channel, then finish the close handshake
	std::optional<std::string> get_output();

	/// stderr output collected by get_output
	std::string const& error_output() const { return stderr_; }

	std::optional<std::uint32_t> exit_status() const;

	ssh_error_code error() const { return error_; }
	std::string const& error_message() const { return err_message_; }

private:
	void take_error();

private:
	ssh_session& session_;
	channel& channel_;
	std::string stderr_;

	ssh_error_code error_{ssh_noerror};
	std::string err_message_;
};

}

#endif
