#ifndef SSHLINK_CLIENT_SSH_SESSION_HEADER
#define SSHLINK_CLIENT_SSH_SESSION_HEADER

#include "ssh_client.hpp"

#include "sshlink/common/string_buffers.hpp"
#include "sshlink/net/byte_stream.hpp"

#include <functional>
#include <memory>
#include <mutex>

namespace sshlink::ssh {

class channel_shell;
class channel_exec;

/** \brief Synchronous client session over non-blocking byte stream
 *
 *  Every operation runs the protocol until it completes or fails. The stream is polled,
 *  would-block means to try again. All calls are serialised with a mutex.
 *  The channel objects returned must not outlive the session.
 */
class ssh_session {
public:
	ssh_session(client_config, byte_stream&, logger&, crypto_context = default_crypto_context());
	~ssh_session();

	ssh_session(ssh_session const&) = delete;
	ssh_session& operator=(ssh_session const&) = delete;

	/// set credentials for connect, fails if either is empty
	bool set_user_and_password(std::string user, std::string password);

	/// version exchange, key exchange and user authentication
	bool connect();

	/// send disconnect by application
	void close();

	/// start key re-exchange and wait for it to complete
	bool rekey();

	session_state state() const;

	/// error of the latest failed operation
	ssh_error_code error() const;
	std::string error_message() const;

	/// open channel and wait for the confirmation
	channel* open_channel(std::string_view type);

	/// open session channel, request pty and shell
	std::unique_ptr<channel_shell> open_shell();

	/// open session channel and request pty, the command is sent with channel_exec::send_command
	std::unique_ptr<channel_exec> open_exec();

	client_config const& config() const { return config_; }

	/// underlying protocol object, nullptr before connect
	ssh_client* client() const { return client_.get(); }

private:
	friend class channel_shell;
	friend class channel_exec;

	// these expect the mutex to be locked
	bool wait_until(std::function<bool()> const& done, std::chrono::milliseconds timeout, std::string_view what);
	bool process_input();
	bool write_output();
	io_result read_input();
	bool poll_once();

	channel* do_open_channel(std::string_view type);
	bool close_channel(channel&);
	void release_channel(channel&);
	bool check_transport();

	void set_error(ssh_error_code, std::string msg);

private:
	client_config config_;
	byte_stream& stream_;
	logger& log_;
	crypto_context crypto_;

	mutable std::mutex mutex_;

	string_in_buffer in_;
	string_out_buffer out_;
	byte_vector read_buffer_;

	std::unique_ptr<ssh_client> client_;

	ssh_error_code error_{ssh_noerror};
	std::string err_message_;
};

}

#endif
