#ifndef SSHLINK_TEST_UTIL_TEST_SERVER_HEADER
#define SSHLINK_TEST_UTIL_TEST_SERVER_HEADER

#include "test/crypto.hpp"

#include "sshlink/core/ssh_transport.hpp"
#include "sshlink/core/connection/channel.hpp"

#include <vector>

namespace sshlink::ssh::test {

/// what the scripted server does
struct server_options {
	std::string username{"test"};
	std::string password{"secret"};
	std::string banner;

	// send global request with want reply before accepting the user auth service
	bool global_request_before_auth{false};

	channel_id server_channel{7};
	std::uint32_t window_size{2*1024*1024};
	std::uint32_t max_packet_size{32*1024};

	bool refuse_open{false};
	bool accept_shell{true};
	bool accept_exec{true};
	bool echo_data{true};
	bool answer_close{true};
	// send window adjust after receiving this much data (0 = never)
	std::uint32_t adjust_after{0};

	std::string exec_output{"command output\n"};
	std::string exec_stderr;
	std::uint32_t exit_status{0};
};

/** \brief Server side transport with scripted authentication and session channel handling
 *
 *  Only for driving the client in tests, accepts single channel.
 */
class test_server : public ssh_transport {
public:
	test_server(ssh_config const&, logger&, out_buffer&, crypto_context, ed25519_host_key const&, server_options = {});

	server_options& options() { return opts_; }

	std::vector<ssh_packet_type> const& received() const { return received_; }
	bool has_received(ssh_packet_type) const;
	std::size_t count_received(ssh_packet_type) const;

	std::optional<channel_id> client_channel() const { return client_channel_; }

	std::string const& received_data() const { return data_; }
	std::uint32_t received_window_adjust() const { return window_adjust_; }

	std::string const& pty_term() const { return pty_term_; }
	std::vector<std::uint32_t> const& pty_dimensions() const { return pty_dims_; }
	std::string const& pty_modes() const { return pty_modes_; }
	std::vector<std::string> const& channel_requests() const { return requests_; }
	std::string const& exec_command() const { return exec_command_; }

	/// send channel data to the client
	bool send_data(std::string_view);
	bool send_close();

	std::vector<std::string> const& remote_versions() const { return versions_; }

protected:
	std::unique_ptr<kex> construct_kex(kex_type) override;
	void on_version_exchange(ssh_version const&) override;
	handler_result handle_transport_packet(ssh_packet_type, const_span payload) override;

private:
	void handle_service_request(const_span payload);
	void handle_userauth_request(const_span payload);
	void handle_channel_open(const_span payload);
	void handle_channel_request(const_span payload);
	void handle_channel_data(const_span payload);
	void handle_channel_close(const_span payload);
	void run_command();

private:
	ed25519_host_key const& host_key_;
	server_options opts_;

	std::vector<ssh_packet_type> received_;
	std::vector<std::string> versions_;

	std::optional<channel_id> client_channel_;
	std::uint32_t client_window_{};
	bool sent_close_{};

	std::string data_;
	std::uint32_t unadjusted_{};
	std::uint32_t window_adjust_{};

	std::string pty_term_;
	std::vector<std::uint32_t> pty_dims_;
	std::string pty_modes_;
	std::vector<std::string> requests_;
	std::string exec_command_;
};

}

#endif
