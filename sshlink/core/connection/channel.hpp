#ifndef SSHLINK_CORE_CONNECTION_CHANNEL_HEADER
#define SSHLINK_CORE_CONNECTION_CHANNEL_HEADER

#include "conn_protocol.hpp"

#include "sshlink/common/types.hpp"
#include "sshlink/core/errors.hpp"
#include "sshlink/core/transport_base.hpp"

#include <deque>
#include <iosfwd>
#include <optional>

namespace sshlink::ssh {

using channel_id = std::uint32_t;

// this is either the local or remote side of the channel
struct channel_side_info {
	channel_id id{};
	std::uint32_t window_size{};
	std::uint32_t max_packet_size{};
};

struct channel_config {
	// receive window we advertise, window adjust is sent when half of it is consumed
	std::uint32_t window_size{2*1024*1024};
	std::uint32_t max_packet_size{32*1024};
};

/// pseudo-terminal parameters (rfc4254 section 6.2)
struct pty_config {
	std::string term{"xterm"};
	std::uint32_t width_chars{80};
	std::uint32_t height_rows{24};
	std::uint32_t width_pixels{640};
	std::uint32_t height_pixels{480};
	std::uint32_t input_speed{115200};
	std::uint32_t output_speed{115200};
};

/// encoded terminal modes for pty-req (rfc4254 section 8)
byte_vector encode_terminal_modes(pty_config const&);

enum class channel_state {
	none,
	requested,   //we have sent open and are waiting for open confirmation or failure
	open,        //remote side confirmed the open
	shell_ready, //pty and shell requests accepted
	exec_ready,  //pty requested, exec requests can be sent
	closing,     //close sent or received, waiting for the other side
	closed
};
std::string_view to_string(channel_state);
std::ostream& operator<<(std::ostream&, channel_state);

/// Client side session channel (rfc4254 section 6)
class channel {
public:
	channel(transport_base& transport, channel_side_info local);
	virtual ~channel();

	/// client channel id
	channel_id id() const { return local_info_.id; }
	/// server channel id, valid after the open confirmation
	channel_id remote_id() const { return remote_info_.id; }

	channel_state state() const { return state_; }
	bool is_usable() const { return state_ >= channel_state::open && state_ < channel_state::closing; }

	ssh_error_code error() const { return error_; }
	std::string error_message() const { return err_message_; }

public: //out
	bool send_open(std::string_view type);

	/// pty request is sent without asking for reply
	bool send_pty_request(pty_config const&);

	/// shell and exec requests want reply, the reply is handled in on_request_success/on_request_failure
	bool send_shell_request();
	bool send_exec_request(std::string_view command);

	/// after pty request the channel is ready to take exec requests
	bool set_exec_ready();

	/// send data packets within the remote window, returns the amount of sent bytes
	std::uint32_t send_data(const_span);

	/// send eof packet, after this one should not send anything any more but can receive
	bool send_eof();

	/// send close packet and initiate closing of the channel
	bool send_close();

	/// send packet to adjust our receive window by n-bytes
	bool send_window_adjust(std::uint32_t n);

	/// closing handshake did not complete in time
	void close_timed_out();

public: //in
	virtual void on_confirm(channel_side_info remote, const_span extra_data);
	virtual void on_open_failure(std::uint32_t code, std::string_view message);
	virtual void on_data(const_span);
	virtual void on_extended_data(std::uint32_t data_type, const_span);
	virtual void on_window_adjust(std::uint32_t bytes);
	virtual void on_eof();
	virtual void on_close();
	virtual void on_request(std::string_view name, bool reply, const_span extra_data);
	// the responses for requests come in the order the requests were sent
	virtual void on_request_success();
	virtual void on_request_failure();

public:
	/// take received channel data
	byte_vector take_data();
	/// take received extended data (stderr)
	byte_vector take_extended_data();
	bool has_data() const { return !in_data_.empty() || !in_ext_data_.empty(); }

	bool eof_received() const { return eof_received_; }
	bool close_sent() const { return sent_close_; }
	bool close_received() const { return received_close_; }

	/// number of sent requests that wait for reply
	std::size_t pending_requests() const { return pending_requests_.size(); }
	bool exec_accepted() const { return exec_accepted_; }
	std::optional<std::uint32_t> exit_status() const { return exit_status_; }

	/// how much we can still send
	std::uint32_t out_window() const { return out_window_; }
	/// maximum data size in single data packet
	std::uint32_t max_out_data_size() const { return max_out_size_; }
	/// bytes received since the last window adjust
	std::uint32_t in_window_consumed() const { return in_consumed_; }
	/// bytes the remote side may still send before we adjust the window
	std::uint32_t in_window_available() const { return in_available_; }

	channel_side_info const& local_info() const { return local_info_; }
	channel_side_info const& remote_info() const { return remote_info_; }

protected:
	enum class request_type {
		shell,
		exec
	};

	virtual void adjust_in_window(std::uint32_t size);
	virtual void on_state_change() {}

	void set_state(channel_state);
	void set_error(ssh_error_code, std::string msg);
	bool check_in_data(std::size_t size);

protected:
	transport_base& transport_;
	logger& log_;

	channel_side_info local_info_;
	channel_side_info remote_info_;
	channel_state state_{channel_state::none};

	ssh_error_code error_{ssh_noerror};
	std::string err_message_;

	bool sent_close_{};
	bool received_close_{};
	bool sent_eof_{};
	bool eof_received_{};

	std::deque<request_type> pending_requests_;
	bool exec_accepted_{};
	std::optional<std::uint32_t> exit_status_;

	std::uint32_t max_out_size_{};
	// how much we have window left for sending
	std::uint32_t out_window_{};
	// how much we have received since the last window adjust
	std::uint32_t in_consumed_{};
	// how much the remote side can still send
	std::uint32_t in_available_{};

	byte_vector in_data_;
	byte_vector in_ext_data_;
};

}

#endif
