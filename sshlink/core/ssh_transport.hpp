#ifndef SSHLINK_CORE_TRANSPORT_HEADER
#define SSHLINK_CORE_TRANSPORT_HEADER

#include "kexinit.hpp"
#include "packet_types.hpp"
#include "ssh_config.hpp"
#include "ssh_binary_packet.hpp"
#include "ssh_public_key.hpp"
#include "ssh_state.hpp"

#include "sshlink/common/logger.hpp"
#include "sshlink/crypto/crypto_context.hpp"

#include <chrono>
#include <iosfwd>

namespace sshlink::ssh {

class in_buffer;
class out_buffer;

enum class transport_op {
	want_read_more,
	want_write_more,
	pending_action, // handling of a packet is waiting for something outside of the transport
	disconnected
};

std::string_view to_string(transport_op);
std::ostream& operator<<(std::ostream&, transport_op);

class kex;
class kex_context;

/** \brief SSH Version 2 transport layer
 *
 *  Does not do any I/O itself: process() consumes bytes from the given input buffer and
 *  writes everything to the output buffer given in the constructor.
 */
class ssh_transport : public transport_base, private ssh_binary_packet {
public:
	ssh_transport(ssh_config const&, logger&, out_buffer&, crypto_context);
	~ssh_transport();

	/// This is the main driving function, handles at most one binary packet per call
	transport_op process(in_buffer&);

	void disconnect(std::uint32_t = ssh_disconnect_by_application, std::string_view message = {});

	ssh_state state() const;
	void set_state(ssh_state, std::optional<ssh_error_code> = std::nullopt);

	/// start key re-exchange, only possible in transport state
	bool start_rekey();

	void send_ignore(std::size_t size);

	crypto_context const& crypto() const final { return crypto_; }
	crypto_call_context call_context() const final { return crypto_call_context{logger_, *rand_}; }
	logger& log() const final { return logger_; }

	const_span session_id() const override;

	void set_error_and_disconnect(ssh_error_code, std::string_view message = {}) override;
	ssh_config const& config() const final { return config_; }
	ssh_error_code error() const final { return ssh_binary_packet::error(); }
	std::string error_message() const final { return ssh_binary_packet::error_message(); }
	void set_error(ssh_error_code code, std::string_view message = {}) override;

	/// remote identification line without CR LF
	std::string const& remote_version_line() const { return kex_data_.remote_ver; }

	/// exchange hash of the latest completed key exchange
	const_span exchange_hash() const { return exchange_hash_; }
	std::size_t completed_kex_count() const { return kex_count_; }
	crypto_configuration const& crypto_config() const { return crypto_conf_; }
	ssh_public_key const& server_host_key() const { return host_key_; }

	using ssh_binary_packet::in_sequence;
	using ssh_binary_packet::out_sequence;

protected:
	virtual void on_version_exchange(ssh_version const&);
	virtual bool handle_basic_packets(ssh_packet_type, const_span payload);
	virtual handler_result handle_kex_done(kex const&);
	virtual handler_result handle_transport_packet(ssh_packet_type, const_span payload) = 0;
	virtual void on_state_change(ssh_state, ssh_state) {}
	virtual bool flush() { return false; }

	/// construct the key exchange for the agreed type, default constructs the client side
	virtual std::unique_ptr<kex> construct_kex(kex_type);
	kex_context kex_ctx();

	std::optional<out_packet_record> alloc_out_packet(std::size_t data_size) override;
	bool write_alloced_out_packet(out_packet_record const&) override;
	std::uint32_t max_in_packet_size() override;
	std::uint32_t max_out_packet_size() override;
protected:
	using ssh_binary_packet::config_;
	using ssh_binary_packet::logger_;

private: // init & generic packet handling
	void handle_version_exchange(in_buffer& in);
	handler_result handle_binary_packet(in_buffer& in);
	handler_result process_transport_payload(span payload);
	handler_result do_handle_transport_packet(ssh_packet_type type, const_span payload);

	bool handle_kex_packet(ssh_packet_type type, const_span payload);
	bool handle_raw_kex_packet(ssh_packet_type type, const_span payload);
	bool handle_kexinit_packet(const_span payload);
	bool handle_remote_newkeys();
	void kex_set_done();
	bool create_kex(kex_type);

	void start_kex();
	bool do_rekeying();
	void send_deferred_packets();
	bool send_kex_init(bool send_first_packet);

private: // data
	crypto_context crypto_;
	out_buffer& output_;

	ssh_state state_{ssh_state::none};

	bool remote_version_received_{};
	ssh_version remote_version_;

	std::unique_ptr<random> rand_;

	// kex data
	bool kexinit_sent_{};
	bool kexinit_received_{};
	byte_vector kex_cookie_;

	kex_init_data kex_data_;
	bool ignore_next_kex_packet_{};
	bool local_kex_done_{};
	bool remote_kex_done_{};
	std::unique_ptr<kex> kex_;

	byte_vector session_id_;
	byte_vector exchange_hash_;
	std::size_t kex_count_{};
	crypto_configuration crypto_conf_;
	ssh_public_key host_key_;

	std::chrono::steady_clock::time_point rekey_time_{};

	// packets of the upper layers that were sent during key re-exchange, sent after it completes
	std::vector<byte_vector> deferred_packets_;

	bool flush_service_{};
};

}

#endif
