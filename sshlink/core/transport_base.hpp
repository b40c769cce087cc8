#ifndef SSHLINK_CORE_TRANSPORT_BASE_HEADER
#define SSHLINK_CORE_TRANSPORT_BASE_HEADER

#include "errors.hpp"
#include "ssh_config.hpp"
#include "packet_ser_impl.hpp"
#include "sshlink/common/logger.hpp"
#include "sshlink/common/types.hpp"
#include "sshlink/crypto/crypto_context.hpp"

#include <optional>

namespace sshlink::ssh {

/// internal type to hold allocated space information when sending packet
struct out_packet_record {
	// size of the whole packet with padding and tag
	std::size_t size{};
	// size of the payload
	std::size_t payload_size{};
	// size of the random padding
	std::size_t padding_size{};
	// this is where the payload is written to, sub-span of data_buffer
	span data;
	// buffer for the whole transport packet
	span data_buffer;
	// if this record is allocated directly from the output buffer
	bool inplace{};
};

/// common interface for ssh transport that is used by kex, authentication and channels
class transport_base {
public:
	virtual ~transport_base() = default;

	virtual ssh_error_code error() const = 0;
	virtual std::string error_message() const = 0;
	virtual void set_error(ssh_error_code code, std::string_view message = {}) = 0;

	/// set error and send disconnect packet with the error in it
	virtual void set_error_and_disconnect(ssh_error_code, std::string_view message = {}) = 0;

	virtual ssh_config const& config() const = 0;
	virtual logger& log() const = 0;
	virtual crypto_context const& crypto() const = 0;
	virtual crypto_call_context call_context() const = 0;

	/// session identifier, empty until the first key exchange is done
	virtual const_span session_id() const = 0;

	/// allocate space in buffer to send packet with certain size
	virtual std::optional<out_packet_record> alloc_out_packet(std::size_t data_size) = 0;
	/// write the allocated packet to buffer, must pass out_packet_record returned by alloc_out_packet
	virtual bool write_alloced_out_packet(out_packet_record const&) = 0;

	/// maximum payload sizes that fit in the transport packets
	virtual std::uint32_t max_in_packet_size() = 0;
	virtual std::uint32_t max_out_packet_size() = 0;

	template<typename Packet, typename... Args>
	bool send_packet(Args&&... args);

	bool send_payload(const_span payload);
};

template<typename Packet, typename... Args>
bool transport_base::send_packet(Args&&... args) {
	log().log(logger::debug_trace, "SSH sending packet [type={}]", ssh_packet_type(Packet::packet_type));

	typename Packet::save packet(std::forward<Args>(args)...);

	auto rec = alloc_out_packet(packet.size());
	if(!rec) {
		set_error(sshlink_memory_error, "Could not allocate buffer for sending packet");
		return false;
	}

	if(!packet.write(rec->data)) {
		set_error(sshlink_invalid_data, "Could not serialise packet");
		return false;
	}

	return write_alloced_out_packet(*rec);
}

}

#endif
