#ifndef SSHLINK_CORE_BINARY_PACKET_HEADER
#define SSHLINK_CORE_BINARY_PACKET_HEADER

#include "errors.hpp"
#include "packet_types.hpp"
#include "ssh_config.hpp"
#include "ssh_constants.hpp"
#include "transport_base.hpp"

#include "sshlink/common/buffers.hpp"
#include "sshlink/common/logger.hpp"
#include "sshlink/crypto/cipher.hpp"
#include "sshlink/crypto/random.hpp"

#include <memory>
#include <optional>
#include <string>

namespace sshlink::ssh {

/// Crypto state and counters for single direction
struct stream_crypto {
	/// sequence number of packet, incremented after every binary protocol packet and let wrap around
	std::uint32_t packet_sequence{};
	std::size_t block_size{minimum_block_size};

	/// null until the first NEWKEYS for this direction
	std::unique_ptr<ssh::cipher> cipher;

	/// cipher->tag_size() when encrypting, otherwise 0
	std::size_t tag_size{};

	/// bytes that has been transferred since the keys were set
	std::uint64_t transferred_bytes{};
};

/// status of incoming packet that is currently being handled
enum class in_packet_status {
	waiting_header, // not enough data to know the packet length
	waiting_data,   // we know the packet length, waiting for rest of the packet
	data_ready      // whole packet authenticated and decrypted, payload is ready
};

struct in_packet_info {
	in_packet_status status{in_packet_status::waiting_header};
	std::size_t packet_size{}; // size of the whole packet including the tag, available after decoding the header
	span payload{};            // decrypted payload to be handled
	std::uint32_t sequence{};  // sequence number of the incoming packet

	void clear() {
		*this = in_packet_info{};
	}
};

struct stream_out_crypto : public stream_crypto {
	// buffer for output data, contains encrypted packet(s) that did not fit to the output buffer
	byte_vector buffer;
	// the unhandled portion of buffer, always from the start of the buffer
	span data;
};

/** \brief SSH binary packet protocol (rfc4253 section 6)
 *
 *  Frames payloads as "uint32 packet_length, byte padding_length, payload, padding" and
 *  protects them with the current authenticated cipher of the direction.
 */
class ssh_binary_packet {
public:
	ssh_binary_packet(ssh_config const& config, logger& logger);

	ssh_error_code error() const;
	std::string error_message() const;

	void set_error(ssh_error_code code, std::string_view message = {});

	ssh_config const& config() const;

	void set_random(random&);

	/// the new cipher takes effect from the next packet
	void set_input_crypto(std::unique_ptr<ssh::cipher> cipher);
	void set_output_crypto(std::unique_ptr<ssh::cipher> cipher);

	std::uint32_t in_sequence() const { return stream_in_.packet_sequence; }
	std::uint32_t out_sequence() const { return stream_out_.packet_sequence; }

public: //input
	/// decode the packet length, returns false if not enough data or the header is invalid (check error())
	bool try_decode_header(const_span in_data);

	/// authenticate and decrypt whole packet in place, returns the payload or empty span on error
	span decrypt_packet(span in_data);

	in_packet_info const& current_in_packet() const { return stream_in_.current_packet; }

public: //output
	std::optional<out_packet_record> alloc_out_packet(std::size_t data_size, out_buffer&);
	bool create_out_packet(out_packet_record const&, out_buffer&);

	/// try to send pending data out from the internal buffer, returns true if nothing left
	bool send_pending(out_buffer&);

	bool has_pending_out() const { return !stream_out_.data.empty(); }

protected:
	std::size_t padding_for(std::size_t payload_size) const;
	bool valid_packet_length(std::uint32_t length) const;
	span extract_payload(span packet);

private:
	void set_crypto(stream_crypto&, std::unique_ptr<ssh::cipher> cipher);
	bool reserve_out_buffer(std::size_t);

protected:
	ssh_config const& config_;
	logger& logger_;
	random* random_{};

	ssh_error_code error_{};
	std::string error_msg_;

	struct : stream_crypto {
		in_packet_info current_packet;
	} stream_in_;

	stream_out_crypto stream_out_;
};

}

#endif
