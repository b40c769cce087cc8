#include "ssh_binary_packet.hpp"
#include "ssh_binary_util.hpp"

#include <cstring>

namespace sshlink::ssh {

ssh_binary_packet::ssh_binary_packet(ssh_config const& config, logger& logger)
: config_(config)
, logger_(logger)
{
}

ssh_config const& ssh_binary_packet::config() const {
	return config_;
}

ssh_error_code ssh_binary_packet::error() const {
	return error_;
}

std::string ssh_binary_packet::error_message() const {
	return error_msg_;
}

void ssh_binary_packet::set_error(ssh_error_code code, std::string_view message) {
	error_ = code;
	error_msg_ = message.empty() ? std::string(to_string(code)) : std::string(message);
}

void ssh_binary_packet::set_random(random& r) {
	random_ = &r;
}

void ssh_binary_packet::set_crypto(stream_crypto& s, std::unique_ptr<ssh::cipher> cipher) {
	SSHLINK_ASSERT(cipher, "invalid cipher");
	s.cipher = std::move(cipher);
	s.tag_size = s.cipher->tag_size();
	s.block_size = std::max(minimum_block_size, s.cipher->block_size());
	s.transferred_bytes = 0;
	SSHLINK_ASSERT(s.block_size < maximum_padding_size, "too big cipher block size");
}

void ssh_binary_packet::set_input_crypto(std::unique_ptr<ssh::cipher> cipher) {
	logger_.log(logger::debug, "SSH starting to decrypt incoming packets [seq={}]", stream_in_.packet_sequence);
	set_crypto(stream_in_, std::move(cipher));
}

void ssh_binary_packet::set_output_crypto(std::unique_ptr<ssh::cipher> cipher) {
	logger_.log(logger::debug, "SSH starting to encrypt outgoing packets [seq={}]", stream_out_.packet_sequence);
	set_crypto(stream_out_, std::move(cipher));
}

/*
	With the authenticated ciphers the packet_length field is not part of the
	block alignment, otherwise the whole packet is.
*/
bool ssh_binary_packet::valid_packet_length(std::uint32_t length) const {
	if(length < padding_size + 1 + minimum_padding_size) {
		return false;
	}
	if(length > config_.max_in_packet_size) {
		return false;
	}
	std::size_t aligned = stream_in_.cipher ? length : packet_length_size + length;
	return aligned % stream_in_.block_size == 0;
}

bool ssh_binary_packet::try_decode_header(const_span in_data) {
	if(in_data.size() < packet_length_size) {
		return false;
	}

	std::byte length_buf[packet_length_size];
	if(stream_in_.cipher && stream_in_.cipher->encrypted_length()) {
		// the input is kept intact as the tag is calculated over the encrypted length
		if(!stream_in_.cipher->decrypt_length(stream_in_.packet_sequence, in_data.subspan(0, packet_length_size), length_buf)) {
			set_error(sshlink_crypto_error, "failed to decrypt packet length");
			return false;
		}
	} else {
		copy(in_data.subspan(0, packet_length_size), length_buf);
	}

	std::uint32_t length = ntou32(length_buf);
	if(!valid_packet_length(length)) {
		logger_.log(logger::debug, "SSH invalid packet length [length={}, block_size={}]", length, stream_in_.block_size);
		set_error(sshlink_invalid_packet, "invalid packet length");
		return false;
	}

	stream_in_.current_packet.packet_size = packet_length_size + length + stream_in_.tag_size;
	stream_in_.current_packet.status = in_packet_status::waiting_data;
	logger_.log(logger::debug_trace, "SSH try_decode_header [size={}]", stream_in_.current_packet.packet_size);

	return true;
}

// packet is the plain text packet starting from the packet_length field, without tag
span ssh_binary_packet::extract_payload(span packet) {
	std::uint32_t length = ntou32(packet.data());
	std::uint8_t padding = std::to_integer<std::uint8_t>(packet[packet_length_size]);

	if(padding < minimum_padding_size || std::size_t(padding) + padding_size >= length) {
		logger_.log(logger::debug, "SSH invalid padding [length={}, padding={}]", length, padding);
		set_error(sshlink_invalid_packet, "invalid padding length");
		return {};
	}

	return packet.subspan(packet_header_size, length - padding_size - padding);
}

span ssh_binary_packet::decrypt_packet(span in_data) {
	auto& current = stream_in_.current_packet;
	SSHLINK_ASSERT(current.status == in_packet_status::waiting_data, "invalid state");
	SSHLINK_ASSERT(current.packet_size <= in_data.size(), "invalid data size");

	span packet = in_data.subspan(0, current.packet_size);

	if(stream_in_.cipher) {
		if(!stream_in_.cipher->open(stream_in_.packet_sequence, packet, packet)) {
			logger_.log(logger::debug, "SSH packet authentication failed [seq={}]", stream_in_.packet_sequence);
			set_error(ssh_mac_error, "packet authentication failed");
			return {};
		}
		packet = packet.subspan(0, packet.size() - stream_in_.tag_size);
	}

	span payload = extract_payload(packet);
	if(!payload.empty()) {
		current.status = in_packet_status::data_ready;
		current.sequence = stream_in_.packet_sequence;
		current.payload = payload;
		stream_in_.transferred_bytes += current.packet_size;
		++stream_in_.packet_sequence;
	}
	return payload;
}

bool ssh_binary_packet::reserve_out_buffer(std::size_t size) {
	std::size_t used_size = stream_out_.data.size();
	if(stream_out_.buffer.size() - used_size >= size) {
		return true;
	}

	std::size_t new_size = used_size + size;
	if(new_size > config_.max_out_buffer_size) {
		set_error(sshlink_memory_error, "asking for bigger buffer than max_out_buffer_size");
		return false;
	}

	logger_.log(logger::debug_trace, "SSH resizing out buffer [size={}, used={}]", new_size, used_size);
	stream_out_.buffer.resize(new_size);
	stream_out_.data = span(stream_out_.buffer).subspan(0, used_size);
	return true;
}

std::size_t ssh_binary_packet::padding_for(std::size_t payload_size) const {
	std::size_t aligned = padding_size + payload_size;
	if(!stream_out_.cipher) {
		aligned += packet_length_size;
	}

	std::size_t const block = stream_out_.block_size;
	std::size_t res = block - (aligned % block);
	if(res < minimum_padding_size) {
		res += block;
	}

	if(config_.random_packet_padding) {
		SSHLINK_ASSERT(random_, "random generator not set");
		std::size_t max = (maximum_padding_size - res) / block;
		if(max) {
			res += random_->random_uint(0, max) * block;
		}
	}
	return res;
}

std::optional<out_packet_record> ssh_binary_packet::alloc_out_packet(std::size_t data_size, out_buffer& buf) {
	std::size_t padding = padding_for(data_size);

	out_packet_record res
		{ packet_header_size + data_size + padding + stream_out_.tag_size
		, data_size
		, padding
		};

	if(res.size - stream_out_.tag_size > packet_length_size + config_.max_out_packet_size) {
		logger_.log(logger::debug, "SSH too big out packet [size={}, max={}]", res.size, config_.max_out_packet_size);
		set_error(sshlink_invalid_packet, "too big packet");
		return std::nullopt;
	}

	// write directly to the output if nothing is pending
	if(stream_out_.data.empty()) {
		res.data_buffer = buf.get(res.size);
	}

	res.inplace = !res.data_buffer.empty();

	if(!res.inplace) {
		if(!reserve_out_buffer(res.size)) {
			logger_.log(logger::info, "SSH alloc_out_packet failed to allocate data buffer [size={}]", res.size);
			return std::nullopt;
		}
		res.data_buffer = safe_subspan(stream_out_.buffer, stream_out_.data.size(), res.size);
	}

	res.data_buffer = res.data_buffer.subspan(0, res.size);
	res.data = res.data_buffer.subspan(packet_header_size, data_size);

	return res;
}

bool ssh_binary_packet::create_out_packet(out_packet_record const& info, out_buffer& out_buf) {
	logger_.log(logger::debug_trace, "SSH create_out_packet [size={}, payload_size={}, padding_size={}, seq={}]"
		, info.size, info.payload_size, info.padding_size, stream_out_.packet_sequence);
	SSHLINK_ASSERT(random_, "random generator not set");

	ssh_bf_writer p(info.data_buffer);

	bool ret = p.write(std::uint32_t(padding_size + info.payload_size + info.padding_size))
		&& p.write(std::uint8_t(info.padding_size))
		&& p.jump_over(info.payload_size) // payload was already written in place
		&& p.add_random_range(*random_, info.padding_size);

	if(!ret) {
		set_error(sshlink_invalid_packet, "failed to create packet");
		return false;
	}

	if(stream_out_.cipher) {
		auto plain = info.data_buffer.subspan(0, info.size - stream_out_.tag_size);
		if(!stream_out_.cipher->seal(stream_out_.packet_sequence, plain, info.data_buffer)) {
			set_error(sshlink_crypto_error, "failed to encrypt packet");
			return false;
		}
	}

	++stream_out_.packet_sequence;
	stream_out_.transferred_bytes += info.size;

	if(info.inplace) {
		out_buf.commit(info.size);
	} else {
		stream_out_.data = span(stream_out_.buffer).subspan(0, stream_out_.data.size() + info.size);
	}
	return true;
}

bool ssh_binary_packet::send_pending(out_buffer& out) {
	if(stream_out_.data.empty()) {
		return true;
	}

	logger_.log(logger::debug_trace, "SSH send_pending [data size={}]", stream_out_.data.size());

	std::size_t ask_size = std::min(out.max_size(), stream_out_.data.size());
	if(ask_size) {
		auto buf = out.get(ask_size);
		if(!buf.empty()) {
			copy(stream_out_.data.subspan(0, ask_size), buf);
			out.commit(ask_size);

			std::size_t left = stream_out_.data.size() - ask_size;
			if(left) {
				std::memmove(stream_out_.buffer.data(), stream_out_.buffer.data() + ask_size, left);
			}
			stream_out_.data = span(stream_out_.buffer).subspan(0, left);
		}
	}

	return stream_out_.data.empty();
}

}
