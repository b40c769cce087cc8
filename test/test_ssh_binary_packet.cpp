#include "crypto.hpp"
#include "log.hpp"
#include "random.hpp"
#include "test_buffers.hpp"

#include "sshlink/common/logger.hpp"
#include "sshlink/common/util.hpp"
#include "sshlink/core/packet_ser.hpp"
#include "sshlink/core/packet_ser_impl.hpp"
#include "sshlink/core/ssh_binary_packet.hpp"
#include "sshlink/core/ssh_binary_util.hpp"
#include "sshlink/core/ssh_config.hpp"
#include "sshlink/core/protocol.hpp"

#include <catch2/catch.hpp>

namespace sshlink::ssh::test {
namespace {

template<typename Packet, typename... Args>
bool send_packet(ssh_binary_packet& bp, out_buffer& out, Args&&... args) {
	typename Packet::save packet(std::forward<Args>(args)...);
	std::size_t size = packet.size();

	auto rec = bp.alloc_out_packet(size, out);

	if(rec && packet.write(rec->data)) {
		return bp.create_out_packet(*rec, out);
	} else {
		bp.set_error(sshlink_memory_error, "Could not allocate buffer for sending packet");
	}

	return false;
}

// gives access to the sequence numbers
struct test_binary_packet : ssh_binary_packet {
	using ssh_binary_packet::ssh_binary_packet;

	void set_sequences(std::uint32_t seq) {
		stream_in_.packet_sequence = seq;
		stream_out_.packet_sequence = seq;
	}
};

std::unique_ptr<ssh::cipher> make_cipher(crypto_test_context& ctx, cipher_type t, cipher_dir dir) {
	byte_vector key(cipher_key_size(t), std::byte{'A'});
	byte_vector iv(cipher_iv_size(t), std::byte{'B'});
	auto c = ctx.construct_cipher(t, dir, key, iv, ctx.call);
	REQUIRE(c);
	return c;
}

void check_disconnect(const_span payload) {
	ser::disconnect::load packet(ser::match_type_t, payload);
	REQUIRE(packet);

	auto & [code, desc, lang] = packet;
	CHECK(code == 1);
	CHECK(desc == "test 1");
	CHECK(lang == "test 2");
}

ssh_config test_configs[] =
	{
		{}
		,{.random_packet_padding = false}
		,{.max_out_buffer_size = 1024}
	};

}

TEST_CASE("ssh_binary_packet", "[unit]") {
	auto config_i = GENERATE(range(0, int(sizeof(test_configs)/sizeof(ssh_config))));

	ssh_config const& config = test_configs[config_i];
	string_io_buffer buf;

	ssh_binary_packet bp_1(config, test_log());
	bp_1.set_random(test_rand);

	REQUIRE(send_packet<ser::disconnect>(bp_1, buf, 1, "test 1", "test 2"));
	CHECK(buf.used_size() > 0);

	// whole unencrypted packet is multiple of 8 and has at least 4 bytes of padding
	std::uint32_t length = ntou32(buf.get().data());
	CHECK((packet_length_size + length) % minimum_block_size == 0);
	CHECK(std::to_integer<std::uint8_t>(buf.get()[packet_length_size]) >= minimum_padding_size);
	CHECK(buf.used_size() == packet_length_size + length);

	ssh_binary_packet bp_2(config, test_log());
	bp_2.set_random(test_rand);

	REQUIRE(bp_2.try_decode_header(buf.get()));
	auto span = bp_2.decrypt_packet(buf.get());
	REQUIRE(!span.empty());

	check_disconnect(span);
	CHECK(bp_1.out_sequence() == 1);
	CHECK(bp_2.in_sequence() == 1);
}

TEST_CASE("ssh_binary_packet retry sending", "[unit]") {
	ssh_config config{};
	string_out_buffer out_too_small{10};
	string_io_buffer buf;

	ssh_binary_packet bp_1(config, test_log());
	bp_1.set_random(test_rand);

	// goes to the internal buffer
	REQUIRE(send_packet<ser::disconnect>(bp_1, out_too_small, 1, "test 1", "test 2"));
	CHECK(bp_1.error() == ssh_noerror);

	REQUIRE(!bp_1.send_pending(out_too_small));
	buf.data += out_too_small.data;
	buf.pos  += buf.data.size();
	REQUIRE(bp_1.send_pending(buf));

	ssh_binary_packet bp_2(config, test_log());
	bp_2.set_random(test_rand);

	REQUIRE(bp_2.try_decode_header(buf.get()));
	auto span = bp_2.decrypt_packet(buf.get());
	CHECK(bp_1.error() == ssh_noerror);
	REQUIRE(!span.empty());

	check_disconnect(span);
}

TEST_CASE("ssh_binary_packet failing", "[unit]") {
	ssh_config config;
	config.max_out_buffer_size = 25;

	string_out_buffer out_too_small{10};

	ssh_binary_packet bp_1(config, test_log());
	bp_1.set_random(test_rand);

	CHECK(!send_packet<ser::disconnect>(bp_1, out_too_small, 1, "test 1", "test 2"));
	CHECK(bp_1.error() == sshlink_memory_error);
}

TEST_CASE("ssh_binary_packet crypto", "[unit]") {
	auto type = GENERATE(cipher_type::openssh_chacha20_poly1305, cipher_type::openssh_aes_256_gcm);

	crypto_test_context ctx;
	ssh_config config;
	string_io_buffer buf;

	ssh_binary_packet bp_1(config, test_log());
	bp_1.set_random(test_rand);
	bp_1.set_output_crypto(make_cipher(ctx, type, cipher_dir::encrypt));

	ssh_binary_packet bp_2(config, test_log());
	bp_2.set_random(test_rand);
	bp_2.set_input_crypto(make_cipher(ctx, type, cipher_dir::decrypt));

	for(int i = 0; i != 3; ++i) {
		REQUIRE(send_packet<ser::disconnect>(bp_1, buf, 1, "test 1", "test 2"));
		CHECK(buf.used_size() > 0);

		REQUIRE(bp_2.try_decode_header(buf.get()));
		std::size_t size = bp_2.current_in_packet().packet_size;
		CHECK(size == buf.used_size());

		auto span = bp_2.decrypt_packet(buf.get());
		REQUIRE(!span.empty());
		check_disconnect(span);
		buf.consume(size);
	}
	CHECK(bp_2.in_sequence() == 3);
}

TEST_CASE("ssh_binary_packet tampered packet", "[unit]") {
	auto type = GENERATE(cipher_type::openssh_chacha20_poly1305, cipher_type::openssh_aes_256_gcm);

	crypto_test_context ctx;
	ssh_config config;
	string_io_buffer buf;

	ssh_binary_packet bp_1(config, test_log());
	bp_1.set_random(test_rand);
	bp_1.set_output_crypto(make_cipher(ctx, type, cipher_dir::encrypt));

	ssh_binary_packet bp_2(config, test_log());
	bp_2.set_random(test_rand);
	bp_2.set_input_crypto(make_cipher(ctx, type, cipher_dir::decrypt));

	REQUIRE(send_packet<ser::disconnect>(bp_1, buf, 1, "test 1", "test 2"));

	REQUIRE(bp_2.try_decode_header(buf.get()));
	// flip single bit in the payload
	buf.data[packet_header_size + 2] ^= 0x01;

	auto span = bp_2.decrypt_packet(buf.get());
	CHECK(span.empty());
	CHECK(bp_2.error() == ssh_mac_error);
	CHECK(bp_2.in_sequence() == 0);
}

TEST_CASE("ssh_binary_packet sequence number wraps", "[unit]") {
	crypto_test_context ctx;
	ssh_config config;
	string_io_buffer buf;

	test_binary_packet bp_1(config, test_log());
	bp_1.set_random(test_rand);
	bp_1.set_output_crypto(make_cipher(ctx, cipher_type::openssh_chacha20_poly1305, cipher_dir::encrypt));
	bp_1.set_sequences(0xFFFFFFFF);

	test_binary_packet bp_2(config, test_log());
	bp_2.set_random(test_rand);
	bp_2.set_input_crypto(make_cipher(ctx, cipher_type::openssh_chacha20_poly1305, cipher_dir::decrypt));
	bp_2.set_sequences(0xFFFFFFFF);

	for(int i = 0; i != 2; ++i) {
		REQUIRE(send_packet<ser::disconnect>(bp_1, buf, 1, "test 1", "test 2"));
		REQUIRE(bp_2.try_decode_header(buf.get()));
		std::size_t size = bp_2.current_in_packet().packet_size;
		auto span = bp_2.decrypt_packet(buf.get());
		REQUIRE(!span.empty());
		check_disconnect(span);
		buf.consume(size);
	}

	CHECK(bp_1.out_sequence() == 1);
	CHECK(bp_2.in_sequence() == 1);
}

TEST_CASE("ssh_binary_packet invalid length", "[unit]") {
	ssh_config config;
	ssh_binary_packet bp(config, test_log());
	bp.set_random(test_rand);

	SECTION("too small") {
		// packet_length 4 cannot hold the padding length and minimum padding
		std::byte frame[] = {std::byte{0}, std::byte{0}, std::byte{0}, std::byte{4}, std::byte{4}, {}, {}, {}};
		CHECK(!bp.try_decode_header(frame));
		CHECK(bp.error() == sshlink_invalid_packet);
	}
	SECTION("too big") {
		std::byte frame[] = {std::byte{0x7F}, std::byte{0}, std::byte{0}, std::byte{4}, std::byte{4}, {}, {}, {}};
		CHECK(!bp.try_decode_header(frame));
		CHECK(bp.error() == sshlink_invalid_packet);
	}
	SECTION("not enough data") {
		std::byte frame[] = {std::byte{0}, std::byte{0}};
		CHECK(!bp.try_decode_header(frame));
		CHECK(bp.error() == ssh_noerror);
	}
}

}
