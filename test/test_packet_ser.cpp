#include "test_buffers.hpp"

#include "sshlink/common/logger.hpp"
#include "sshlink/core/packet_ser.hpp"
#include "sshlink/core/packet_ser_impl.hpp"
#include "sshlink/core/protocol.hpp"
#include "sshlink/common/util.hpp"
#include "sshlink/core/auth/auth_protocol.hpp"
#include "sshlink/core/connection/channel.hpp"
#include "sshlink/core/connection/conn_protocol.hpp"

#include <catch2/catch.hpp>

#include <cstring>

namespace sshlink::ssh::test {

using cookie_span = std::span<std::byte const, 16>;

bool operator==(cookie_span const& l, cookie_span const& r) {
	return std::memcmp(l.data(), r.data(), l.size()) == 0;
}

// saves the packet and checks that loading gives back the same field values
template<typename Packet, typename... Args>
bool saved_and_loaded_equal(Args&&... args) {
	std::byte buf[1024] = {};
	typename Packet::save saved(args...);
	if(saved.size() > sizeof(buf) || !saved.write(buf)) {
		return false;
	}

	typename Packet::load loaded(ser::match_type_t, buf);
	if(!loaded || loaded.size() != saved.size()) {
		return false;
	}

	return [&]<std::size_t... I>(std::index_sequence<I...>) {
		return ((loaded.template get<I>() == args) && ...);
	}(std::index_sequence_for<Args...>{});
}

TEST_CASE("transport and connection packets", "[unit]") {
	using names = std::vector<std::string_view>;
	std::byte const cookie_bytes[16] = {std::byte{1}, std::byte{2}, std::byte{3}};

	CHECK(saved_and_loaded_equal<ser::disconnect>(std::uint32_t(ssh_protocol_error), "bad packet", ""));
	CHECK(saved_and_loaded_equal<ser::unimplemented>(std::uint32_t(42)));
	CHECK(saved_and_loaded_equal<ser::debug>(false, "debug text", "en"));
	CHECK(saved_and_loaded_equal<ser::ignore>("padding"));
	CHECK(saved_and_loaded_equal<ser::service_request>("ssh-userauth"));
	CHECK(saved_and_loaded_equal<ser::kexinit>(
		cookie_span(cookie_bytes),
		names{"curve25519-sha256", "diffie-hellman-group14-sha256"},
		names{"ssh-ed25519", "rsa-sha2-256"},
		names{"chacha20-poly1305@openssh.com"},
		names{"aes256-gcm@openssh.com"},
		names{},
		names{},
		names{"none"},
		names{"none"},
		names{},
		names{},
		false,
		std::uint32_t(0)));
	CHECK(saved_and_loaded_equal<ser::userauth_password_request>("test", "ssh-connection", "password", false, "secret"));
	CHECK(saved_and_loaded_equal<ser::channel_open>("session", std::uint32_t(0), std::uint32_t(2097152), std::uint32_t(32768)));
	CHECK(saved_and_loaded_equal<ser::channel_open_confirmation>(std::uint32_t(0), std::uint32_t(7), std::uint32_t(2097152), std::uint32_t(32768)));
	CHECK(saved_and_loaded_equal<ser::channel_exec_request>(std::uint32_t(7), "exec", true, "ls -la"));
	CHECK(saved_and_loaded_equal<ser::channel_window_adjust>(std::uint32_t(7), std::uint32_t(1048576)));
}

TEST_CASE("disconnect packet layout", "[unit]") {
	std::byte buf[256] = {};
	ser::disconnect::save saved(std::uint32_t(ssh_disconnect_by_application), "bye", "");
	// type, uint32 code, two strings
	CHECK(saved.size() == 1 + 4 + (4+3) + 4);
	REQUIRE(saved.write(buf));
	CHECK(buf[0] == std::byte(ssh_disconnect));
	CHECK(ntou32(buf+1) == 11);
	CHECK(ntou32(buf+5) == 3);

	SECTION("with message number") {
		ser::disconnect::load loaded(ser::match_type_t, buf);
		REQUIRE(loaded);
		auto& [code, message, lang] = loaded;
		CHECK(code == 11);
		CHECK(message == "bye");
		CHECK(lang.empty());
	}

	SECTION("message number already consumed") {
		ser::disconnect::load loaded(const_span(buf+1, saved.size()-1));
		REQUIRE(loaded);
		auto& [code, message, lang] = loaded;
		CHECK(code == 11);
		CHECK(message == "bye");
	}

	SECTION("wrong type or truncated") {
		CHECK(!ser::ignore::load(ser::match_type_t, buf));
		CHECK(!ser::disconnect::load(ser::match_type_t, const_span(buf, saved.size()-1)));
	}
}

TEST_CASE("packet serialisation name-list", "[unit]") {
	std::byte temp[256] = {};
	using test_type = ser::ssh_packet_ser<ssh_disconnect, ser::name_list>;

	test_type::save sp(ser::name_list_t{"test 1", "test 2", "hipshops"});
	REQUIRE(sp.write(temp));

	test_type::load lp(ser::match_type_t, temp);
	REQUIRE(lp);

	auto & [list] = lp;
	CHECK(list == ser::name_list_t{"test 1", "test 2", "hipshops"});
}

TEST_CASE("packet serialisation bytes-n", "[unit]") {
	std::byte temp[256] = {};
	using test_type = ser::ssh_packet_ser<ssh_disconnect, ser::bytes<10>>;

	test_type::save sp(std::span<std::byte const, 10>((std::byte const*)"1234567890", 10));
	REQUIRE(sp.write(temp));

	test_type::load lp(ser::match_type_t, temp);
	REQUIRE(lp);

	auto & [bytes] = lp;
	CHECK(bytes.size() == 10);
	CHECK(std::memcmp(bytes.data(), "1234567890", 10) == 0);
}

TEST_CASE("packet serialisation mpint", "[unit]") {
	std::byte temp[256] = {};
	using test_type = ser::ssh_packet_ser<ssh_disconnect, ser::mpint>;

	// high bit set, needs leading zero byte (rfc4251 section 5)
	std::byte value[] = {std::byte{0x80}, std::byte{0x01}};
	test_type::save sp(const_mpint_span{value});
	CHECK(sp.size() == 1+4+3);
	REQUIRE(sp.write(temp));
	CHECK(std::to_integer<int>(temp[4]) == 3);
	CHECK(std::to_integer<int>(temp[5]) == 0);

	test_type::load lp(ser::match_type_t, temp);
	REQUIRE(lp);
	auto & [v] = lp;
	CHECK(v.data.size() == 2);
	CHECK(v.data[0] == std::byte{0x80});
}

TEST_CASE("pty request", "[unit]") {
	std::byte temp[1024] = {};

	pty_config pty;
	byte_vector modes = encode_terminal_modes(pty);
	// TTY_OP_ISPEED, TTY_OP_OSPEED and TTY_OP_END
	CHECK(modes.size() == 5+5+1);
	CHECK(modes.front() == std::byte{128});
	CHECK(modes.back() == std::byte{0});

	ser::channel_pty_request::save sp(7u, std::string_view("pty-req"), false, std::string_view(pty.term)
		, pty.width_chars, pty.height_rows, pty.width_pixels, pty.height_pixels, to_string_view(modes));
	REQUIRE(sp.write(temp));

	ser::channel_request::load req(ser::match_type_t, temp);
	REQUIRE(req);
	auto & [recipient, name, want_reply] = req;
	CHECK(recipient == 7);
	CHECK(name == "pty-req");
	CHECK(!want_reply);

	ser::channel_pty_request::load lp(ser::match_type_t, temp);
	REQUIRE(lp);
	auto & [r, n, w, term, cols, rows, wp, hp, m] = lp;
	CHECK(term == "xterm");
	CHECK(cols == 80);
	CHECK(rows == 24);
	CHECK(wp == 640);
	CHECK(hp == 480);
	CHECK(m == to_string_view(modes));
}

using outer = ser::ssh_packet_ser
<
	1,
	ser::boolean,
	ser::string,
	ser::string
>;

using inner = ser::ssh_packet_ser
<
	2,
	ser::uint32,
	ser::string
>;

TEST_CASE("nested packet save", "[unit]") {
	std::byte temp[1024] = {};

	inner::save inner_p{9, "my test"};
	auto outer_p = make_packet_saver<outer>(true, inner_p, "some");
	CHECK(outer_p.write(temp));

	outer::load outer_l(ser::match_type_t, temp);
	REQUIRE(outer_l);

	auto & [b, inner_p_string, str] = outer_l;
	CHECK(b == true);
	CHECK(str == "some");

	inner::load inner_l(ser::match_type_t, to_span(inner_p_string));
	REQUIRE(inner_l);

	auto & [n, inner_str] = inner_l;
	CHECK(n == 9);
	CHECK(inner_str == "my test");
}

}
