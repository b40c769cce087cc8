#include "log.hpp"
#include "sshlink/common/logger.hpp"
#include "sshlink/common/util.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

namespace sshlink::ssh::test {

namespace {

byte_vector bytes_of(std::string_view s) {
	auto sp = to_span(s);
	return byte_vector(sp.begin(), sp.end());
}

// rfc4648 section 10 test vectors, without and with padding
struct base64_vector {
	std::string_view plain;
	std::string_view encoded;
	std::string_view padded;
};

base64_vector const base64_vectors[] = {
	{"",       "",         ""},
	{"f",      "Zg",       "Zg=="},
	{"fo",     "Zm8",      "Zm8="},
	{"foo",    "Zm9v",     "Zm9v"},
	{"foob",   "Zm9vYg",   "Zm9vYg=="},
	{"fooba",  "Zm9vYmE",  "Zm9vYmE="},
	{"foobar", "Zm9vYmFy", "Zm9vYmFy"}
};

}

TEST_CASE("base64", "[unit]") {
	for(auto const& v : base64_vectors) {
		INFO("plain: " << v.plain);
		CHECK(encode_base64(to_span(v.plain)) == v.encoded);
		CHECK(encode_base64(to_span(v.plain), true) == v.padded);
		CHECK(decode_base64(v.encoded) == bytes_of(v.plain));
		CHECK(decode_base64(v.padded) == bytes_of(v.plain));
	}

	// public key blobs in known_hosts style lines are padded
	auto blob = decode_base64("AAAAC3NzaC1lZDI1NTE5");
	REQUIRE(blob.size() == 15);
	CHECK(to_string_view(const_span(blob).subspan(4)) == "ssh-ed25519");
}

TEST_CASE("base64 invalid input", "[unit]") {
	for(std::string_view in : {"=", "==", "-", "G", "G===", "Zm9vYgfdd", "Zm 9v"}) {
		INFO("input: " << in);
		CHECK(decode_base64(in).empty());
	}
}

TEST_CASE("safe_subspan", "[unit]") {
	byte_vector vec = bytes_of("channel");
	auto check = [](auto s, std::string_view expected) {
		CHECK(to_string_view(s) == expected);
	};

	check(safe_subspan(vec, 0), "channel");
	check(safe_subspan(vec, 4), "nel");
	check(safe_subspan(vec, 1, 3), "han");
	check(safe_subspan(vec, 5, 100), "el");
	CHECK(safe_subspan(vec, 7).empty());
	CHECK(safe_subspan(vec, 100, 2).empty());

	const_span cs = to_span("data");
	check(safe_subspan(cs, 2), "ta");
	check(safe_subspan(cs, 0, 2), "da");
}

TEST_CASE("compare_equal and is_zero", "[unit]") {
	CHECK(compare_equal(to_span("abc"), to_span("abc")));
	CHECK(!compare_equal(to_span("abc"), to_span("abd")));
	CHECK(!compare_equal(to_span("abc"), to_span("ab")));
	CHECK(compare_equal(const_span{}, const_span{}));

	byte_vector zero(32);
	CHECK(is_zero(zero));
	CHECK(is_zero(const_span{}));
	zero[31] = std::byte{1};
	CHECK(!is_zero(zero));
}

TEST_CASE("network byte order", "[unit]") {
	std::byte buf[8] = {};
	u32ton(0x01020304, buf);
	CHECK(buf[0] == std::byte{1});
	CHECK(buf[3] == std::byte{4});
	CHECK(ntou32(buf) == 0x01020304);

	u64ton(0xFFFFFFFF00000001ull, buf);
	CHECK(buf[0] == std::byte{0xFF});
	CHECK(buf[7] == std::byte{1});
	CHECK(ntou64(buf) == 0xFFFFFFFF00000001ull);
}

TEST_CASE("to_umpint", "[unit]") {
	std::byte v[] = {std::byte{0}, std::byte{0}, std::byte{0x7f}};
	auto m = to_umpint(const_span(v));
	REQUIRE(m.data.size() == 1);
	CHECK(m.data[0] == std::byte{0x7f});

	std::byte z[] = {std::byte{0}};
	CHECK(to_umpint(const_span(z)).data.empty());
}

TEST_CASE("simple format", "[unit]") {
	CHECK(simple_format("plain") == "plain");
	CHECK(simple_format("a={}, b={}", 1, "two") == "a=1, b=two");
	CHECK(simple_format("{}{}", 'x', 2u) == "x2");
	// missing arguments leave the placeholder, surplus ones are dropped
	CHECK(simple_format("{} and {}", 1) == "1 and {}");
	CHECK(simple_format("only {}", 1, 2, 3) == "only 1");

	stdout_logger log(logger::error);
	CHECK(log.would_log(logger::error));
	CHECK(!log.would_log(logger::debug));
	CHECK(log.format("channel {}", 7) == "channel 7");
}

namespace {
struct recording_logger : logger {
	std::vector<std::string> lines;
protected:
	void write(type, std::string const& line, std::source_location const&) override {
		lines.push_back(line);
	}
};
}

TEST_CASE("session logger", "[unit]") {
	recording_logger target;
	session_logger log(target, "[client] ");

	log.log(logger::info, "connected to {}", "host");
	REQUIRE(target.lines.size() == 1);
	CHECK(target.lines[0] == "[client] connected to host");

	// the target level filters too
	target.set_level(logger::error);
	log.log(logger::debug, "dropped");
	CHECK(target.lines.size() == 1);

	log.set_level(logger::log_none);
	log.log(logger::error, "dropped");
	CHECK(target.lines.size() == 1);
}

}
