#include "tools/common/command_parser.hpp"

#include <catch2/catch.hpp>

namespace sshlink::test {

namespace {
struct test_commands : command_parser {
	bool help{};
	bool verbose{};
	std::string host;
	std::uint16_t port{22};
	std::optional<std::string> exec;

	test_commands() {
		add(help, "help", "", "show help");
		add(verbose, "verbose", "v", "verbose logging");
		add_required(host, "host", "h", "host to connect");
		add(port, "port", "p", "port to connect");
		add(exec, "exec", "e", "command");
	}
};
}

TEST_CASE("command parser", "[unit]") {
	test_commands c;
	c.parse({"--host", "example.com", "-p", "2222", "-v", "--exec", "ls -la"});
	CHECK_NOTHROW(c.check_required());
	CHECK(c.host == "example.com");
	CHECK(c.port == 2222);
	CHECK(c.verbose);
	CHECK(!c.help);
	REQUIRE(c.exec);
	CHECK(*c.exec == "ls -la");
}

TEST_CASE("command parser value with equal sign", "[unit]") {
	test_commands c;
	c.parse({"--host=-weird-", "--port=23"});
	CHECK(c.host == "-weird-");
	CHECK(c.port == 23);
	CHECK(!c.exec);
}

TEST_CASE("command parser errors", "[unit]") {
	test_commands c;
	CHECK_THROWS_AS(c.parse({"--unknown", "x"}), invalid_argument);
	CHECK_THROWS_AS(c.parse({"--port", "abc"}), invalid_argument);
	CHECK_THROWS_AS(c.parse({"--port", "22x"}), invalid_argument);
	CHECK_THROWS_AS(c.parse({"--host"}), invalid_argument);
	CHECK_THROWS_AS(c.parse({"--host", "--verbose"}), invalid_argument);
	CHECK_THROWS_AS(c.parse({"positional"}), invalid_argument);
	CHECK_THROWS_AS(c.parse({"--verbose=yes"}), invalid_argument);

	test_commands d;
	d.parse({"--help"});
	CHECK(d.help);
	CHECK_THROWS_AS(d.check_required(), invalid_argument);
}

TEST_CASE("command parser help", "[unit]") {
	test_commands c;
	std::ostringstream out;
	c.print_help(out);
	CHECK(out.str().find("--host, -h") != std::string::npos);
	CHECK(out.str().find("[required]") != std::string::npos);
}

}
