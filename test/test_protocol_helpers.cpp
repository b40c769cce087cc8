#include "test_buffers.hpp"

#include "sshlink/core/protocol_helpers.hpp"

#include <catch2/catch.hpp>

namespace sshlink::ssh::test {

TEST_CASE("protocol helpers send_version_string", "[unit]") {
	{
		string_out_buffer out;
		CHECK(send_version_string(ssh_version{"2.0", "testv1.0"}, out));
		CHECK(out.data == "SSH-2.0-testv1.0\r\n");
	}
	{
		string_out_buffer out;
		CHECK(send_version_string(ssh_version{"2.0", "sshlink_1.0", "some comment"}, out));
		CHECK(out.data == "SSH-2.0-sshlink_1.0 some comment\r\n");
	}
}

TEST_CASE("protocol helpers is_valid_version", "[unit]") {
	CHECK(is_valid_version(ssh_version{"2.0", "testv1.0"}));
	CHECK(is_valid_version(ssh_version{"2.0", "test-v1.0", "comment"}));
	CHECK(!is_valid_version(ssh_version{"", "testv1.0"}));
	CHECK(!is_valid_version(ssh_version{"2.0", ""}));
	CHECK(!is_valid_version(ssh_version{"2-0", "testv1.0"}));
	CHECK(!is_valid_version(ssh_version{"2.0", "test v1.0"}));
	CHECK(!is_valid_version(ssh_version{"2.0", "testv1.0", "comment\r\n"}));
	CHECK(!is_valid_version(ssh_version{"2.0", "testv1.0", std::string(250, 'a')}));
}

TEST_CASE("protocol helpers parse_ssh_version", "[unit]") {
	{
		string_in_buffer in{"SSH-2.0-testv1.0\r\n"};
		ssh_version v;
		std::string line;
		CHECK(parse_ssh_version(in, false, v, line) == version_parse_result::ok);
		CHECK(v.ssh == "2.0");
		CHECK(v.software == "testv1.0");
		CHECK(v.comment == "");
		CHECK(line == "SSH-2.0-testv1.0");
		CHECK(in.empty());
	}
	{
		string_in_buffer in{"SSH-2.0-OpenSSH_8.9\r\nAB"};
		ssh_version v;
		std::string line;
		CHECK(parse_ssh_version(in, false, v, line) == version_parse_result::ok);
		CHECK(v.software == "OpenSSH_8.9");
		CHECK(line == "SSH-2.0-OpenSSH_8.9");
		// the rest is left in the buffer for the binary packet protocol
		CHECK(in.size() == 2);
	}
	{
		// only LF
		string_in_buffer in{"SSH-2.0-OpenSSH_8.9\n"};
		ssh_version v;
		std::string line;
		CHECK(parse_ssh_version(in, false, v, line) == version_parse_result::ok);
		CHECK(line == "SSH-2.0-OpenSSH_8.9");
	}
	{
		string_in_buffer in{"SSH-42.0ab-kl15dds5@&dtestv1.999\r\n"};
		ssh_version v;
		std::string line;
		CHECK(parse_ssh_version(in, false, v, line) == version_parse_result::ok);
		CHECK(v.ssh == "42.0ab");
		CHECK(v.software == "kl15dds5@&dtestv1.999");
		CHECK(v.comment == "");
	}
	{
		string_in_buffer in{"SSH-2.0-testv1.0 this is comment\r\n"};
		ssh_version v;
		std::string line;
		CHECK(parse_ssh_version(in, false, v, line) == version_parse_result::ok);
		CHECK(v.ssh == "2.0");
		CHECK(v.software == "testv1.0");
		CHECK(v.comment == "this is comment");
		CHECK(line == "SSH-2.0-testv1.0 this is comment");
	}
	{
		string_in_buffer in{"SSH-2.0-\r\n"};
		ssh_version v;
		std::string line;
		CHECK(parse_ssh_version(in, false, v, line) == version_parse_result::error);
	}
	{
		string_in_buffer in{"pla pla pla\r\nsome\r\nSSH othersdfj\r\nSSH-2.0-testv1.0\r\n"};
		ssh_version v;
		std::string line;
		CHECK(parse_ssh_version(in, true, v, line) == version_parse_result::ok);
		CHECK(v.ssh == "2.0");
		CHECK(v.software == "testv1.0");
		CHECK(v.comment == "");
	}
	{
		// banner lines are not allowed
		string_in_buffer in{"pla pla pla\r\nSSH-2.0-testv1.0\r\n"};
		ssh_version v;
		std::string line;
		CHECK(parse_ssh_version(in, false, v, line) == version_parse_result::error);
	}
	{
		string_in_buffer in{"SSH-testv1.0\r\n"};
		ssh_version v;
		std::string line;
		CHECK(parse_ssh_version(in, false, v, line) == version_parse_result::error);
		CHECK(v.ssh == "");
		CHECK(v.software == "");
		CHECK(v.comment == "");
	}
	{
		string_in_buffer in{"SSH-2-s " + std::string(255-10, 'a') + "\r\n"};
		ssh_version v;
		std::string line;
		CHECK(parse_ssh_version(in, false, v, line) == version_parse_result::ok);
		CHECK(v.ssh == "2");
		CHECK(v.software == "s");
		CHECK(v.comment == std::string(255-10, 'a'));
	}
	{
		// invalid char in ssh version
		string_in_buffer in{"SSH-\t12-testv1.0\r\n"};
		ssh_version v;
		std::string line;
		CHECK(parse_ssh_version(in, false, v, line) == version_parse_result::error);
	}
	{
		string_in_buffer in{"SSH-1\r\n"};
		ssh_version v;
		std::string line;
		CHECK(parse_ssh_version(in, false, v, line) == version_parse_result::error);
	}
	{
		// too long
		string_in_buffer in{"SSH-2-s " + std::string(255-9, 'a') + "\r\n"};
		ssh_version v;
		std::string line;
		CHECK(parse_ssh_version(in, false, v, line) == version_parse_result::error);
	}
	{
		string_in_buffer in{""};
		ssh_version v;
		std::string line;
		CHECK(parse_ssh_version(in, false, v, line) == version_parse_result::more_data);
	}
	{
		string_in_buffer in{"SSH-1-dd"};
		ssh_version v;
		std::string line;
		CHECK(parse_ssh_version(in, false, v, line) == version_parse_result::more_data);
	}
	{
		// invalid beginning
		string_in_buffer in{"SSH 1.2-s1\r\n"};
		ssh_version v;
		std::string line;
		CHECK(parse_ssh_version(in, false, v, line) == version_parse_result::error);
	}
	{
		string_in_buffer in{"SSH-1-dd"};
		ssh_version v;
		std::string line;
		CHECK(parse_ssh_version(in, false, v, line) == version_parse_result::more_data);
		in.data += "\r\n";
		CHECK(parse_ssh_version(in, false, v, line) == version_parse_result::ok);
		CHECK(v.ssh == "1");
		CHECK(v.software == "dd");
		CHECK(v.comment == "");
	}
}

TEST_CASE("protocol helpers string lists", "[unit]") {
	std::vector<std::string_view> list;
	CHECK(parse_string_list("a,bb,ccc", list));
	CHECK(list == std::vector<std::string_view>{"a", "bb", "ccc"});

	list.clear();
	CHECK(parse_string_list("", list));
	CHECK(list.empty());

	std::string out;
	CHECK(to_string_list({"a", "bb"}, out));
	CHECK(out == "a,bb");

	out.clear();
	CHECK(!to_string_list({"a", "b,c"}, out));
}

}
