#include "log.hpp"

#include "sshlink/common/algo_list.hpp"
#include "sshlink/crypto/ids.hpp"

#include <catch2/catch.hpp>

namespace sshlink::ssh::test {
namespace {
enum class test_algos {
	unknown,
	test1,
	test2,
	test3
};

std::string_view to_string(test_algos t) {
	using enum test_algos;
	if(t == test1) return "test1";
	if(t == test2) return "test2";
	if(t == test3) return "test3";
	return "unknown";
}

test_algos from_string(type_tag<test_algos>, std::string_view s) {
	using enum test_algos;
	if(s == "test1") return test1;
	if(s == "test2") return test2;
	if(s == "test3") return test3;
	return unknown;
}

}

TEST_CASE("algo_list", "[unit]") {
	using enum test_algos;
	{
		algo_list<test_algos> list;
		CHECK(list.name_list().empty());
		CHECK(list.name_list_string() == "");

		list.add_back(test1);
		CHECK(list.name_list_string() == "test1");
		list.add_back(test2);
		CHECK(list.name_list_string() == "test1,test2");
		list.add_back(test1);
		CHECK(list.name_list_string() == "test1,test2");
		list.add_back(test3);
		CHECK(list.name_list_string() == "test1,test2,test3");
		list.remove(test1);
		CHECK(list.name_list_string() == "test2,test3");

		CHECK(list.front() == test2);
		CHECK(list.supports(test3));
		CHECK(!list.supports(test1));
	}
	{
		algo_list<test_algos> list({test1,test2,test3});
		CHECK(list.name_list() == std::vector<std::string_view>({"test1", "test2", "test3"}));
		CHECK(list.name_list_string() == "test1,test2,test3");
	}
	{
		algo_list<test_algos> list({test3,test1});
		CHECK(list.name_list() == std::vector<std::string_view>({"test3", "test1"}));
		CHECK(list.name_list_string() == "test3,test1");
	}
}

TEST_CASE("algo_list from name-list", "[unit]") {
	using enum test_algos;

	auto list = algo_list_from_string_list<test_algos>({"test3", "foo@example.com", "test1", "test3"});
	CHECK(list.size() == 2);
	CHECK(list.name_list_string() == "test3,test1");

	CHECK(algo_list_from_string_list<test_algos>({}).empty());
}

TEST_CASE("algorithm names", "[unit]") {
	CHECK(to_string(cipher_type::openssh_chacha20_poly1305) == "chacha20-poly1305@openssh.com");
	CHECK(to_string(cipher_type::openssh_aes_256_gcm) == "aes256-gcm@openssh.com");
	CHECK(to_string(mac_type::hmac_sha2_256) == "hmac-sha2-256");
	CHECK(to_string(key_type::ssh_ed25519) == "ssh-ed25519");
	CHECK(to_string(key_type::rsa_sha2_256) == "rsa-sha2-256");

	CHECK(from_string(type_tag<cipher_type>{}, "aes256-gcm@openssh.com") == cipher_type::openssh_aes_256_gcm);
	CHECK(from_string(type_tag<cipher_type>{}, "aes128-ctr") == cipher_type::unknown);
	CHECK(from_string(type_tag<key_type>{}, "rsa-sha2-512") == key_type::rsa_sha2_512);
	CHECK(key_format(key_type::rsa_sha2_512) == key_type::ssh_rsa);
	CHECK(key_format(key_type::ssh_ed25519) == key_type::ssh_ed25519);
}

}
