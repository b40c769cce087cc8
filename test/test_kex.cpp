#include "util.hpp"

#include "sshlink/common/util.hpp"

namespace sshlink::ssh::test {
namespace {

struct kex_pair {
	kex_pair(client_config c = test_client_config(), ssh_config s = test_server_config()
		, std::uint64_t client_seed = 1, std::uint64_t server_seed = 2)
	: client(std::move(c), seeded_crypto_context(client_seed))
	, server(std::move(s), seeded_crypto_context(server_seed))
	{}

	client_pair_side client;
	server_pair_side server;
};

byte_vector to_vector(const_span s) {
	return byte_vector(s.begin(), s.end());
}

}

TEST_CASE("key exchange and authentication", "[unit][kex]") {
	auto i = GENERATE(0, 1, 2);
	CAPTURE(i);

	std::pair<client_config, ssh_config> configs{test_client_config(), test_server_config()};
	if(i == 1) {
		configs = {test_client_aes_gcm_config(), test_server_aes_gcm_config()};
	} else if(i == 2) {
		configs = {test_client_dh_kex_config(), test_server_dh_kex_config()};
	}

	kex_pair k(configs.first, configs.second);

	CHECK(run(k.client, k.server));

	CHECK(k.client.state() == ssh_state::transport);
	CHECK(k.server.transport.state() == ssh_state::transport);
	CHECK(k.client.state_of_session() == session_state::authenticated);
	CHECK(k.client.completed_kex_count() == 1);

	CHECK(!k.client.session_id().empty());
	CHECK(compare_equal(k.client.session_id(), k.server.transport.session_id()));
	CHECK(compare_equal(k.client.exchange_hash(), k.client.session_id()));

	CHECK(to_vector(k.client.server_host_key().blob()) == k.server.host_key.public_key_blob());
	CHECK(k.client.crypto_config().in.cipher == configs.first.algorithms.server_client_ciphers.front());
	CHECK(k.client.crypto_config().out.cipher == configs.first.algorithms.client_server_ciphers.front());

	k.client.send_ignore(10);
	k.server.transport.send_ignore(25);
	CHECK(run(k.client, k.server));
}

TEST_CASE("key exchange with kex guess", "[unit][kex]") {
	client_config c = test_client_config();
	c.guess_kex_packet = true;
	kex_pair k(std::move(c));

	CHECK(run(k.client, k.server));
	CHECK(k.client.state_of_session() == session_state::authenticated);
}

TEST_CASE("key exchange is deterministic with seeded random", "[unit][kex]") {
	kex_pair k1;
	kex_pair k2;
	kex_pair k3(test_client_config(), test_server_config(), 3, 2);

	REQUIRE(run(k1.client, k1.server));
	REQUIRE(run(k2.client, k2.server));
	REQUIRE(run(k3.client, k3.server));

	CHECK(to_vector(k1.client.session_id()) == to_vector(k2.client.session_id()));
	CHECK(to_vector(k1.client.session_id()) != to_vector(k3.client.session_id()));
}

TEST_CASE("key re-exchange", "[unit][kex]") {
	kex_pair k;
	REQUIRE(run(k.client, k.server));

	byte_vector session_id = to_vector(k.client.session_id());
	byte_vector exchange_hash = to_vector(k.client.exchange_hash());

	SECTION("started by client") {
		CHECK(k.client.start_rekey());
	}
	SECTION("started by server") {
		CHECK(k.server.transport.start_rekey());
	}

	CHECK(run(k.client, k.server));
	CHECK(k.client.state() == ssh_state::transport);
	CHECK(k.client.completed_kex_count() == 2);

	// session identifier stays the one from the first exchange
	CHECK(to_vector(k.client.session_id()) == session_id);
	CHECK(to_vector(k.server.transport.session_id()) == session_id);
	CHECK(to_vector(k.client.exchange_hash()) != exchange_hash);

	k.client.send_ignore(10);
	CHECK(run(k.client, k.server));
}

TEST_CASE("rekey is refused before first key exchange", "[unit][kex]") {
	kex_pair k;
	CHECK(!k.client.start_rekey());
}

TEST_CASE("failing version exchange", "[unit][kex]") {
	client_config c = test_client_config();
	c.my_version.ssh = "1.0";
	kex_pair k(std::move(c));

	CHECK(!run(k.client, k.server));

	CHECK(k.client.state() == ssh_state::disconnected);
	CHECK(k.server.transport.state() == ssh_state::disconnected);
	CHECK(k.server.error() == ssh_protocol_version_not_supported);
}

TEST_CASE("no common kex", "[unit][kex]") {
	kex_pair k(test_client_config(), test_server_dh_kex_config());

	CHECK(!run(k.client, k.server));

	CHECK(k.client.state() == ssh_state::disconnected);
	CHECK(k.server.transport.state() == ssh_state::disconnected);

	CHECK(to_error_kind(k.client.error()) == error_kind::negotiation);
	CHECK(to_error_kind(k.server.error()) == error_kind::negotiation);
	CHECK(k.client.state_of_session() == session_state::disconnected);
}

TEST_CASE("no common cipher", "[unit][kex]") {
	kex_pair k(test_client_config(), test_server_aes_gcm_config());

	CHECK(!run(k.client, k.server));

	CHECK(to_error_kind(k.client.error()) == error_kind::negotiation);
	CHECK(k.client.session_id().empty());
}

}
