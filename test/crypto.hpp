#ifndef SSHLINK_TEST_CRYPTO_HEADER
#define SSHLINK_TEST_CRYPTO_HEADER

#include "log.hpp"
#include "random.hpp"
#include "sshlink/crypto/crypto_context.hpp"

#include <catch2/catch.hpp>

namespace sshlink::ssh::test {

/// default crypto, but the random generators are deterministic from the seed
crypto_context seeded_crypto_context(std::uint64_t seed);

struct crypto_test_context : crypto_context {
	crypto_test_context(logger& log = test_log(), crypto_context cc = default_crypto_context())
	: crypto_context(std::move(cc))
	, rand(construct_random())
	, call(log, *rand)
	{
		REQUIRE(rand);
	}

	std::unique_ptr<random> rand;
	crypto_call_context call;
};

/// ed25519 host key of the test server, signs with nettle
class ed25519_host_key {
public:
	explicit ed25519_host_key(std::uint8_t seed_byte = 0x42);

	/// "ssh-ed25519" public key blob (rfc8709)
	byte_vector public_key_blob() const;

	/// "ssh-ed25519" signature blob of the message
	byte_vector sign(const_span msg) const;

private:
	byte_vector private_key_;
	byte_vector public_key_;
};

}

#endif
