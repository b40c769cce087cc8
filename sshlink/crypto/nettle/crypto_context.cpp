#include "crypto_context.hpp"

namespace sshlink::ssh::nettle {

std::unique_ptr<ssh::cipher> create_cipher(cipher_type const&, cipher_dir const&, const_span const& secret, const_span const& iv, crypto_call_context const&);
std::unique_ptr<ssh::public_key> create_public_key(public_key_data const&, crypto_call_context const&);
std::unique_ptr<ssh::key_exchange> create_key_exchange(key_exchange_type const&, crypto_call_context const&);
std::unique_ptr<ssh::hash> create_hash(hash_type const&, crypto_call_context const&);

crypto_context create_nettle_context() {
	return crypto_context{
			create_default_random,
			create_cipher,
			create_public_key,
			create_key_exchange,
			create_hash
		};
}

}
