#ifndef SSHLINK_CRYPTO_KEY_EXCHANGE_HEADER
#define SSHLINK_CRYPTO_KEY_EXCHANGE_HEADER

#include "ids.hpp"
#include "sshlink/common/types.hpp"
#include <vector>

namespace sshlink::ssh {

class key_exchange {
public:
	virtual ~key_exchange() = default;

	virtual key_exchange_type type() const = 0;

	/// return the public key part that is exchanged with the remote side (the format depends on the key exchange used)
	virtual const_span public_key() const = 0;

	/// calculate shared secret and return it, empty on failure
	virtual byte_vector agree(const_span remote_public) = 0;
};

// 2048-bit MODP Group from RFC 3526
const_span modp_group_14_modulus();
const_span modp_group_14_generator();

}

#endif
