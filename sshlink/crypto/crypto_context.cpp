#include "crypto_context.hpp"

#include "sshlink/crypto/nettle/crypto_context.hpp"

namespace sshlink::ssh {

crypto_context default_crypto_context() {
	return nettle::create_nettle_context();
}

}
