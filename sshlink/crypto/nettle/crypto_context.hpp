#ifndef SSHLINK_CRYPTO_NETTLE_CRYPTO_CONTEXT_HEADER
#define SSHLINK_CRYPTO_NETTLE_CRYPTO_CONTEXT_HEADER

#include "sshlink/crypto/crypto_context.hpp"

namespace sshlink::ssh::nettle {

crypto_context create_nettle_context();

}

#endif
