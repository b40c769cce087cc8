#ifndef SSHLINK_CRYPTO_CRYPTO_CALL_CONTEXT_HEADER
#define SSHLINK_CRYPTO_CRYPTO_CALL_CONTEXT_HEADER

#include "random.hpp"
#include "sshlink/common/types.hpp"
#include "sshlink/common/logger.hpp"

namespace sshlink::ssh {

/// Context that is passed to crypto construct functions
struct crypto_call_context {
	logger& log;
	random& rand;
};

}

#endif
