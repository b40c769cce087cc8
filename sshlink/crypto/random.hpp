#ifndef SSHLINK_CRYPTO_RANDOM_HEADER
#define SSHLINK_CRYPTO_RANDOM_HEADER

#include "sshlink/common/types.hpp"
#include <memory>

namespace sshlink::ssh {

/// Interface to get random values/bytes
class random {
public:
	virtual ~random() = default;

	// returns random std::size_t between [min, max] range
	virtual std::size_t random_uint(std::size_t min, std::size_t max) = 0;

	// fills the given span with random bytes
	virtual void random_bytes(span output) = 0;
};

/// random backed by the operating system entropy source
std::unique_ptr<random> create_default_random();

}

#endif
