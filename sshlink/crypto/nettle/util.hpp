#ifndef SSHLINK_CRYPTO_NETTLE_UTIL_HEADER
#define SSHLINK_CRYPTO_NETTLE_UTIL_HEADER

#include "sshlink/common/types.hpp"
#include "sshlink/crypto/random.hpp"

#include <cstdint>
#include <cstddef>

namespace sshlink::ssh::nettle {

inline void clamp25519(span key) {
	if(key.size() == 32) {
		// decode 32 random bytes as an integer scalar (RFC 7748)
		key[0]  &= std::byte{248};
		key[31] &= std::byte{127};
		key[31] |= std::byte{64};
	}
}

/// nettle_random_func adaptor, ctx is ssh::random
inline void random_func(void* ctx, std::size_t length, std::uint8_t* dst) {
	static_cast<ssh::random*>(ctx)->random_bytes(span(reinterpret_cast<std::byte*>(dst), length));
}

}

#endif
