#ifndef SSHLINK_CRYPTO_OPENSSL_POLY1305_HEADER
#define SSHLINK_CRYPTO_OPENSSL_POLY1305_HEADER

#include "sshlink/common/types.hpp"

#include <memory>

typedef struct evp_mac_st EVP_MAC;

namespace sshlink::ssh::openssl {

std::size_t const poly1305_key_size = 32;
std::size_t const poly1305_tag_size = 16;

/// Poly1305 one-time authenticator, a fresh key must be used for every message
class poly1305 {
public:
	poly1305();

	bool valid() const { return mac_ != nullptr; }

	/// calculate the 16 byte tag over msg to out
	bool tag(const_span key, const_span msg, span out) const;

private:
	struct mac_deleter {
		void operator()(EVP_MAC*) const;
	};

	std::unique_ptr<EVP_MAC, mac_deleter> mac_;
};

}

#endif
