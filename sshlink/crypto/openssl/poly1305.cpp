#include "poly1305.hpp"

#include <openssl/evp.h>

namespace sshlink::ssh::openssl {

void poly1305::mac_deleter::operator()(EVP_MAC* m) const {
	EVP_MAC_free(m);
}

poly1305::poly1305()
: mac_(EVP_MAC_fetch(nullptr, "POLY1305", nullptr))
{
}

bool poly1305::tag(const_span key, const_span msg, span out) const {
	if(!mac_ || key.size() != poly1305_key_size || out.size() < poly1305_tag_size) {
		return false;
	}

	std::unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)> ctx(EVP_MAC_CTX_new(mac_.get()), &EVP_MAC_CTX_free);
	if(!ctx) {
		return false;
	}

	std::size_t out_len{};
	return EVP_MAC_init(ctx.get(), to_uint8_ptr(key), key.size(), nullptr) == 1
		&& EVP_MAC_update(ctx.get(), to_uint8_ptr(msg), msg.size()) == 1
		&& EVP_MAC_final(ctx.get(), to_uint8_ptr(out), &out_len, poly1305_tag_size) == 1
		&& out_len == poly1305_tag_size;
}

}
