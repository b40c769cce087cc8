#ifndef SSHLINK_CRYPTO_IDS_HEADER
#define SSHLINK_CRYPTO_IDS_HEADER

#include "sshlink/common/algo_list.hpp"
#include <string_view>

namespace sshlink::ssh {

enum class cipher_type {
	unknown = 0,
	openssh_chacha20_poly1305,
	openssh_aes_256_gcm
};

std::string_view to_string(cipher_type);
cipher_type from_string(type_tag<cipher_type>, std::string_view);

enum class cipher_dir {
	encrypt,
	decrypt
};

std::size_t cipher_iv_size(cipher_type);
std::size_t cipher_key_size(cipher_type);

/// all supported ciphers are authenticated, so the negotiated mac is not used for anything
bool is_aead(cipher_type);

enum class mac_type {
	unknown = 0,
	hmac_sha2_256
};

std::string_view to_string(mac_type);
mac_type from_string(type_tag<mac_type>, std::string_view);

// nothing supported for now
enum class compress_type {
	unknown = 0,
	none
};

std::string_view to_string(compress_type);
compress_type from_string(type_tag<compress_type>, std::string_view);

/*
	Host key algorithms. The rsa-sha2-* variants share the ssh-rsa key format
	and only differ in the signature hash.
*/
enum class key_type {
	unknown = 0,
	ssh_rsa,
	ssh_ed25519,
	ecdsa_sha2_nistp256,
	rsa_sha2_256,
	rsa_sha2_512
};

std::size_t const ed25519_key_size = 32;
std::size_t const ed25519_signature_size = 64;

std::string_view to_string(key_type);
key_type from_string(type_tag<key_type>, std::string_view);

// this will give the curve name only for ecdsa types, otherwise empty
std::string_view to_curve_name(key_type);

/// the key blob type that signatures of the given algorithm are made with
key_type key_format(key_type);

enum class key_exchange_type {
	unknown = 0,
	X25519,
	dh_group14
};

std::string_view to_string(key_exchange_type);

enum class hash_type {
	unknown = 0,
	sha2_256,
	sha2_512
};

std::string_view to_string(hash_type);

}

#endif
