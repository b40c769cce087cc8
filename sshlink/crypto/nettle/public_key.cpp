#include "nettle_helper.hpp"
#include "sshlink/crypto/crypto_call_context.hpp"
#include "sshlink/crypto/public_key.hpp"
#include "sshlink/crypto/ids.hpp"
#include <memory>

#include <nettle/bignum.h>
#include <nettle/ecdsa.h>
#include <nettle/eddsa.h>
#include <nettle/dsa.h>
#include <nettle/rsa.h>
#include <nettle/sha2.h>
#include <nettle/ecc-curve.h>

namespace sshlink::ssh::nettle {

class ed25519_public_key : public public_key {
public:
	ed25519_public_key(ed25519_public_key_data const& d)
	: pubkey_(d.pubkey.begin(), d.pubkey.end())
	{
	}

	key_type type() const override {
		return key_type::ssh_ed25519;
	}

	bool verify(key_type sig_type, const_span msg, const_span signature) const override {
		if(sig_type != key_type::ssh_ed25519 || signature.size() != ED25519_SIGNATURE_SIZE) {
			return false;
		}

		return nettle_ed25519_sha512_verify(
			to_uint8_ptr(pubkey_),
			msg.size(),
			to_uint8_ptr(msg),
			to_uint8_ptr(signature) ) == 1;
	}

private:
	byte_vector pubkey_;
};

class rsa_public_key : public public_key {
public:
	rsa_public_key(rsa_public_key_data const& d)
	{
		nettle_rsa_public_key_init(&public_key_);
		nettle_mpz_set_str_256_u(public_key_.e, d.e.data.size(), to_uint8_ptr(d.e.data));
		nettle_mpz_set_str_256_u(public_key_.n, d.n.data.size(), to_uint8_ptr(d.n.data));
		is_valid_ = nettle_rsa_public_key_prepare(&public_key_) == 1;
	}

	~rsa_public_key() {
		nettle_rsa_public_key_clear(&public_key_);
	}

	bool valid() const {
		return is_valid_;
	}

	key_type type() const override {
		return key_type::ssh_rsa;
	}

	bool verify(key_type sig_type, const_span msg, const_span signature) const override {
		integer sig(signature);

		if(sig_type == key_type::rsa_sha2_256) {
			std::uint8_t digest[SHA256_DIGEST_SIZE];
			sha256_ctx ctx;
			nettle_sha256_init(&ctx);
			nettle_sha256_update(&ctx, msg.size(), to_uint8_ptr(msg));
			nettle_sha256_digest(&ctx, sizeof(digest), digest);
			return nettle_rsa_sha256_verify_digest(&public_key_, digest, sig) == 1;
		} else if(sig_type == key_type::rsa_sha2_512) {
			std::uint8_t digest[SHA512_DIGEST_SIZE];
			sha512_ctx ctx;
			nettle_sha512_init(&ctx);
			nettle_sha512_update(&ctx, msg.size(), to_uint8_ptr(msg));
			nettle_sha512_digest(&ctx, sizeof(digest), digest);
			return nettle_rsa_sha512_verify_digest(&public_key_, digest, sig) == 1;
		}
		// plain ssh-rsa (sha1) signatures are not accepted
		return false;
	}

private:
	bool is_valid_{};
	::rsa_public_key public_key_;
};

std::size_t const p256_coordinate_size = 32;

class ecdsa_public_key : public public_key {
public:
	ecdsa_public_key(ecdsa_public_key_data const& d)
	: type_(d.ecdsa_type)
	{
		nettle_ecc_point_init(&ecc_point_, nettle_get_secp_256r1());
		// see the size is correct and it is uncompressed ecc point, otherwise don't bother
		if(d.ecc_point.size() == 1 + 2*p256_coordinate_size && d.ecc_point[0] == std::byte{0x04}) {
			integer x(d.ecc_point.subspan(1, p256_coordinate_size));
			integer y(d.ecc_point.subspan(1 + p256_coordinate_size));
			is_valid_ = nettle_ecc_point_set(&ecc_point_, x, y) == 1;
		}
	}

	~ecdsa_public_key() {
		nettle_ecc_point_clear(&ecc_point_);
	}

	bool valid() const {
		return is_valid_;
	}

	key_type type() const override {
		return type_;
	}

	// signature is r and s, both 32 bytes
	bool verify(key_type sig_type, const_span msg, const_span signature) const override {
		if(sig_type != type_ || signature.size() != 2*p256_coordinate_size) {
			return false;
		}

		std::uint8_t digest[SHA256_DIGEST_SIZE];
		sha256_ctx ctx;
		nettle_sha256_init(&ctx);
		nettle_sha256_update(&ctx, msg.size(), to_uint8_ptr(msg));
		nettle_sha256_digest(&ctx, sizeof(digest), digest);

		dsa_signature sig;
		nettle_dsa_signature_init(&sig);
		nettle_mpz_set_str_256_u(sig.r, p256_coordinate_size, to_uint8_ptr(signature));
		nettle_mpz_set_str_256_u(sig.s, p256_coordinate_size, to_uint8_ptr(signature)+p256_coordinate_size);
		bool res = nettle_ecdsa_verify(&ecc_point_, sizeof(digest), digest, &sig) == 1;
		nettle_dsa_signature_clear(&sig);
		return res;
	}

private:
	bool is_valid_{};
	key_type type_;
	ecc_point ecc_point_;
};

std::unique_ptr<ssh::public_key> create_public_key(public_key_data const& d, crypto_call_context const& call) {
	if(d.type() == key_type::ssh_ed25519) {
		return std::make_unique<ed25519_public_key>(static_cast<ed25519_public_key_data const&>(d));
	} else if(d.type() == key_type::ssh_rsa) {
		auto key = std::make_unique<rsa_public_key>(static_cast<rsa_public_key_data const&>(d));
		if(key->valid()) {
			return key;
		}
		call.log.log(logger::debug, "invalid rsa public key");
	} else if(d.type() == key_type::ecdsa_sha2_nistp256) {
		auto key = std::make_unique<ecdsa_public_key>(static_cast<ecdsa_public_key_data const&>(d));
		if(key->valid()) {
			return key;
		}
		call.log.log(logger::debug, "invalid ecdsa public key");
	}
	return nullptr;
}

}
