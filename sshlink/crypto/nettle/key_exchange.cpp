#include "nettle_helper.hpp"
#include "util.hpp"
#include "sshlink/crypto/crypto_call_context.hpp"
#include "sshlink/crypto/ids.hpp"
#include "sshlink/crypto/key_exchange.hpp"
#include "sshlink/common/util.hpp"

#include <nettle/curve25519.h>

namespace sshlink::ssh::nettle {

class X25519_key_exchange : public key_exchange {
public:
	X25519_key_exchange(crypto_call_context const& c)
	: context_(c)
	{
		context_.log.log(logger::debug_trace, "constructing X25519_key_exchange");

		priv_.resize(CURVE25519_SIZE);
		context_.rand.random_bytes(priv_);
		clamp25519(priv_);

		pub_.resize(CURVE25519_SIZE);
		nettle_curve25519_mul_g(to_uint8_ptr(pub_), to_uint8_ptr(priv_));
	}

	key_exchange_type type() const override {
		return key_exchange_type::X25519;
	}

	const_span public_key() const override {
		return pub_;
	}

	byte_vector agree(const_span remote_public) override {
		if(remote_public.size() != CURVE25519_SIZE) {
			context_.log.log(logger::debug, "invalid X25519 public key size {}", remote_public.size());
			return {};
		}

		byte_vector res;
		res.resize(CURVE25519_SIZE);
		nettle_curve25519_mul(
			to_uint8_ptr(res),
			to_uint8_ptr(priv_),
			to_uint8_ptr(remote_public));

		// low order points give all-zero shared secret (rfc 7748 section 6.1)
		if(is_zero(res)) {
			context_.log.log(logger::debug, "X25519 shared secret is zero");
			return {};
		}

		return res;
	}

private:
	crypto_call_context context_;
	byte_vector pub_;
	byte_vector priv_;
};

// finite field diffie-hellman over a safe prime group, rfc4253 section 8
class dh_key_exchange : public key_exchange {
public:
	dh_key_exchange(key_exchange_type t, crypto_call_context const& c, const_span modulus, const_span generator)
	: context_(c)
	, type_(t)
	, p_(modulus)
	, p_minus_1_(modulus)
	{
		mpz_sub_ui(p_minus_1_, p_minus_1_, 1);

		// private exponent 1 < x < q where q = (p-1)/2 is the subgroup order,
		// drawn as 0 <= r < q-2 and shifted by two
		integer range(p_minus_1_);
		mpz_div_ui(range, range, 2);
		mpz_sub_ui(range, range, 2);
		nettle_mpz_random(x_, &context_.rand, random_func, range);
		mpz_add_ui(x_, x_, 2);

		integer e;
		mpz_powm(e, integer(generator), x_, p_);
		if(in_range(e)) {
			pubkey_ = e.to_bytes();
		}
	}

	bool is_valid() const {
		return !pubkey_.empty();
	}

	key_exchange_type type() const override {
		return type_;
	}

	const_span public_key() const override {
		return pubkey_;
	}

	byte_vector agree(const_span remote_public) override {
		integer f(remote_public);
		if(remote_public.empty() || !in_range(f)) {
			context_.log.log(logger::debug, "invalid diffie-hellman public value [size={}]", remote_public.size());
			return {};
		}

		integer k;
		mpz_powm(k, f, x_, p_);
		return k.to_bytes();
	}

private:
	// public values must satisfy 1 < v < p-1
	bool in_range(mpz_t const v) const {
		return mpz_cmp_ui(v, 1) > 0 && mpz_cmp(v, p_minus_1_) < 0;
	}

private:
	crypto_call_context context_;
	key_exchange_type type_;
	integer p_;
	integer p_minus_1_;
	integer x_;
	byte_vector pubkey_;
};

std::unique_ptr<ssh::key_exchange> create_key_exchange(key_exchange_type const& t, crypto_call_context const& c) {
	if(t == key_exchange_type::X25519) {
		return std::make_unique<X25519_key_exchange>(c);
	} else if(t == key_exchange_type::dh_group14) {
		auto p = std::make_unique<dh_key_exchange>(t, c, modp_group_14_modulus(), modp_group_14_generator());
		if(p->is_valid()) {
			return p;
		}
	}
	return nullptr;
}

}
