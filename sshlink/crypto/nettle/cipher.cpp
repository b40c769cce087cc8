#include "sshlink/common/util.hpp"
#include "sshlink/crypto/crypto_call_context.hpp"
#include "sshlink/crypto/cipher.hpp"
#include "sshlink/crypto/ids.hpp"
#include "sshlink/crypto/openssl/poly1305.hpp"

#include <cstring>
#include <memory>

#include <nettle/chacha.h>
#include <nettle/gcm.h>

namespace sshlink::ssh::nettle {

static_assert(GCM_IV_SIZE == 12, "invalid iv size");

std::size_t const length_field_size = 4;

/*
	aes256-gcm@openssh.com: the packet_length field is not encrypted but is
	authenticated as associated data.
*/
class aes256_gcm_cipher : public cipher {
public:
	aes256_gcm_cipher(cipher_dir dir, const_span secret, const_span iv, crypto_call_context const& call)
	: cipher(GCM_BLOCK_SIZE, GCM_DIGEST_SIZE)
	, call_(call)
	, dir_(dir)
	{
		SSHLINK_ASSERT(iv.size() == GCM_IV_SIZE, "invalid iv size");
		SSHLINK_ASSERT(secret.size() == 32, "invalid key size");

		std::memcpy(iv_, iv.data(), GCM_IV_SIZE);
		nettle_gcm_aes256_set_key(&ctx_, to_uint8_ptr(secret));
	}

	bool encrypted_length() const override {
		return false;
	}

	bool decrypt_length(std::uint32_t, const_span in, span out) override {
		if(in.size() < length_field_size || out.size() < length_field_size) {
			return false;
		}
		copy(in.subspan(0, length_field_size), out);
		return true;
	}

	bool seal(std::uint32_t, const_span in, span out) override {
		SSHLINK_ASSERT(same_source_or_non_overlapping(in, out), "invalid in/out");
		SSHLINK_ASSERT(dir_ == cipher_dir::encrypt, "invalid cipher direction");
		if(in.size() < length_field_size || out.size() < in.size() + tag_size()) {
			return false;
		}

		nettle_gcm_aes256_set_iv(&ctx_, GCM_IV_SIZE, iv_);

		auto aad = in.subspan(0, length_field_size);
		auto data = in.subspan(length_field_size);
		nettle_gcm_aes256_update(&ctx_, aad.size(), to_uint8_ptr(aad));
		copy(aad, out);
		nettle_gcm_aes256_encrypt(&ctx_, data.size(), to_uint8_ptr(out)+length_field_size, to_uint8_ptr(data));
		nettle_gcm_aes256_digest(&ctx_, tag_size(), to_uint8_ptr(out)+in.size());

		increment_iv();
		return true;
	}

	bool open(std::uint32_t, const_span in, span out) override {
		SSHLINK_ASSERT(same_source_or_non_overlapping(in, out), "invalid in/out");
		SSHLINK_ASSERT(dir_ == cipher_dir::decrypt, "invalid cipher direction");
		if(in.size() < length_field_size + tag_size() || out.size() < in.size() - tag_size()) {
			return false;
		}

		std::size_t const size = in.size() - tag_size();
		auto aad = in.subspan(0, length_field_size);
		auto data = in.subspan(length_field_size, size - length_field_size);
		auto tag = in.subspan(size);

		nettle_gcm_aes256_set_iv(&ctx_, GCM_IV_SIZE, iv_);
		nettle_gcm_aes256_update(&ctx_, aad.size(), to_uint8_ptr(aad));

		std::byte calc_tag[GCM_DIGEST_SIZE];
		copy(aad, out);
		nettle_gcm_aes256_decrypt(&ctx_, data.size(), to_uint8_ptr(out)+length_field_size, to_uint8_ptr(data));
		nettle_gcm_aes256_digest(&ctx_, GCM_DIGEST_SIZE, reinterpret_cast<std::uint8_t*>(calc_tag));

		increment_iv();

		if(!compare_equal(calc_tag, tag)) {
			call_.log.log(logger::debug, "aes256-gcm authentication failed");
			return false;
		}
		return true;
	}

private:
	// the iv is combination of 4 bytes fixed and 8 bytes of invocation counter (rfc 5647).
	// the invocation counter is most significant byte first, increment it by one
	void increment_iv() {
		int i = sizeof(iv_)-1;
		while(i > 3 && ++iv_[i] == 0) {
			--i;
		}
	}

private:
	crypto_call_context call_;
	cipher_dir dir_;
	gcm_aes256_ctx ctx_;
	std::uint8_t iv_[GCM_IV_SIZE];
};

/*
	chacha20-poly1305@openssh.com: the 64 byte key is split into main key (first 32 bytes)
	and header key (last 32 bytes). The sequence number is the nonce for both.
	The header key encrypts the packet_length field, the main key with block counter 1
	encrypts the rest of the packet and the first 32 bytes of key stream with block
	counter 0 are the poly1305 key. The tag is calculated over the whole encrypted packet.
*/
class chacha20_poly1305_cipher : public cipher {
public:
	chacha20_poly1305_cipher(const_span secret, crypto_call_context const& call)
	: cipher(8, openssl::poly1305_tag_size)
	, call_(call)
	{
		SSHLINK_ASSERT(secret.size() == 2*CHACHA_KEY_SIZE, "invalid key size");
		std::memcpy(main_key_, secret.data(), CHACHA_KEY_SIZE);
		std::memcpy(header_key_, secret.data()+CHACHA_KEY_SIZE, CHACHA_KEY_SIZE);
	}

	bool valid() const {
		return poly_.valid();
	}

	bool encrypted_length() const override {
		return true;
	}

	bool decrypt_length(std::uint32_t seq, const_span in, span out) override {
		if(in.size() < length_field_size || out.size() < length_field_size) {
			return false;
		}
		crypt_length(seq, in, out);
		return true;
	}

	bool seal(std::uint32_t seq, const_span in, span out) override {
		SSHLINK_ASSERT(same_source_or_non_overlapping(in, out), "invalid in/out");
		if(in.size() < length_field_size || out.size() < in.size() + tag_size()) {
			return false;
		}

		std::uint8_t poly_key[openssl::poly1305_key_size];
		chacha_ctx ctx;
		init_main(seq, ctx, poly_key);

		crypt_length(seq, in, out);
		nettle_chacha_crypt(&ctx, in.size() - length_field_size,
			to_uint8_ptr(out)+length_field_size, to_uint8_ptr(in)+length_field_size);

		return poly_.tag(
			const_span(reinterpret_cast<std::byte const*>(poly_key), sizeof(poly_key)),
			out.subspan(0, in.size()),
			out.subspan(in.size(), tag_size()));
	}

	bool open(std::uint32_t seq, const_span in, span out) override {
		SSHLINK_ASSERT(same_source_or_non_overlapping(in, out), "invalid in/out");
		if(in.size() < length_field_size + tag_size() || out.size() < in.size() - tag_size()) {
			return false;
		}

		std::size_t const size = in.size() - tag_size();

		std::uint8_t poly_key[openssl::poly1305_key_size];
		chacha_ctx ctx;
		init_main(seq, ctx, poly_key);

		std::byte calc_tag[openssl::poly1305_tag_size];
		if(!poly_.tag(const_span(reinterpret_cast<std::byte const*>(poly_key), sizeof(poly_key)), in.subspan(0, size), calc_tag)) {
			return false;
		}

		// authenticate before decrypting anything
		if(!compare_equal(calc_tag, in.subspan(size))) {
			call_.log.log(logger::debug, "chacha20-poly1305 authentication failed");
			return false;
		}

		crypt_length(seq, in, out);
		nettle_chacha_crypt(&ctx, size - length_field_size,
			to_uint8_ptr(out)+length_field_size, to_uint8_ptr(in)+length_field_size);
		return true;
	}

private:
	static void make_nonce(std::uint32_t seq, std::uint8_t (&nonce)[CHACHA_NONCE_SIZE]) {
		u64ton(seq, reinterpret_cast<std::byte*>(nonce));
	}

	void crypt_length(std::uint32_t seq, const_span in, span out) {
		std::uint8_t nonce[CHACHA_NONCE_SIZE];
		make_nonce(seq, nonce);

		chacha_ctx ctx;
		nettle_chacha_set_key(&ctx, header_key_);
		nettle_chacha_set_nonce(&ctx, nonce);
		nettle_chacha_crypt(&ctx, length_field_size, to_uint8_ptr(out), to_uint8_ptr(in));
	}

	// derive poly1305 key from block 0 and position the context at block 1 for the payload
	void init_main(std::uint32_t seq, chacha_ctx& ctx, std::uint8_t (&poly_key)[openssl::poly1305_key_size]) {
		std::uint8_t nonce[CHACHA_NONCE_SIZE];
		make_nonce(seq, nonce);

		nettle_chacha_set_key(&ctx, main_key_);
		nettle_chacha_set_nonce(&ctx, nonce);

		std::uint8_t zeroes[openssl::poly1305_key_size]{};
		nettle_chacha_crypt(&ctx, sizeof(zeroes), poly_key, zeroes);

		// little endian block counter
		std::uint8_t const counter[CHACHA_COUNTER_SIZE] = {1, 0, 0, 0, 0, 0, 0, 0};
		nettle_chacha_set_counter(&ctx, counter);
	}

private:
	crypto_call_context call_;
	openssl::poly1305 poly_;
	std::uint8_t main_key_[CHACHA_KEY_SIZE];
	std::uint8_t header_key_[CHACHA_KEY_SIZE];
};

std::unique_ptr<ssh::cipher> create_cipher(cipher_type const& t, cipher_dir const& dir, const_span const& secret, const_span const& iv, crypto_call_context const& call) {
	using enum cipher_type;
	if(t == openssh_aes_256_gcm) {
		if(secret.size() == 32 && iv.size() == GCM_IV_SIZE) {
			return std::make_unique<aes256_gcm_cipher>(dir, secret, iv, call);
		} else {
			call.log.log(logger::error, "invalid key or iv size for aes256-gcm");
		}
	} else if(t == openssh_chacha20_poly1305) {
		if(secret.size() == 2*CHACHA_KEY_SIZE) {
			auto c = std::make_unique<chacha20_poly1305_cipher>(secret, call);
			if(c->valid()) {
				return c;
			}
			call.log.log(logger::error, "poly1305 not available");
		} else {
			call.log.log(logger::error, "invalid key size for chacha20-poly1305");
		}
	}
	return nullptr;
}

}
