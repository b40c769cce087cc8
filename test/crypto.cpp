#include "crypto.hpp"

#include "sshlink/core/packet_ser.hpp"
#include "sshlink/core/ssh_binary_util.hpp"

#include <nettle/eddsa.h>

namespace sshlink::ssh::test {

crypto_context seeded_crypto_context(std::uint64_t seed) {
	crypto_context cc = default_crypto_context();
	cc.construct_random = [seed]() -> std::unique_ptr<random> {
		return std::make_unique<seeded_random>(seed);
	};
	return cc;
}

ed25519_host_key::ed25519_host_key(std::uint8_t seed_byte)
: private_key_(ED25519_KEY_SIZE, std::byte{seed_byte})
, public_key_(ED25519_KEY_SIZE)
{
	ed25519_sha512_public_key(to_uint8_ptr(public_key_), to_uint8_ptr(private_key_));
}

byte_vector ed25519_host_key::public_key_blob() const {
	byte_vector res;
	ssh_bf_writer w(res);
	w.write(std::string_view("ssh-ed25519"));
	w.write(to_string_view(public_key_));
	res.resize(w.used_size());
	return res;
}

byte_vector ed25519_host_key::sign(const_span msg) const {
	byte_vector sig(ED25519_SIGNATURE_SIZE);
	ed25519_sha512_sign(to_uint8_ptr(public_key_), to_uint8_ptr(private_key_), msg.size(), to_uint8_ptr(msg), to_uint8_ptr(sig));

	byte_vector res;
	ssh_bf_writer w(res);
	w.write(std::string_view("ssh-ed25519"));
	w.write(to_string_view(sig));
	res.resize(w.used_size());
	return res;
}

}
