#ifndef SSHLINK_CORE_PUBLIC_KEY_HEADER
#define SSHLINK_CORE_PUBLIC_KEY_HEADER

#include "sshlink/crypto/crypto_context.hpp"
#include "sshlink/crypto/public_key.hpp"

#include <memory>
#include <string>

namespace sshlink::ssh {

/** \brief SSH public key (server host key) that is used for signature checking
 */
class ssh_public_key {
public:
	ssh_public_key() = default;
	ssh_public_key(std::shared_ptr<public_key>, byte_vector blob);

	key_type type() const;
	bool valid() const;

	/*
		Verify ssh encoded signature ("string format, string blob") over msg.
		The signature format must match sig_type (the negotiated host key algorithm).
	*/
	bool verify(key_type sig_type, const_span msg, const_span signature) const;

	/// the ssh encoded public key this was loaded from
	const_span blob() const { return blob_; }

	// sha256 fingerprint with base64 encoding
	std::string fingerprint(crypto_context const& crypto, crypto_call_context const& call) const;

private:
	std::shared_ptr<public_key> key_impl_;
	byte_vector blob_;
};

ssh_public_key load_ssh_public_key(const_span data, crypto_context const&, crypto_call_context const&);
ssh_public_key load_base64_ssh_public_key(std::string_view data, crypto_context const&, crypto_call_context const&);

}

#endif
