#ifndef SSHLINK_CORE_KEXINIT_HEADER
#define SSHLINK_CORE_KEXINIT_HEADER

#include "errors.hpp"
#include "sshlink/crypto/ids.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace sshlink::ssh {

enum class kex_type {
	unknown = 0,
	curve25519_sha256,
	libssh_curve25519_sha256,
	dh_group14_sha256
};

std::string_view to_string(kex_type);
kex_type from_string(type_tag<kex_type>, std::string_view);

struct crypto_configuration {
	kex_type kex{};
	key_type host_key{};

	struct type {
		cipher_type cipher{};
		compress_type compress{};

		friend bool operator==(type const&, type const&) = default;
	} in, out;

	bool valid() const;

	friend bool operator==(crypto_configuration const&, crypto_configuration const&) = default;
};

std::ostream& operator<<(std::ostream&, crypto_configuration const&);

/// The transcript parts that are needed by the key exchange to calculate the exchange hash
struct kex_init_data {
	std::string local_ver;
	std::string remote_ver;
	byte_vector local_kexinit;
	byte_vector remote_kexinit;
	// empty for the first key exchange
	const_span session_id;
};

struct supported_algorithms;
class logger;

/// Selects the algorithms to use from the local and remote kexinit lists (rfc4253 section 7.1)
class kexinit_agreement {
public:
	kexinit_agreement(logger&, transport_side my_side, supported_algorithms const& my);

	bool agree(supported_algorithms const& remote);
	bool was_guess_correct() const;

	crypto_configuration agreed_configuration() const;

	/// which algorithm category failed, empty if agreement succeeded
	std::string_view failed_category() const { return failed_; }

private:
	logger& logger_;
	transport_side my_side_;
	supported_algorithms const& my_;
	std::optional<crypto_configuration> agreed_;
	bool guess_was_correct_{};
	std::string_view failed_;
};

}

#endif
