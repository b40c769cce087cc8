#ifndef SSHLINK_CORE_KEX_COMMON_HEADER
#define SSHLINK_CORE_KEX_COMMON_HEADER

#include "sshlink/core/kex.hpp"
#include "sshlink/core/ssh_binary_util.hpp"
#include "sshlink/core/util.hpp"

namespace sshlink::ssh {

hash_type deduce_hash_type(kex_type);
key_exchange_type deduce_exchange_type(kex_type);

/** \brief Parts shared by the ephemeral Diffie-Hellman style key exchanges
 *
 *  Keeps the state, computes the exchange hash and derives the keys (rfc4253 section 7.2).
 *  The derived classes do the method specific packet exchange.
 */
class kex_common : public kex {
public:
	kex_common(kex_context kex_c, kex_type ktype);

	kex_type type() const override;
	kex_state state() const override;

	void set_crypto_configuration(crypto_configuration conf) override;

	std::unique_ptr<ssh::cipher> construct_in_cipher() override;
	std::unique_ptr<ssh::cipher> construct_out_cipher() override;

	const_span session_id() const override;
	const_span exchange_hash() const override;
	ssh_public_key server_host_key() const override;

protected:
	kex_state set_state(kex_state s);

	template<typename... Args>
	kex_state set_error(ssh_error_code code, std::string_view msg, Args&&... args) {
		err_message_ = context_.logger().format(msg, std::forward<Args>(args)...);
		error_ = code;
		context_.logger().log_line(logger::error, err_message_);
		return set_state(kex_state::error);
	}

	/*
		H = HASH(V_C || V_S || I_C || I_S || K_S || Q_C/e || Q_S/f || K)

		The ephemeral keys are octet strings for the curve methods and mpints for
		the finite field methods, EphKey selects which.
	*/
	template<typename EphKey>
	byte_vector calculate_exchange_hash(const_span host_key, EphKey client_eph, EphKey server_eph, const_span secret) const {
		auto hash = context_.ccontext().construct_hash(hash_type_, context_.call_context());
		if(!hash) {
			return {};
		}

		hash_binout bo(*hash);
		ssh_bf_binout_writer w(bo);

		kex_init_data const& kinit = context_.init_data();
		bool client = context_.config().side == transport_side::client;

		w.write(std::string_view(client ? kinit.local_ver : kinit.remote_ver));
		w.write(std::string_view(client ? kinit.remote_ver : kinit.local_ver));
		w.write(to_string_view(client ? kinit.local_kexinit : kinit.remote_kexinit));
		w.write(to_string_view(client ? kinit.remote_kexinit : kinit.local_kexinit));
		w.write(to_string_view(host_key));
		w.write(client_eph);
		w.write(server_eph);
		// K is the shared secret interpreted as unsigned integer
		w.write(const_mpint_span{secret});

		return hash->digest();
	}

	/// client side: check the server signature over the exchange hash and store the results
	template<typename EphKey>
	kex_state finish_client(const_span host_key, EphKey client_eph, EphKey server_eph, byte_vector secret, const_span sig) {
		if(secret.empty() || is_zero(secret)) {
			return set_error(ssh_key_exchange_failed, "Invalid shared secret");
		}

		auto hash = calculate_exchange_hash(host_key, client_eph, server_eph, secret);
		if(hash.empty()) {
			return set_error(ssh_key_exchange_failed, "Failed to calculate exchange hash");
		}

		ssh_public_key hkey = load_ssh_public_key(host_key, context_.ccontext(), context_.call_context());
		if(!hkey.valid()) {
			return set_error(ssh_host_key_not_verifiable, "Failed to load server host key");
		}

		if(!hkey.verify(conf_.host_key, hash, sig)) {
			return set_error(sshlink_host_signature_error, "Server host signature verification failed [type={}]", to_string(conf_.host_key));
		}

		context_.logger().log(logger::info, "SSH server host key [type={}, fingerprint={}]"
			, to_string(hkey.type()), hkey.fingerprint(context_.ccontext(), context_.call_context()));

		set_data(std::move(hash), std::move(secret), byte_vector(host_key.begin(), host_key.end()));
		return set_state(kex_state::succeeded);
	}

	std::unique_ptr<ssh::cipher> construct_cipher(cipher_dir dir, crypto_configuration::type const& conf, char const* chars);
	byte_vector derive_crypto_material(hash& h, std::size_t size, char type) const;
	void set_data(byte_vector exhash, byte_vector secret, byte_vector host_key);

protected:
	kex_context context_;
	kex_type kex_type_{kex_type::unknown};
	hash_type hash_type_{hash_type::unknown};
	kex_state state_{kex_state::none};
	crypto_configuration conf_;
	std::unique_ptr<key_exchange> exchange_;

	const_span session_id_;
	byte_vector exchange_hash_;
	byte_vector secret_;
	byte_vector server_host_key_;
};

}

#endif
