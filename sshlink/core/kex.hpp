#ifndef SSHLINK_CORE_KEX_HEADER
#define SSHLINK_CORE_KEX_HEADER

#include "kexinit.hpp"
#include "packet_types.hpp"
#include "ssh_public_key.hpp"
#include "transport_base.hpp"
#include "sshlink/crypto/crypto_context.hpp"

#include <iosfwd>
#include <memory>

namespace sshlink::ssh {

enum class kex_state {
	none,
	inprogress,
	succeeded,
	error
};

std::string_view to_string(kex_state);
std::ostream& operator<<(std::ostream&, kex_state);

/** \brief One key exchange run, from the method specific init packet to the derived keys
 */
class kex {
public:
	virtual ~kex() = default;

	virtual kex_type type() const = 0;
	virtual kex_state state() const = 0;

	// notice that this is called before the crypto configuration is set
	virtual kex_state initiate() = 0;
	virtual kex_state handle(ssh_packet_type type, const_span payload) = 0;

	virtual void set_crypto_configuration(crypto_configuration conf) = 0;

	/// construct ciphers from the derived keys, only valid after the kex succeeded
	virtual std::unique_ptr<ssh::cipher> construct_in_cipher() = 0;
	virtual std::unique_ptr<ssh::cipher> construct_out_cipher() = 0;

	virtual const_span session_id() const = 0;
	virtual const_span exchange_hash() const = 0;
	virtual ssh_public_key server_host_key() const = 0;

	ssh_error_code error() const {
		return error_;
	}

	std::string error_message() const {
		return err_message_;
	}

protected:
	ssh_error_code error_{ssh_noerror};
	std::string err_message_;
};

class kex_context {
public:
	kex_context(transport_base& transport, kex_init_data const& init_data)
	: transport_(transport)
	, init_data_(init_data)
	{}

	template<typename Packet, typename... Args>
	bool send_packet(Args&&... args) {
		return transport_.send_packet<Packet>(std::forward<Args>(args)...);
	}

	ssh_config const& config() const { return transport_.config(); }
	kex_init_data const& init_data() const { return init_data_; }
	crypto_context const& ccontext() const { return transport_.crypto(); }
	crypto_call_context call_context() const { return transport_.call_context(); }
	ssh::logger& logger() const { return transport_.log(); }

private:
	transport_base& transport_;
	kex_init_data const& init_data_;
};

/// construct client side key exchange, returns null for unsupported types
std::unique_ptr<kex> construct_client_kex(kex_type, kex_context);

}

#endif
