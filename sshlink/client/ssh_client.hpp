#ifndef SSHLINK_CLIENT_HEADER
#define SSHLINK_CLIENT_HEADER

#include "auth_service.hpp"
#include "client_config.hpp"

#include "sshlink/core/ssh_transport.hpp"
#include "sshlink/core/connection/ssh_connection.hpp"

#include <memory>

namespace sshlink::ssh {

/// progress of the client session, each state is reached only after the previous one
enum class session_state {
	connected,
	version_exchanged,
	key_exchanged,
	service_requested,
	authenticated,
	disconnected
};
std::string_view to_string(session_state);
std::ostream& operator<<(std::ostream&, session_state);

/** \brief SSH Version 2 Client side
 *
 *  Drives version exchange, key exchange, password authentication and then runs the connection service.
 */
class ssh_client : public ssh_transport {
public:
	ssh_client(client_config const&, logger& log, out_buffer&, crypto_context = default_crypto_context());

	session_state state_of_session() const { return session_state_; }

	/// connection service, available after authentication
	ssh_connection* connection() const { return connection_.get(); }

	/// authentication service, available after the service request was accepted
	client_auth_service const* auth() const { return auth_.get(); }

	client_config const& client_conf() const { return config_; }

protected:
	void on_version_exchange(ssh_version const&) override;
	void on_state_change(ssh_state old_s, ssh_state new_s) override;

	handler_result handle_kex_done(kex const&) override;
	handler_result handle_transport_packet(ssh_packet_type, const_span payload) override;

	virtual std::unique_ptr<client_auth_service> construct_auth();
	virtual std::unique_ptr<ssh_connection> construct_connection();

private:
	handler_result handle_service_accept(const_span payload);
	handler_result handle_pre_auth_global_request(const_span payload);
	handler_result process_auth(ssh_packet_type type, const_span payload);

	void start_user_auth();
	void start_connection();
	void set_session_state(session_state);

protected:
	client_config const& config_;

private:
	session_state session_state_{session_state::connected};
	std::unique_ptr<client_auth_service> auth_;
	std::unique_ptr<ssh_connection> connection_;
};

}

#endif
