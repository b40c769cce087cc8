#ifndef SSHLINK_CLIENT_AUTH_SERVICE_HEADER
#define SSHLINK_CLIENT_AUTH_SERVICE_HEADER

#include "sshlink/common/logger.hpp"
#include "sshlink/core/service/ssh_service.hpp"

namespace sshlink::ssh {

class transport_base;

/// Client side of the user authentication protocol (rfc4252) with the password method
class client_auth_service : public ssh_service {
public:
	client_auth_service(transport_base& transport, std::string username, std::string service, std::string password);

	std::string_view name() const override;
	service_state state() const override;

	/// checks the credentials and sends the password request
	bool init() override;
	handler_result process(ssh_packet_type, const_span payload) override;

	std::string const& username() const { return username_; }
	std::string const& service() const { return service_; }

	std::string const& banner() const { return banner_; }

protected:
	virtual void on_banner(std::string_view);

private:
	void handle_banner(const_span payload);
	void handle_success();
	void handle_failure(const_span payload);
	void handle_change_password(const_span payload);

	void fail(ssh_error_code, std::string msg);

private:
	transport_base& transport_;
	logger& log_;
	service_state state_{service_state::none};

	std::string username_;
	std::string service_;
	std::string password_;

	std::string banner_;
};

}

#endif
