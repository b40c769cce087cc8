#ifndef SSHLINK_CORE_SERVICE_HEADER
#define SSHLINK_CORE_SERVICE_HEADER

#include "sshlink/core/errors.hpp"
#include "sshlink/core/packet_types.hpp"
#include "sshlink/core/ssh_state.hpp"

#include <string>

namespace sshlink::ssh {

enum class service_state {
	none,
	inprogress,
	done,
	error
};
std::string_view to_string(service_state);

/// service that is run on top of the transport after the service request (rfc4253 section 10)
class ssh_service {
public:
	virtual ~ssh_service() = default;

	virtual std::string_view name() const = 0;
	virtual service_state state() const = 0;

	// called after constructing the service (this function can send packets specific to the service)
	virtual bool init() = 0;

	// process a packet from network, payload does not contain the message number
	virtual handler_result process(ssh_packet_type, const_span payload) = 0;

	// try to send buffered data, return true if there is still more to send
	virtual bool flush() { return false; }

	ssh_error_code error() const {
		return error_;
	}

	std::string error_message() const {
		return err_message_;
	}

	void set_error(ssh_error_code err, std::string msg) {
		error_ = err;
		err_message_ = std::move(msg);
	}

protected:
	ssh_error_code error_{ssh_noerror};
	std::string err_message_;
};

}

#endif
