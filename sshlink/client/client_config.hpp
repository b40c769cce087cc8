#ifndef SSHLINK_CLIENT_CLIENT_CONFIG_HEADER
#define SSHLINK_CLIENT_CLIENT_CONFIG_HEADER

#include "sshlink/core/ssh_config.hpp"
#include "sshlink/core/connection/channel.hpp"
#include "sshlink/core/service/names.hpp"

namespace sshlink::ssh {

struct client_config : ssh_config {
	/// username that is used for authentication
	std::string username;

	/// password for authentication
	std::string password;

	/// service that we authenticate for
	std::string service{connection_service_name};

	/// terminal parameters for the pty request
	pty_config pty;

	/// our side of the channels
	channel_config channel;

	/// how long to wait for the remote side to acknowledge channel close
	std::chrono::milliseconds close_timeout{1500};

	/// upper limit for waiting single operation (connect, channel open, request reply), zero means no limit
	std::chrono::milliseconds operation_timeout{30s};
};

}

#endif
