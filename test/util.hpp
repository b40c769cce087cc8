#ifndef SSHLINK_TEST_UTIL_HEADER
#define SSHLINK_TEST_UTIL_HEADER

#include "configs.hpp"
#include "test_buffers.hpp"
#include "test/util/test_server.hpp"

#include "sshlink/client/ssh_client.hpp"

namespace sshlink::ssh::test {

struct test_context {
	string_io_buffer out_buf;
};

/// client transport that writes to its own buffer
struct client_pair_side : test_context, client_config, ssh_client {
	client_pair_side(client_config c = test_client_config(), crypto_context cc = default_crypto_context())
	: client_config(std::move(c))
	, ssh_client(*this, test_log(), out_buf, std::move(cc))
	{}
};

/// scripted server that writes to its own buffer
struct server_pair_side {
	server_pair_side(ssh_config c = test_server_config(), crypto_context cc = default_crypto_context(), server_options opts = {})
	: config(std::move(c))
	, transport(config, log, out_buf, std::move(cc), host_key, std::move(opts))
	{}

	transport_op process(in_buffer& in) { return transport.process(in); }
	ssh_error_code error() const { return transport.error(); }

	ssh_config config;
	session_logger log{test_log(), "[server] "};
	ed25519_host_key host_key;
	string_io_buffer out_buf;
	test_server transport;
};

/// run both sides until neither has anything more to say
template<typename Client, typename Server>
bool run(Client& client, Server& server) {
	bool run = true;
	while(run) {
		auto client_op = client.process(server.out_buf);
		run = client_op != transport_op::disconnected && client_op != transport_op::pending_action;

		auto server_op = server.process(client.out_buf);
		run = run && server_op != transport_op::disconnected && server_op != transport_op::pending_action;
		if(server_op == transport_op::disconnected) {
			// give the client chance to read the disconnect packet
			while(client.process(server.out_buf) != transport_op::disconnected && !server.out_buf.empty()) {}
		}
		run = run && (!client.out_buf.empty() || !server.out_buf.empty());
	}
	return client.error() == 0 && server.error() == 0;
}

}

#endif
