#ifndef SSHLINK_TOOLS_SSHLINK_CLIENT_TCP_STREAM_HEADER
#define SSHLINK_TOOLS_SSHLINK_CLIENT_TCP_STREAM_HEADER

#include "sshlink/common/logger.hpp"
#include "sshlink/net/byte_stream.hpp"

#include <asio.hpp>

namespace sshlink::ssh {

/// non-blocking TCP connection as byte stream for ssh_session
class tcp_stream : public byte_stream {
public:
	tcp_stream(asio::io_context&, logger&);

	/// resolve and connect (blocking), then switch the socket to non-blocking mode
	bool connect(std::string const& host, std::uint16_t port);
	void close();

	io_result read(span out, std::size_t& size) override;
	io_result write(const_span data) override;

private:
	asio::ip::tcp::socket socket_;
	asio::ip::tcp::resolver resolver_;
	logger& log_;
};

}

#endif
