#include "tcp_stream.hpp"

#include <thread>

namespace sshlink::ssh {

tcp_stream::tcp_stream(asio::io_context& io, logger& log)
: socket_(io)
, resolver_(io)
, log_(log)
{
}

bool tcp_stream::connect(std::string const& host, std::uint16_t port) {
	asio::error_code ec;
	auto endpoints = resolver_.resolve(host, std::to_string(port), ec);
	if(ec) {
		log_.log(logger::error, "Failed to resolve {}: {}", host, ec.message());
		return false;
	}

	asio::connect(socket_, endpoints, ec);
	if(ec) {
		log_.log(logger::error, "Connect failed: {}", ec.message());
		return false;
	}

	socket_.set_option(asio::ip::tcp::no_delay(true), ec);
	socket_.non_blocking(true, ec);
	if(ec) {
		log_.log(logger::error, "Failed to set non-blocking mode: {}", ec.message());
		return false;
	}

	log_.log(logger::info, "Connected to {}:{}", host, port);
	return true;
}

void tcp_stream::close() {
	asio::error_code ec;
	socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
	socket_.close(ec);
}

io_result tcp_stream::read(span out, std::size_t& size) {
	size = 0;
	asio::error_code ec;
	size = socket_.read_some(asio::buffer(out.data(), out.size()), ec);
	if(ec == asio::error::would_block || ec == asio::error::try_again) {
		return io_result::would_block;
	}
	if(ec == asio::error::eof) {
		return io_result::eof;
	}
	if(ec) {
		log_.log(logger::error, "Read failed: {}", ec.message());
		return io_result::error;
	}
	return io_result::data;
}

io_result tcp_stream::write(const_span data) {
	std::size_t pos = 0;
	while(pos < data.size()) {
		asio::error_code ec;
		pos += socket_.write_some(asio::buffer(data.data() + pos, data.size() - pos), ec);
		if(ec == asio::error::would_block || ec == asio::error::try_again) {
			std::this_thread::yield();
		} else if(ec) {
			log_.log(logger::error, "Write failed: {}", ec.message());
			return ec == asio::error::broken_pipe || ec == asio::error::connection_reset
				? io_result::eof : io_result::error;
		}
	}
	return io_result::data;
}

}
