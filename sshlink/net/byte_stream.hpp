#ifndef SSHLINK_NET_BYTE_STREAM_HEADER
#define SSHLINK_NET_BYTE_STREAM_HEADER

#include "sshlink/common/types.hpp"

#include <string_view>

namespace sshlink::ssh {

enum class io_result {
	data,        // some bytes were transferred
	would_block, // nothing available right now, try again
	eof,         // remote closed the stream
	error
};
std::string_view to_string(io_result);

/** \brief Non-blocking byte stream to the server (for example TCP socket)
 *
 *  The stream does not know anything about SSH packets, the transport layer
 *  collects bytes until it has a whole packet.
 */
class byte_stream {
public:
	virtual ~byte_stream() = default;

	/// read available bytes to out, sets the amount of bytes read in size
	virtual io_result read(span out, std::size_t& size) = 0;

	/// write all of the data, single call is never interleaved with another write
	virtual io_result write(const_span data) = 0;
};

}

#endif
