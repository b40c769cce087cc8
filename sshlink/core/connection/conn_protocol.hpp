#ifndef SSHLINK_CORE_CONNECTION_PROTOCOL_HEADER
#define SSHLINK_CORE_CONNECTION_PROTOCOL_HEADER

#include "sshlink/core/packet_ser.hpp"
#include "sshlink/core/packet_types.hpp"

// connection protocol messages, rfc4254
namespace sshlink::ssh::ser {

// 4, request specific data may follow
using global_request = ssh_packet_ser<ssh_global_request,
	string,    // request name
	boolean>;  // want reply

using request_success = ssh_packet_ser<ssh_request_success>;
using request_failure = ssh_packet_ser<ssh_request_failure>;

// 5.1, channel type specific data may follow open and confirmation
using channel_open = ssh_packet_ser<ssh_channel_open,
	string,    // channel type
	uint32,    // sender channel
	uint32,    // initial window size
	uint32>;   // maximum packet size

using channel_open_confirmation = ssh_packet_ser<ssh_channel_open_confirmation,
	uint32,    // recipient channel
	uint32,    // sender channel
	uint32,    // initial window size
	uint32>;   // maximum packet size

using channel_open_failure = ssh_packet_ser<ssh_channel_open_failure,
	uint32,    // recipient channel
	uint32,    // reason, open_failure_reason
	string,    // description
	string>;   // language tag

enum open_failure_reason : std::uint32_t {
	administratively_prohibited = 1,
	connect_failed              = 2,
	unknown_channel_type        = 3,
	resource_shortage           = 4
};

// 5.2, every channel message starts with the recipient channel
using channel_window_adjust = ssh_packet_ser<ssh_channel_window_adjust, uint32, uint32>;
using channel_data = ssh_packet_ser<ssh_channel_data, uint32, string>;
using channel_extended_data = ssh_packet_ser<ssh_channel_extended_data,
	uint32,
	uint32,    // data type, extended_data_type
	string>;

enum extended_data_type : std::uint32_t {
	extended_data_stderr = 1
};

// 5.3
using channel_eof   = ssh_packet_ser<ssh_channel_eof, uint32>;
using channel_close = ssh_packet_ser<ssh_channel_close, uint32>;

// 5.4, only the common header, type specific data follows
using channel_request = ssh_packet_ser<ssh_channel_request,
	uint32,
	string,    // request type
	boolean>;  // want reply

// 6.2
using channel_pty_request = ssh_packet_ser<ssh_channel_request,
	uint32,
	string,    // "pty-req"
	boolean,
	string,    // TERM value
	uint32,    // columns
	uint32,    // rows
	uint32,    // width in pixels
	uint32,    // height in pixels
	string>;   // encoded terminal modes

// 6.5
using channel_exec_request = ssh_packet_ser<ssh_channel_request,
	uint32,
	string,    // "exec"
	boolean,
	string>;   // command

using channel_success = ssh_packet_ser<ssh_channel_success, uint32>;
using channel_failure = ssh_packet_ser<ssh_channel_failure, uint32>;

}

#endif
