#ifndef SSHLINK_CORE_PROTOCOL_HEADER
#define SSHLINK_CORE_PROTOCOL_HEADER

#include "packet_ser.hpp"
#include "ssh_constants.hpp"

// transport layer messages, rfc4253
namespace sshlink::ssh::ser {

// 11.1
using disconnect = ssh_packet_ser<ssh_disconnect,
	uint32,    // reason code
	string,    // description
	string>;   // language tag

// 11.2
using ignore = ssh_packet_ser<ssh_ignore, string>;

// 11.3
using debug = ssh_packet_ser<ssh_debug,
	boolean,   // always display
	string,    // message
	string>;   // language tag

// 11.4, carries the sequence number of the rejected packet
using unimplemented = ssh_packet_ser<ssh_unimplemented, uint32>;

// 7.1, the name-lists are in the order
//  kex, host key, cipher c->s, cipher s->c, mac c->s, mac s->c,
//  compression c->s, compression s->c, language c->s, language s->c
using kexinit = ssh_packet_ser<ssh_kexinit,
	bytes<cookie_size>,
	name_list, name_list,
	name_list, name_list,
	name_list, name_list,
	name_list, name_list,
	name_list, name_list,
	boolean,   // first kex packet follows
	uint32>;   // reserved, zero

// 7.3
using newkeys = ssh_packet_ser<ssh_newkeys>;

// 10
using service_request = ssh_packet_ser<ssh_service_request, string>;
using service_accept  = ssh_packet_ser<ssh_service_accept, string>;

}

#endif
