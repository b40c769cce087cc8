#ifndef SSHLINK_CORE_KEX_ECDH_HEADER
#define SSHLINK_CORE_KEX_ECDH_HEADER

#include "sshlink/core/packet_ser.hpp"

namespace sshlink::ssh {

// curve25519-sha256 reuses the ecdh message numbers (rfc8731)
enum ecdh_packet_type : std::uint8_t {
	ssh_kex_ecdh_init = 30,
	ssh_kex_ecdh_reply = 31
};

namespace ser {

/*
	byte     SSH_MSG_KEX_ECDH_INIT
	string   Q_C, client's ephemeral public key octet string
*/
using kex_ecdh_init = ssh_packet_ser
<
	ssh_kex_ecdh_init,
	string
>;

/*
	byte     SSH_MSG_KEX_ECDH_REPLY
	string   K_S, server's public host key
	string   Q_S, server's ephemeral public key octet string
	string   the signature on the exchange hash
*/
using kex_ecdh_reply = ssh_packet_ser
<
	ssh_kex_ecdh_reply,
	string,
	string,
	string
>;

}
}

#endif
