#ifndef SSHLINK_CORE_KEX_DH_HEADER
#define SSHLINK_CORE_KEX_DH_HEADER

#include "sshlink/core/packet_ser.hpp"

namespace sshlink::ssh {

enum dh_packet_type : std::uint8_t {
	ssh_kexdh_init = 30,
	ssh_kexdh_reply = 31
};

namespace ser {

/*
	byte      SSH_MSG_KEXDH_INIT
	mpint     e = g^x mod p
*/
using kexdh_init = ssh_packet_ser
<
	ssh_kexdh_init,
	mpint
>;

/*
	byte      SSH_MSG_KEXDH_REPLY
	string    server public host key and certificates (K_S)
	mpint     f = g^y mod p
	string    signature of H
*/
using kexdh_reply = ssh_packet_ser
<
	ssh_kexdh_reply,
	string,
	mpint,
	string
>;

}
}

#endif
