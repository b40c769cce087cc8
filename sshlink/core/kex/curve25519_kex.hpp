#ifndef SSHLINK_CORE_KEX_CURVE25519_HEADER
#define SSHLINK_CORE_KEX_CURVE25519_HEADER

#include "kex_common.hpp"

namespace sshlink::ssh {

/// curve25519-sha256 (rfc8731), also used for the curve25519-sha256@libssh.org name
class curve25519_kex_client : public kex_common {
public:
	curve25519_kex_client(kex_context kex_c, kex_type type);

	kex_state initiate() override;
	kex_state handle(ssh_packet_type type, const_span payload) override;
};

}

#endif
