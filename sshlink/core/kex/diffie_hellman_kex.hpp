#ifndef SSHLINK_CORE_KEX_DIFFIE_HELLMAN_HEADER
#define SSHLINK_CORE_KEX_DIFFIE_HELLMAN_HEADER

#include "kex_common.hpp"

namespace sshlink::ssh {

/// diffie-hellman-group14-sha256 (rfc8268)
class diffie_hellman_kex_client : public kex_common {
public:
	diffie_hellman_kex_client(kex_context kex_c, kex_type type);

	kex_state initiate() override;
	kex_state handle(ssh_packet_type type, const_span payload) override;
};

}

#endif
