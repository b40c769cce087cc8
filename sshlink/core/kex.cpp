#include "kex.hpp"
#include "kex/curve25519_kex.hpp"
#include "kex/diffie_hellman_kex.hpp"

#include <ostream>

namespace sshlink::ssh {

std::string_view to_string(kex_state s) {
	using enum kex_state;
	switch(s) {
		case none:       return "none";
		case inprogress: return "inprogress";
		case succeeded:  return "succeeded";
		case error:      return "error";
	}
	return "unknown";
}

std::ostream& operator<<(std::ostream& out, kex_state s) {
	return out << to_string(s);
}

std::unique_ptr<kex> construct_client_kex(kex_type t, kex_context kex_c) {
	using enum kex_type;
	if(t == curve25519_sha256 || t == libssh_curve25519_sha256) {
		return std::make_unique<curve25519_kex_client>(kex_c, t);
	} else if(t == dh_group14_sha256) {
		return std::make_unique<diffie_hellman_kex_client>(kex_c, t);
	}
	return nullptr;
}

}
