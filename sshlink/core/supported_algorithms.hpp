#ifndef SSHLINK_CORE_SUPPORTED_ALGORITHMS_HEADER
#define SSHLINK_CORE_SUPPORTED_ALGORITHMS_HEADER

#include "kexinit.hpp"

#include "sshlink/common/algo_list.hpp"
#include "sshlink/crypto/ids.hpp"

namespace sshlink::ssh {

using kex_list = algo_list<kex_type>;
using key_list = algo_list<key_type>;
using cipher_list = algo_list<cipher_type>;
using mac_list = algo_list<mac_type>;
using compress_list = algo_list<compress_type>;

/// Ranked algorithm lists, the first is the most preferred
struct supported_algorithms {
	kex_list kexes;

	// host key (signature) algorithms
	key_list host_keys;

	cipher_list client_server_ciphers;
	cipher_list server_client_ciphers;

	// only advertised, all supported ciphers are authenticated
	mac_list client_server_macs;
	mac_list server_client_macs;

	compress_list client_server_compress{compress_type::none};
	compress_list server_client_compress{compress_type::none};

public:
	bool valid() const;

	void dump(std::string_view tag, logger&) const;
};

/// the default preference order of the client
supported_algorithms default_supported_algorithms();

}

#endif
