#include "supported_algorithms.hpp"

#include "sshlink/common/logger.hpp"

namespace sshlink::ssh {

bool supported_algorithms::valid() const {
	return !host_keys.empty()
		&& !kexes.empty()
		&& !client_server_ciphers.empty()
		&& !server_client_ciphers.empty()
		&& !client_server_macs.empty()
		&& !server_client_macs.empty()
		&& !client_server_compress.empty()
		&& !server_client_compress.empty();
}

void supported_algorithms::dump(std::string_view tag, logger& l) const {
	l.log(logger::debug_verbose, "{}: supported_algorithms:\n"
		"\tkexes={}\n"
		"\thost_keys={}\n"
		"\tciphers={} / {}\n"
		"\tmacs={} / {}\n"
		"\tcompress={} / {}",
		tag,
		kexes.name_list_string(), host_keys.name_list_string(),
		client_server_ciphers.name_list_string(), server_client_ciphers.name_list_string(),
		client_server_macs.name_list_string(), server_client_macs.name_list_string(),
		client_server_compress.name_list_string(), server_client_compress.name_list_string());
}

supported_algorithms default_supported_algorithms() {
	supported_algorithms res;

	res.kexes = kex_list{kex_type::curve25519_sha256, kex_type::libssh_curve25519_sha256, kex_type::dh_group14_sha256};
	res.host_keys = key_list{key_type::ssh_ed25519, key_type::ecdsa_sha2_nistp256, key_type::rsa_sha2_512, key_type::rsa_sha2_256};

	cipher_list ciphers{cipher_type::openssh_chacha20_poly1305, cipher_type::openssh_aes_256_gcm};
	res.client_server_ciphers = ciphers;
	res.server_client_ciphers = ciphers;

	res.client_server_macs = mac_list{mac_type::hmac_sha2_256};
	res.server_client_macs = mac_list{mac_type::hmac_sha2_256};

	return res;
}

}
