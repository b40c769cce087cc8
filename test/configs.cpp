#include "configs.hpp"

namespace sshlink::ssh::test {

client_config test_client_config() {
	client_config c;
	c.side = transport_side::client;
	c.my_version.software = "demo_1.0";
	c.algorithms.host_keys = {key_type::ssh_ed25519};
	c.algorithms.kexes = {kex_type::curve25519_sha256};
	c.algorithms.client_server_ciphers = {cipher_type::openssh_chacha20_poly1305};
	c.algorithms.server_client_ciphers = {cipher_type::openssh_chacha20_poly1305};
	c.algorithms.client_server_macs = {mac_type::hmac_sha2_256};
	c.algorithms.server_client_macs = {mac_type::hmac_sha2_256};
	c.username = "test";
	c.password = "secret";
	return c;
}

ssh_config test_server_config() {
	ssh_config c;
	c.side = transport_side::server;
	c.my_version.software = "OpenSSH_8.9";
	c.algorithms.host_keys = {key_type::ssh_ed25519};
	c.algorithms.kexes = {kex_type::curve25519_sha256};
	c.algorithms.client_server_ciphers = {cipher_type::openssh_chacha20_poly1305};
	c.algorithms.server_client_ciphers = {cipher_type::openssh_chacha20_poly1305};
	c.algorithms.client_server_macs = {mac_type::hmac_sha2_256};
	c.algorithms.server_client_macs = {mac_type::hmac_sha2_256};
	return c;
}

client_config test_client_aes_gcm_config() {
	auto c = test_client_config();
	c.algorithms.client_server_ciphers = {cipher_type::openssh_aes_256_gcm};
	c.algorithms.server_client_ciphers = {cipher_type::openssh_aes_256_gcm};
	return c;
}

ssh_config test_server_aes_gcm_config() {
	auto c = test_server_config();
	c.algorithms.client_server_ciphers = {cipher_type::openssh_aes_256_gcm};
	c.algorithms.server_client_ciphers = {cipher_type::openssh_aes_256_gcm};
	return c;
}

client_config test_client_dh_kex_config() {
	auto c = test_client_config();
	c.algorithms.kexes = {kex_type::dh_group14_sha256};
	return c;
}

ssh_config test_server_dh_kex_config() {
	auto c = test_server_config();
	c.algorithms.kexes = {kex_type::dh_group14_sha256};
	return c;
}

}
