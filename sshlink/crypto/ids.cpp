#include "ids.hpp"

#include <initializer_list>
#include <utility>

namespace sshlink::ssh {

namespace {

template<typename T>
using name_table = std::initializer_list<std::pair<T, std::string_view>>;

name_table<cipher_type> const cipher_names{
	{cipher_type::openssh_chacha20_poly1305, "chacha20-poly1305@openssh.com"},
	{cipher_type::openssh_aes_256_gcm,       "aes256-gcm@openssh.com"}};

name_table<mac_type> const mac_names{
	{mac_type::hmac_sha2_256, "hmac-sha2-256"}};

name_table<compress_type> const compress_names{
	{compress_type::none, "none"}};

name_table<key_type> const key_names{
	{key_type::ssh_rsa,             "ssh-rsa"},
	{key_type::ssh_ed25519,         "ssh-ed25519"},
	{key_type::ecdsa_sha2_nistp256, "ecdsa-sha2-nistp256"},
	{key_type::rsa_sha2_256,        "rsa-sha2-256"},
	{key_type::rsa_sha2_512,        "rsa-sha2-512"}};

name_table<key_exchange_type> const key_exchange_names{
	{key_exchange_type::X25519,     "X25519"},
	{key_exchange_type::dh_group14, "dh_group14"}};

name_table<hash_type> const hash_names{
	{hash_type::sha2_256, "sha2-256"},
	{hash_type::sha2_512, "sha2-512"}};

template<typename T>
std::string_view name_of(name_table<T> const& table, T t) {
	for(auto&& [v, name] : table) {
		if(v == t) return name;
	}
	return "unknown";
}

template<typename T>
T value_of(name_table<T> const& table, std::string_view s) {
	for(auto&& [v, name] : table) {
		if(name == s) return v;
	}
	return T::unknown;
}

}

std::string_view to_string(cipher_type t) { return name_of(cipher_names, t); }
cipher_type from_string(type_tag<cipher_type>, std::string_view s) { return value_of(cipher_names, s); }

std::string_view to_string(mac_type t) { return name_of(mac_names, t); }
mac_type from_string(type_tag<mac_type>, std::string_view s) { return value_of(mac_names, s); }

std::string_view to_string(compress_type t) { return name_of(compress_names, t); }
compress_type from_string(type_tag<compress_type>, std::string_view s) { return value_of(compress_names, s); }

std::string_view to_string(key_type t) { return name_of(key_names, t); }
key_type from_string(type_tag<key_type>, std::string_view s) { return value_of(key_names, s); }

std::string_view to_string(key_exchange_type t) { return name_of(key_exchange_names, t); }
std::string_view to_string(hash_type t) { return name_of(hash_names, t); }

// chacha20-poly1305 takes two 256 bit keys, the nonce is the sequence number
std::size_t cipher_key_size(cipher_type t) {
	switch(t) {
		case cipher_type::openssh_chacha20_poly1305: return 64;
		case cipher_type::openssh_aes_256_gcm: return 32;
		default: return 0;
	}
}

std::size_t cipher_iv_size(cipher_type t) {
	return t == cipher_type::openssh_aes_256_gcm ? 12 : 0;
}

bool is_aead(cipher_type t) {
	return t != cipher_type::unknown;
}

std::string_view to_curve_name(key_type t) {
	return t == key_type::ecdsa_sha2_nistp256 ? "nistp256" : "";
}

key_type key_format(key_type t) {
	return t == key_type::rsa_sha2_256 || t == key_type::rsa_sha2_512 ? key_type::ssh_rsa : t;
}

}
