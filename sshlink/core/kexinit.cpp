#include "kexinit.hpp"
#include "supported_algorithms.hpp"
#include "sshlink/common/logger.hpp"

#include <ostream>

namespace sshlink::ssh {

std::string_view to_string(kex_type t) {
	using enum kex_type;
	switch(t) {
		case curve25519_sha256:        return "curve25519-sha256";
		case libssh_curve25519_sha256: return "curve25519-sha256@libssh.org";
		case dh_group14_sha256:        return "diffie-hellman-group14-sha256";
		default: break;
	}
	return "unknown";
}

kex_type from_string(type_tag<kex_type>, std::string_view s) {
	using enum kex_type;
	if(s == "curve25519-sha256") return curve25519_sha256;
	if(s == "curve25519-sha256@libssh.org") return libssh_curve25519_sha256;
	if(s == "diffie-hellman-group14-sha256") return dh_group14_sha256;
	return unknown;
}

std::ostream& operator<<(std::ostream& out, crypto_configuration const& c) {
	return out << "kex=" << to_string(c.kex) << " host_key=" << to_string(c.host_key)
		<< " in={cipher=" << to_string(c.in.cipher) << " compress=" << to_string(c.in.compress)
		<< "} out={cipher=" << to_string(c.out.cipher) << " compress=" << to_string(c.out.compress)
		<< "}";
}

static bool valid_direction(crypto_configuration::type const& t) {
	return is_aead(t.cipher) && t.compress != compress_type::unknown;
}

bool crypto_configuration::valid() const {
	return kex != kex_type::unknown && host_key != key_type::unknown
		&& valid_direction(in) && valid_direction(out);
}

// all supported kex methods only need signature capable host key
static bool is_compatible(kex_type kex, key_type key) {
	return kex != kex_type::unknown && key_format(key) != key_type::unknown;
}

static bool is_supported_kex(kex_type client_kex, supported_algorithms const& client, supported_algorithms const& server, key_type& ktype) {
	if(server.kexes.supports(client_kex)) {
		for(auto&& client_hkey : client.host_keys) {
			if(is_compatible(client_kex, client_hkey) && server.host_keys.supports(client_hkey)) {
				ktype = client_hkey;
				return true;
			}
		}
	}
	return false;
}

template<typename IdType>
static bool find_suitable(algo_list<IdType> const& client, algo_list<IdType> const& server, IdType& res) {
	for(auto&& v : client) {
		if(server.supports(v)) {
			res = v;
			return true;
		}
	}
	return false;
}

kexinit_agreement::kexinit_agreement(logger& logger, transport_side my_side, supported_algorithms const& my)
: logger_(logger)
, my_side_(my_side)
, my_(my)
{}

bool kexinit_agreement::agree(supported_algorithms const& remote) {
	supported_algorithms const& client = my_side_ == transport_side::client ? my_ : remote;
	supported_algorithms const& server = my_side_ == transport_side::client ? remote : my_;

	crypto_configuration res;
	agreed_.reset();
	failed_ = {};

	auto fail = [&](std::string_view category) {
		logger_.log(logger::debug, "SSH failed to find common {} algorithm", category);
		failed_ = category;
		return false;
	};

	for(auto&& ckex : client.kexes) {
		if(is_supported_kex(ckex, client, server, res.host_key)) {
			res.kex = ckex;
			break;
		}
	}

	if(res.kex == kex_type::unknown) {
		return fail("kex/host key");
	}

	// out/in are from the client point of view until the end
	if(!find_suitable(client.client_server_ciphers, server.client_server_ciphers, res.out.cipher)) {
		return fail("client->server cipher");
	}
	if(!find_suitable(client.server_client_ciphers, server.server_client_ciphers, res.in.cipher)) {
		return fail("server->client cipher");
	}

	// every supported cipher is authenticated, the mac lists are only advertised

	if(!find_suitable(client.client_server_compress, server.client_server_compress, res.out.compress)) {
		return fail("client->server compression");
	}
	if(!find_suitable(client.server_client_compress, server.server_client_compress, res.in.compress)) {
		return fail("server->client compression");
	}

	if(my_side_ == transport_side::server) {
		std::swap(res.in, res.out);
	}

	// guess is right if both sides prefer the same kex and host key algorithms
	guess_was_correct_ = !client.kexes.empty() && !server.kexes.empty()
		&& client.kexes.front() == server.kexes.front()
		&& !client.host_keys.empty() && !server.host_keys.empty()
		&& client.host_keys.front() == server.host_keys.front();

	agreed_ = res;
	return true;
}

bool kexinit_agreement::was_guess_correct() const {
	return guess_was_correct_;
}

crypto_configuration kexinit_agreement::agreed_configuration() const {
	SSHLINK_ASSERT(agreed_, "invalid state");
	return *agreed_;
}

}
