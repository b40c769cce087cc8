#include "kex_common.hpp"

namespace sshlink::ssh {

hash_type deduce_hash_type(kex_type t) {
	using enum kex_type;
	switch(t) {
		case dh_group14_sha256: [[fallthrough]];
		case curve25519_sha256: [[fallthrough]];
		case libssh_curve25519_sha256:
			return hash_type::sha2_256;
		case unknown:
			return hash_type::unknown;
	}
	return hash_type::unknown;
}

key_exchange_type deduce_exchange_type(kex_type t) {
	using enum kex_type;
	switch(t) {
		case curve25519_sha256:        return key_exchange_type::X25519;
		case libssh_curve25519_sha256: return key_exchange_type::X25519;
		case dh_group14_sha256:        return key_exchange_type::dh_group14;
		case unknown:                  return key_exchange_type::unknown;
	}
	return key_exchange_type::unknown;
}

kex_common::kex_common(kex_context kex_c, kex_type ktype)
: context_(kex_c)
, kex_type_(ktype)
, hash_type_(deduce_hash_type(ktype))
, exchange_(context_.ccontext().construct_key_exchange(deduce_exchange_type(ktype), context_.call_context()))
{
}

kex_type kex_common::type() const {
	return kex_type_;
}

kex_state kex_common::state() const {
	return state_;
}

kex_state kex_common::set_state(kex_state s) {
	SSHLINK_ASSERT(state_ == kex_state::none || state_ == kex_state::inprogress, "invalid state change");
	context_.logger().log(logger::debug_trace, "SSH kex state [{} -> {}]", state_, s);
	state_ = s;
	return s;
}

void kex_common::set_crypto_configuration(crypto_configuration conf) {
	conf_ = conf;
}

/*
	Initial IV client to server: HASH(K || H || "A" || session_id)
	Initial IV server to client: HASH(K || H || "B" || session_id)
	Encryption key client to server: HASH(K || H || "C" || session_id)
	Encryption key server to client: HASH(K || H || "D" || session_id)
	Integrity key client to server: HASH(K || H || "E" || session_id)
	Integrity key server to client: HASH(K || H || "F" || session_id)
*/
std::unique_ptr<ssh::cipher> kex_common::construct_in_cipher() {
	bool client = context_.config().side == transport_side::client;
	return construct_cipher(cipher_dir::decrypt, conf_.in, client ? "BDF" : "ACE");
}

std::unique_ptr<ssh::cipher> kex_common::construct_out_cipher() {
	bool client = context_.config().side == transport_side::client;
	return construct_cipher(cipher_dir::encrypt, conf_.out, client ? "ACE" : "BDF");
}

std::unique_ptr<ssh::cipher> kex_common::construct_cipher(cipher_dir dir, crypto_configuration::type const& conf, char const* chars) {
	SSHLINK_ASSERT(state_ == kex_state::succeeded, "keys are not derived");
	auto hash = context_.ccontext().construct_hash(hash_type_, context_.call_context());
	if(!hash) {
		return nullptr;
	}

	// the integrity key (chars[2]) is not needed, all supported ciphers are authenticated
	auto iv = derive_crypto_material(*hash, cipher_iv_size(conf.cipher), chars[0]);
	auto key = derive_crypto_material(*hash, cipher_key_size(conf.cipher), chars[1]);

	return context_.ccontext().construct_cipher(conf.cipher, dir, key, iv, context_.call_context());
}

/*
	K1 = HASH(K || H || X || session_id)   (X is e.g., "A")
	K2 = HASH(K || H || K1)
	K3 = HASH(K || H || K1 || K2)
	...
	key = K1 || K2 || K3 || ...
*/
byte_vector kex_common::derive_crypto_material(hash& h, std::size_t size, char type) const {
	if(!size) {
		return {};
	}

	hash_binout hbout(h);
	ssh_bf_binout_writer w(hbout);

	w.write(const_mpint_span{secret_});
	w.write(const_span(exchange_hash_));
	w.write(std::uint8_t(type));
	w.write(session_id_);
	byte_vector res = h.digest();

	while(res.size() < size) {
		w.write(const_mpint_span{secret_});
		w.write(const_span(exchange_hash_));
		w.write(const_span(res));
		auto d = h.digest();
		res.insert(res.end(), d.begin(), d.end());
	}

	res.resize(size);
	return res;
}

void kex_common::set_data(byte_vector exhash, byte_vector secret, byte_vector host_key) {
	exchange_hash_ = std::move(exhash);
	secret_ = std::move(secret);
	server_host_key_ = std::move(host_key);

	// the first exchange hash is the session id for the whole connection
	if(context_.init_data().session_id.empty()) {
		session_id_ = exchange_hash_;
	} else {
		session_id_ = context_.init_data().session_id;
	}
}

const_span kex_common::session_id() const {
	return session_id_;
}

const_span kex_common::exchange_hash() const {
	return exchange_hash_;
}

ssh_public_key kex_common::server_host_key() const {
	return load_ssh_public_key(server_host_key_, context_.ccontext(), context_.call_context());
}

}
