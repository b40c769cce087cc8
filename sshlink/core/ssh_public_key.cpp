#include "ssh_public_key.hpp"
#include "ssh_binary_util.hpp"

namespace sshlink::ssh {

std::size_t const ecdsa_p256_coordinate_size = 32;

ssh_public_key::ssh_public_key(std::shared_ptr<public_key> pkey, byte_vector blob)
: key_impl_(std::move(pkey))
, blob_(std::move(blob))
{
}

key_type ssh_public_key::type() const {
	return key_impl_ ? key_impl_->type() : key_type::unknown;
}

bool ssh_public_key::valid() const {
	return static_cast<bool>(key_impl_);
}

// r and s come as mpints, the key implementation wants them as fixed size big-endian integers
static byte_vector ecdsa_sig(std::string_view payload) {
	ssh_bf_reader r(to_span(payload));
	std::string_view p1, p2;
	if(!r.read(p1) || !r.read(p2)) {
		return {};
	}

	byte_vector sig(2*ecdsa_p256_coordinate_size);
	std::size_t offset = 0;
	for(auto p : {p1, p2}) {
		auto v = to_umpint(p).data;
		if(v.size() > ecdsa_p256_coordinate_size) {
			return {};
		}
		copy(v, safe_subspan(sig, offset + ecdsa_p256_coordinate_size - v.size(), v.size()));
		offset += ecdsa_p256_coordinate_size;
	}
	return sig;
}

bool ssh_public_key::verify(key_type sig_type, const_span msg, const_span signature) const {
	if(!valid() || key_format(sig_type) != key_format(type())) {
		return false;
	}

	ssh_bf_reader r(signature);
	std::string_view format;
	std::string_view payload;
	if(!r.read(format) || format != to_string(sig_type) || !r.read(payload)) {
		return false;
	}

	if(key_format(sig_type) == key_type::ecdsa_sha2_nistp256) {
		auto sig = ecdsa_sig(payload);
		return !sig.empty() && key_impl_->verify(sig_type, msg, sig);
	}
	return key_impl_->verify(sig_type, msg, to_span(payload));
}

std::string ssh_public_key::fingerprint(crypto_context const& crypto, crypto_call_context const& call) const {
	std::string res;
	if(valid()) {
		auto sha256 = crypto.construct_hash(hash_type::sha2_256, call);
		if(sha256) {
			sha256->process(blob_);
			res = "SHA256:" + encode_base64(sha256->digest());
		}
	}
	return res;
}

static std::shared_ptr<public_key> load_ed25519_public_key(ssh_bf_reader& r, crypto_context const& crypto, crypto_call_context const& call) {
	call.log.log(logger::debug_trace, "Loading ssh ed25519 public key");
	std::string_view pubkey;
	if(r.read(pubkey)) {
		if(pubkey.size() == ed25519_key_size) {
			return crypto.construct_public_key(ed25519_public_key_data{to_span(pubkey)}, call);
		}
		call.log.log(logger::debug_trace, "ssh ed25519 public key size not correct");
	} else {
		call.log.log(logger::debug_trace, "Failed to read ssh ed25519 public key");
	}
	return nullptr;
}

static std::shared_ptr<public_key> load_rsa_public_key(ssh_bf_reader& r, crypto_context const& crypto, crypto_call_context const& call) {
	call.log.log(logger::debug_trace, "Loading ssh rsa public key");
	std::string_view e, n;
	if(r.read(e) && r.read(n)) {
		return crypto.construct_public_key(rsa_public_key_data{to_umpint(e), to_umpint(n)}, call);
	}
	call.log.log(logger::debug_trace, "Failed to read ssh rsa public key");
	return nullptr;
}

static std::shared_ptr<public_key> load_ecdsa_public_key(ssh_bf_reader& r, std::string_view type, crypto_context const& crypto, crypto_call_context const& call) {
	call.log.log(logger::debug_trace, "Loading ssh ecdsa public key");
	std::string_view curve, ecc_point;
	if(r.read(curve) && r.read(ecc_point)) {
		if(curve == to_curve_name(key_type::ecdsa_sha2_nistp256) && type == to_string(key_type::ecdsa_sha2_nistp256)) {
			return crypto.construct_public_key(
				ecdsa_public_key_data{key_type::ecdsa_sha2_nistp256, to_span(ecc_point)}, call);
		}
		call.log.log(logger::debug_trace, "Invalid ecdsa public key [curve={}]", curve);
	} else {
		call.log.log(logger::debug_trace, "Failed to read ssh ecdsa public key");
	}
	return nullptr;
}

ssh_public_key load_ssh_public_key(const_span data, crypto_context const& crypto, crypto_call_context const& call) {
	ssh_bf_reader r(data);
	std::string_view type;
	std::shared_ptr<public_key> key;

	if(r.read(type)) {
		key_type t = from_string(type_tag<key_type>{}, type);
		if(t == key_type::ssh_ed25519) {
			key = load_ed25519_public_key(r, crypto, call);
		} else if(t == key_type::ssh_rsa) {
			key = load_rsa_public_key(r, crypto, call);
		} else if(t == key_type::ecdsa_sha2_nistp256) {
			key = load_ecdsa_public_key(r, type, crypto, call);
		} else {
			call.log.log(logger::debug_trace, "Invalid public key type: {}", type);
		}
	}

	if(!key) {
		return {};
	}
	return ssh_public_key(std::move(key), byte_vector(data.begin(), data.end()));
}

ssh_public_key load_base64_ssh_public_key(std::string_view s, crypto_context const& crypto, crypto_call_context const& call) {
	return load_ssh_public_key(decode_base64(s), crypto, call);
}

}
