#ifndef SSHLINK_CRYPTO_CIPHER_HEADER
#define SSHLINK_CRYPTO_CIPHER_HEADER

#include "sshlink/common/types.hpp"

namespace sshlink::ssh {

/*
	Authenticated packet cipher. Works on whole binary packets, the first 4 bytes
	of the packet being the packet_length field. The sequence number is the
	implicit per-packet nonce.
*/
class cipher {
public:
	cipher(std::size_t bsize, std::size_t tag_size)
	: block_size_(bsize)
	, tag_size_(tag_size)
	{}

	virtual ~cipher() = default;

	/// cipher block size in bytes, packets are padded to multiple of this
	std::size_t block_size() const { return block_size_; }

	/// size of the authentication tag in bytes
	std::size_t tag_size() const { return tag_size_; }

	/// true if the packet_length field is sent encrypted
	virtual bool encrypted_length() const = 0;

	/// decrypt the 4 byte packet_length field to out, without authenticating it
	virtual bool decrypt_length(std::uint32_t seq, const_span in, span out) = 0;

	/// encrypt packet and append tag, out must have room for in.size()+tag_size(). in and out can be the same range.
	virtual bool seal(std::uint32_t seq, const_span in, span out) = 0;

	/// verify tag at the end of in and decrypt the packet to out, returns false if authentication fails
	virtual bool open(std::uint32_t seq, const_span in, span out) = 0;

private:
	std::size_t const block_size_;
	std::size_t const tag_size_;
};

}

#endif
