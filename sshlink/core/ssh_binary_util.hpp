#ifndef SSHLINK_CORE_BINARY_UTIL_HEADER
#define SSHLINK_CORE_BINARY_UTIL_HEADER

#include "util.hpp"
#include "sshlink/common/types.hpp"
#include "sshlink/common/util.hpp"
#include "sshlink/crypto/random.hpp"

#include <cstring>
#include <optional>

namespace sshlink::ssh {

/// unsigned mpint with the most significant bit set needs extra zero byte in front
inline bool requires_padding(const_mpint_span s) {
	return !s.data.empty()
		&& s.sign == const_mpint_span::unsigned_t
		&& (std::to_integer<std::uint8_t>(s.data[0]) & 0x80);
}

inline std::size_t encoded_size(const_mpint_span s) {
	const_mpint_span v = to_umpint(s.data);
	v.sign = s.sign;
	return 4 + v.data.size() + (requires_padding(v) ? 1 : 0);
}

/*
	Typed writes of the ssh binary format (rfc4251, section 5). Derived class
	provides put(const_span) that appends the raw bytes.
*/
template<typename Derived>
class ssh_bf_writer_base {
public:
	template<std::unsigned_integral T>
	bool write(T v) {
		std::byte arr[sizeof(T)];
		to_network(v, arr);
		return put(arr);
	}

	bool write(bool v) {
		return write(std::uint8_t{v});
	}

	bool write(std::string_view v) {
		return write(std::uint32_t(v.size())) && put(to_span(v));
	}

	bool write(const_span s) {
		return put(s);
	}

	template<std::size_t S>
	bool write(std::span<std::byte const, S> const& s) {
		return put(const_span(s.data(), s.size()));
	}

	bool write(const_mpint_span mpint) {
		const_mpint_span v = to_umpint(mpint.data);
		v.sign = mpint.sign;
		bool pad = requires_padding(v);

		bool ret = write(std::uint32_t(v.data.size() + (pad ? 1 : 0)));
		if(ret && pad) {
			ret = write(std::uint8_t{0x0});
		}
		return ret && put(v.data);
	}

private:
	bool put(const_span s) {
		return static_cast<Derived&>(*this).put_bytes(s);
	}
};

/// writes to fixed size span, or to byte_vector that is grown as needed
class ssh_bf_writer : public ssh_bf_writer_base<ssh_bf_writer> {
public:
	ssh_bf_writer(span out)
	: out_(out)
	{
	}

	ssh_bf_writer(byte_vector& out, std::size_t pos = 0)
	: buffer_(&out)
	, out_(out)
	, pos_(pos)
	{
	}

	using ssh_bf_writer_base::write;

	std::size_t used_size() const {
		return pos_;
	}

	bool add_random_range(random& gen, std::size_t size) {
		bool ret = reserve(size);
		if(ret) {
			gen.random_bytes(out_.subspan(pos_, size));
			pos_ += size;
		}
		return ret;
	}

	bool jump_over(std::size_t size) {
		bool ret = reserve(size);
		if(ret) {
			pos_ += size;
		}
		return ret;
	}

	bool put_bytes(const_span s) {
		bool ret = reserve(s.size());
		if(ret && !s.empty()) {
			std::memcpy(out_.data()+pos_, s.data(), s.size());
			pos_ += s.size();
		}
		return ret;
	}

private:
	bool reserve(std::size_t s) {
		bool ret = out_.size() - pos_ >= s;
		if(!ret && buffer_) {
			buffer_->resize(pos_+s);
			out_ = span(*buffer_);
			ret = true;
		}
		return ret;
	}

private:
	byte_vector* buffer_{};
	span out_;
	std::size_t pos_{};
};

/// writes to binout, used to feed serialised data to hash functions
class ssh_bf_binout_writer : public ssh_bf_writer_base<ssh_bf_binout_writer> {
public:
	ssh_bf_binout_writer(binout& out)
	: out_(out)
	{}

	using ssh_bf_writer_base::write;

	bool put_bytes(const_span s) {
		return out_.process(s);
	}

private:
	binout& out_;
};

class ssh_bf_reader {
public:
	ssh_bf_reader(const_span in)
	: in_(in)
	{
	}

	std::size_t used_size() const {
		return pos_;
	}

	template<std::unsigned_integral T>
	bool read(T& v) {
		bool ret = left() >= sizeof(T);
		if(ret) {
			v = from_network<T>(in_.data() + pos_);
			pos_ += sizeof(T);
		}
		return ret;
	}

	bool read(bool& v) {
		std::uint8_t b{};
		bool ret = read(b);
		if(ret) {
			v = b != 0;
		}
		return ret;
	}

	bool read(std::string_view& v) {
		std::uint32_t size{};
		bool ret = read(size) && left() >= size;
		if(ret) {
			v = to_string_view(in_.subspan(pos_, size));
			pos_ += size;
		}
		return ret;
	}

	bool read(const_mpint_span& mpint) {
		std::string_view s;
		bool ret = read(s);
		if(ret) {
			if(!s.empty() && (std::uint8_t(s[0]) & 0x80)) {
				mpint = const_mpint_span{to_span(s), const_mpint_span::signed_t};
			} else {
				mpint = to_umpint(s);
			}
		}
		return ret;
	}

	template<std::size_t S>
	bool read(std::optional<std::span<std::byte const, S>>& s) {
		bool ret = left() >= S;
		if(ret) {
			s = std::span<std::byte const, S>(in_.data()+pos_, S);
			pos_ += S;
		}
		return ret;
	}

private:
	std::size_t left() const {
		return in_.size() - pos_;
	}

	const_span in_;
	std::size_t pos_{};
};

}

#endif
