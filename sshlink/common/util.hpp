#ifndef SSHLINK_COMMON_UTIL_HEADER
#define SSHLINK_COMMON_UTIL_HEADER

#include "types.hpp"

#include <algorithm>
#include <concepts>
#include <cstring>
#include <string_view>
#include <vector>
#include <iosfwd>

namespace sshlink::ssh {

inline void copy(const_span source, span dest) {
	SSHLINK_ASSERT(dest.size() >= source.size(), "invalid destination span for copy");
	if(!source.empty()) {
		std::memmove(dest.data(), source.data(), source.size());
	}
}

std::string encode_base64(const_span, bool pad = false);
byte_vector decode_base64(std::string_view);

/// big endian (network order) store and load of unsigned integers
template<std::unsigned_integral T>
inline void to_network(T v, std::byte* out) {
	for(std::size_t i = sizeof(T); i > 0; --i) {
		out[i-1] = std::byte(v & 0xff);
		v >>= 8;
	}
}

template<std::unsigned_integral T>
inline T from_network(std::byte const* in) {
	T v{};
	for(std::size_t i = 0; i != sizeof(T); ++i) {
		v = T(v << 8) | std::to_integer<T>(in[i]);
	}
	return v;
}

inline void u32ton(std::uint32_t v, std::byte* out) { to_network(v, out); }
inline void u64ton(std::uint64_t v, std::byte* out) { to_network(v, out); }
inline std::uint32_t ntou32(std::byte const* in) { return from_network<std::uint32_t>(in); }
inline std::uint64_t ntou64(std::byte const* in) { return from_network<std::uint64_t>(in); }

// as per rfc4251 the unsigned mpint can have leading 0 byte, this removes the leading zeroes
inline const_mpint_span to_umpint(const_span mpint) {
	while(!mpint.empty() && mpint[0] == std::byte{0x0}) {
		mpint = mpint.subspan(1);
	}
	return const_mpint_span{mpint};
}

inline const_mpint_span to_umpint(std::string_view mpint) {
	return to_umpint(to_span(mpint));
}

template<class T> concept Byte = std::is_same_v<std::remove_cv_t<T>, std::byte>;

/// std::span doesn't clamp the count to the size-offset which is what we want
template<Byte T>
inline std::span<T> safe_subspan(std::span<T> s, std::size_t offset, std::size_t count = std::dynamic_extent) {
	if(offset >= s.size()) {
		return {};
	}
	if(count != std::dynamic_extent) {
		count = std::min(count, s.size()-offset);
	}
	return s.subspan(offset, count);
}

inline span safe_subspan(byte_vector& s, std::size_t offset, std::size_t count = std::dynamic_extent) {
	return safe_subspan(span(s), offset, count);
}

inline const_span safe_subspan(byte_vector const& s, std::size_t offset, std::size_t count = std::dynamic_extent) {
	return safe_subspan(const_span(s), offset, count);
}

/// constant time comparison, returns true if the spans have same size and content
bool compare_equal(const_span s1, const_span s2);

/// true if all bytes are zero (or the span is empty)
bool is_zero(const_span);

std::ostream& operator<<(std::ostream&, const_span);

bool same_source_or_non_overlapping(const_span s1, const_span s2);

}

#endif
