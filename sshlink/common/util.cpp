#include "util.hpp"

#include <nettle/memops.h>

#include <functional>
#include <ostream>
#include <iomanip>

namespace sshlink::ssh {

char const encoding[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
char const pad_char = '=';

static std::uint8_t char_to_value(char c) {
	if(c == '+') return 0x3e;
	if(c == '/') return 0x3f;
	if(c >= '0' && c <= '9') return 0x34 + (c - '0');
	if(c >= 'A' && c <= 'Z') return c - 'A';
	if(c >= 'a' && c <= 'z') return 0x1a + (c - 'a');
	return 0xFF; // invalid
}

byte_vector decode_base64(std::string_view s) {
	byte_vector res;
	res.reserve((s.size() / 4) * 3);

	while(!s.empty() && s.back() == pad_char) {
		s.remove_suffix(1);
	}

	// handle four characters at the time, 4 chars make 24 bits
	for(std::size_t i = 0; i < s.size(); i += 4) {
		auto left = s.size() - i;
		if(left == 1) {
			return {};
		}

		std::uint8_t n1 = char_to_value(s[i]);
		std::uint8_t n2 = char_to_value(s[i+1]);
		if(n1 == 0xFF || n2 == 0xFF) {
			return {};
		}
		res.push_back(std::byte((n1 << 2) | ((n2 & 0x30) >> 4)));

		if(left > 2) {
			std::uint8_t n3 = char_to_value(s[i+2]);
			if(n3 == 0xFF) {
				return {};
			}
			res.push_back(std::byte(((n2 & 0x0f) << 4) | ((n3 & 0x3c) >> 2)));

			if(left > 3) {
				std::uint8_t n4 = char_to_value(s[i+3]);
				if(n4 == 0xFF) {
					return {};
				}
				res.push_back(std::byte(((n3 & 0x03) << 6) | n4));
			}
		}
	}

	return res;
}

std::string encode_base64(const_span s, bool pad) {
	std::string res;
	res.reserve(((s.size()+2)/3)*4);

	for(std::size_t i = 0; i < s.size(); i += 3) {
		auto left = s.size() - i;
		std::uint8_t b1 = std::to_integer<std::uint8_t>(s[i]);
		std::uint8_t b2 = left > 1 ? std::to_integer<std::uint8_t>(s[i+1]) : 0;
		std::uint8_t b3 = left > 2 ? std::to_integer<std::uint8_t>(s[i+2]) : 0;

		res += encoding[b1 >> 2];
		res += encoding[((b1 & 0x03) << 4) | (b2 >> 4)];
		if(left > 1) {
			res += encoding[((b2 & 0x0f) << 2) | (b3 >> 6)];
		} else if(pad) {
			res += pad_char;
		}
		if(left > 2) {
			res += encoding[b3 & 0x3f];
		} else if(pad) {
			res += pad_char;
		}
	}

	return res;
}

bool compare_equal(const_span s1, const_span s2) {
	return s1.size() == s2.size()
		&& (s1.empty() || nettle_memeql_sec(s1.data(), s2.data(), s1.size()) == 1);
}

bool is_zero(const_span s) {
	std::uint8_t acc{};
	for(auto b : s) {
		acc |= std::to_integer<std::uint8_t>(b);
	}
	return acc == 0;
}

std::ostream& operator<<(std::ostream& out, const_span s) {
	auto flags = out.flags();
	bool first = true;
	for(auto v : s) {
		if(!first) {
			out << " ";
		}
		out << std::hex << std::setw(2) << std::setfill('0') << std::to_integer<int>(v);
		first = false;
	}
	out.flags(flags);
	return out;
}

bool same_source_or_non_overlapping(const_span s1, const_span s2) {
	return s1.data() == s2.data() ||
		!std::less<>()(s2.data(), s1.data()+s1.size()) ||
		!std::less<>()(s1.data(), s2.data()+s2.size());
}

}
