#include "random.hpp"

#include "sshlink/common/util.hpp"

#include <sys/random.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <random>

namespace sshlink::ssh {
namespace {

bool os_random(span output) {
	while(!output.empty()) {
		// reads of up to 256 bytes are not interrupted once the urandom pool is initialised
		std::size_t s = std::min<std::size_t>(output.size(), 256);
		ssize_t res = ::getrandom(output.data(), s, 0);
		if(res > 0) {
			output = safe_subspan(output, std::size_t(res));
		} else if(res < 0 && errno != EINTR) {
			return false;
		}
	}
	return true;
}

void gen_random(span output) {
	if(!os_random(output)) {
		// cannot get random, nothing we can do...
		std::fprintf(stderr, "Could not generate random, aborting...\n");
		std::abort();
	}
}

struct rand_adaptor {
	using result_type = std::uint8_t;

	static constexpr result_type min() { return std::numeric_limits<result_type>::min(); }
	static constexpr result_type max() { return std::numeric_limits<result_type>::max(); }

	result_type operator()() {
		std::byte res{};
		gen_random(span{&res, 1});
		return std::to_integer<std::uint8_t>(res);
	}
};

class os_random_source : public random {
public:
	std::size_t random_uint(std::size_t min, std::size_t max) override {
		rand_adaptor ra;
		std::uniform_int_distribution<std::size_t> uidist(min, max);
		return uidist(ra);
	}

	void random_bytes(span output) override {
		gen_random(output);
	}
};

}

std::unique_ptr<random> create_default_random() {
	return std::make_unique<os_random_source>();
}

}
