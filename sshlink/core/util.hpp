#ifndef SSHLINK_CORE_UTIL_HEADER
#define SSHLINK_CORE_UTIL_HEADER

#include "sshlink/common/types.hpp"
#include "sshlink/crypto/hash.hpp"

namespace sshlink::ssh {

/// sink for serialised bytes
class binout {
public:
	virtual bool process(const_span data) = 0;
protected:
	~binout() = default;
};

/// feeds everything to a hash, used to calculate the exchange hash without intermediate buffer
struct hash_binout : binout {
	hash_binout(ssh::hash& hash);

	bool process(const_span data) override;

public:
	ssh::hash& hash;
};

}

#endif
