#ifndef SSHLINK_CORE_CONFIG_HEADER
#define SSHLINK_CORE_CONFIG_HEADER

#include "supported_algorithms.hpp"

#include <chrono>

namespace sshlink::ssh {

using namespace std::literals;

/** \brief SSH Version 2 transport configuration
 */
struct ssh_config {
	transport_side side{transport_side::client};

	// software name and version
	ssh_version my_version{.ssh="2.0", .software="sshlink_1.0"};

	// supported algorithms in preference order
	supported_algorithms algorithms{default_supported_algorithms()};

	// re-key interval in bytes (== 0 means no rekeying). When combined transported bytes (in and out) reaches this value, start re-keying
	std::uint64_t rekey_data_interval{1024ULL*1024*1024};

	// re-key interval in time (zero means no rekeying based on time)
	std::chrono::steady_clock::duration rekey_time_interval{1h};

	// add random size of padding for each packet
	bool random_packet_padding{true};

	// maximum output buffer size (should be at least max_out_packet_size)
	std::uint32_t max_out_buffer_size{128*1024};

	// the maximum size for incoming packet
	std::uint32_t max_in_packet_size{64*1024};

	// the maximum size for outgoing packet
	std::uint32_t max_out_packet_size{64*1024};

	// send initial guess of kex before receiving remote side kex-init packet
	bool guess_kex_packet{false};

	// skip lines before the "SSH-" version line (servers may send banner lines)
	bool allow_non_version_lines{true};

public:
	// simple check that we have at least one of each algorithm type and sane sizes
	bool valid() const;
};

}

#endif
