#ifndef SSHLINK_CORE_PACKET_SER_HEADER
#define SSHLINK_CORE_PACKET_SER_HEADER

#include "packet_types.hpp"

#include <string_view>
#include <vector>

namespace sshlink::ssh::ser {

// type tags for packet serialisation (rfc4251 section 5)
struct boolean;
struct uint32;
struct mpint;
struct string;
struct name_list;
using name_list_t = std::vector<std::string_view>;

template<std::size_t size>
struct bytes;

template<std::uint8_t PacketType, typename... TypeTags>
struct ssh_packet_ser;

template<typename Packet, typename... Args>
bool serialise_to_vector(std::vector<std::byte>& out, Args&&... args) {
	typename Packet::save packet(std::forward<Args>(args)...);
	out.resize(packet.size());
	return packet.write(out);
}

}

#endif
