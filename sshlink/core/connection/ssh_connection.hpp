#ifndef SSHLINK_CORE_CONNECTION_HEADER
#define SSHLINK_CORE_CONNECTION_HEADER

#include "channel.hpp"
#include "sshlink/core/service/ssh_service.hpp"

#include <map>
#include <memory>

namespace sshlink::ssh {

class transport_base;

/// Client side of the SSH connection protocol (RFC4254)
class ssh_connection : public ssh_service {
public:
	ssh_connection(transport_base&, channel_config);

	/// initiate open channel, returns nullptr if sending the open packet fails
	channel* open_channel(std::string_view type);

	// find channel
	channel* find_channel(channel_id) const;

	/// forget about channel, the pointer is not valid after this
	void remove_channel(channel_id);

	std::string_view name() const override;
	service_state state() const override;

	bool init() override;
	handler_result process(ssh_packet_type, const_span payload) override;

protected:
	/*
		Global requests
			The request does not contain any identification but the replies must come in order.
			We never send global requests, so all requests from the server are refused.
	*/
	virtual bool on_global_request(std::string_view name, bool reply, const_span extra_data);

	virtual std::unique_ptr<channel> construct_channel(channel_side_info local);

private:
	handler_result handle_open(const_span payload);
	handler_result handle_global_request(const_span payload);

	template<typename Packet, typename Func>
	handler_result to_channel(const_span payload, Func&& f);

	handler_result invalid_packet(ssh_packet_type);

private:
	transport_base& transport_;
	logger& log_;
	channel_config const config_;
	service_state state_{service_state::inprogress};

	std::map<channel_id, std::unique_ptr<channel>> channels_;

	channel_id next_id_{};
};

}

#endif
