#include "sshlink/core/errors.hpp"

#include <catch2/catch.hpp>

namespace sshlink::ssh::test {

TEST_CASE("error kind", "[unit]") {
	CHECK(to_error_kind(ssh_noerror) == error_kind::none);

	CHECK(to_error_kind(sshlink_io_error) == error_kind::io);
	CHECK(to_error_kind(sshlink_connection_closed) == error_kind::io);
	CHECK(to_error_kind(ssh_connection_lost) == error_kind::io);

	CHECK(to_error_kind(sshlink_invalid_packet) == error_kind::framing);

	CHECK(to_error_kind(ssh_mac_error) == error_kind::integrity);
	CHECK(to_error_kind(sshlink_host_signature_error) == error_kind::integrity);

	CHECK(to_error_kind(sshlink_no_common_algorithm) == error_kind::negotiation);
	CHECK(to_error_kind(ssh_protocol_version_not_supported) == error_kind::negotiation);

	CHECK(to_error_kind(sshlink_auth_failed) == error_kind::credential);
	CHECK(to_error_kind(sshlink_user_null) == error_kind::credential);
	CHECK(to_error_kind(sshlink_password_null) == error_kind::credential);

	CHECK(to_error_kind(sshlink_channel_open_failed) == error_kind::channel);
	CHECK(to_error_kind(sshlink_channel_request_failed) == error_kind::channel);

	CHECK(to_error_kind(sshlink_timeout) == error_kind::timeout);

	CHECK(to_error_kind(ssh_protocol_error) == error_kind::protocol);
	CHECK(to_error_kind(sshlink_invalid_state) == error_kind::protocol);
	CHECK(to_error_kind(ssh_error_code(0x1234)) == error_kind::protocol);

	CHECK(to_string(error_kind::negotiation) == "negotiation");
}

TEST_CASE("disconnect reason", "[unit]") {
	CHECK(to_disconnect_reason(ssh_mac_error) == ssh_mac_error);
	CHECK(to_disconnect_reason(ssh_disconnect_by_application) == ssh_disconnect_by_application);
	CHECK(to_disconnect_reason(sshlink_no_common_algorithm) == ssh_key_exchange_failed);
	CHECK(to_disconnect_reason(sshlink_auth_failed) == ssh_no_more_auth_methods_available);
	CHECK(to_disconnect_reason(sshlink_timeout) == ssh_connection_lost);
	CHECK(to_disconnect_reason(sshlink_crypto_error) == ssh_mac_error);
	CHECK(to_disconnect_reason(sshlink_invalid_packet) == ssh_protocol_error);
}

TEST_CASE("error code names", "[unit]") {
	CHECK(to_string(ssh_protocol_error) == "protocol error");
	CHECK(to_string(sshlink_connection_closed) == "connection closed");
}

}
