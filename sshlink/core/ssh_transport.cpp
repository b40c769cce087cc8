#include "kex.hpp"
#include "ssh_transport.hpp"
#include "protocol_helpers.hpp"
#include "protocol.hpp"
#include "packet_ser_impl.hpp"
#include "supported_algorithms.hpp"

#include <ostream>

namespace sshlink::ssh {

std::string_view to_string(transport_op op) {
	using enum transport_op;
	switch(op) {
		case want_read_more:  return "want_read_more";
		case want_write_more: return "want_write_more";
		case pending_action:  return "pending_action";
		case disconnected:    return "disconnected";
	}
	return "unknown";
}

std::ostream& operator<<(std::ostream& out, transport_op op) {
	return out << to_string(op);
}

ssh_transport::ssh_transport(ssh_config const& c, logger& l, out_buffer& out, crypto_context cc)
: ssh_binary_packet(c, l)
, crypto_(std::move(cc))
, output_(out)
, rand_(crypto_.construct_random ? crypto_.construct_random() : nullptr)
{
	if(rand_) {
		set_random(*rand_);
	} else {
		logger_.log(logger::error, "SSH Unable to create random generator, double check your set-up");
		set_state(ssh_state::disconnected, sshlink_invalid_setup);
	}
}

ssh_transport::~ssh_transport()
{
}

void ssh_transport::on_version_exchange(ssh_version const& v) {
	logger_.log(logger::info, "SSH version exchange [remote ssh={}, remote software={}]", v.ssh, v.software);

	if(v.ssh != "2.0") {
		logger_.log(logger::error, "SSH invalid remote version [{} != 2.0]", v.ssh);
		set_error_and_disconnect(ssh_protocol_version_not_supported);
	}
}

ssh_state ssh_transport::state() const {
	return state_;
}

void ssh_transport::set_state(ssh_state s, std::optional<ssh_error_code> err) {
	if(err) {
		set_error(*err);
	}
	if(state_ == s) {
		return;
	}

	logger_.log(logger::debug, "SSH state change [{} -> {}]", state_, s);
	ssh_state old = state_;
	state_ = s;

	on_state_change(old, state_);
}

void ssh_transport::disconnect(std::uint32_t code, std::string_view message) {
	logger_.log(logger::debug, "SSH disconnect [state={}, code={}, msg={}]", state(), code, message);

	if(state() != ssh_state::none && state() != ssh_state::disconnected) {
		// best effort, we are going down anyway
		if(!send_packet<ser::disconnect>(code, message, std::string_view())) {
			logger_.log(logger::debug, "SSH failed to send disconnect packet");
		}
	}
	set_state(ssh_state::disconnected);
}

void ssh_transport::send_ignore(std::size_t size) {
	logger_.log(logger::debug, "SSH send_ignore [state={}, size={}]", state(), size);

	if(state() != ssh_state::none && state() != ssh_state::disconnected) {
		byte_vector data;
		data.resize(size);
		rand_->random_bytes(data);
		send_packet<ser::ignore>(to_string_view(data));
	}
}

void ssh_transport::set_error(ssh_error_code code, std::string_view message) {
	ssh_binary_packet::set_error(code, message);
}

void ssh_transport::set_error_and_disconnect(ssh_error_code code, std::string_view message) {
	// keep the first error, it is the cause
	if(error_ == ssh_noerror) {
		set_error(code, message);
	}
	logger_.log(logger::error, "SSH error [code={}, msg={}]", to_string(error_), error_msg_);
	disconnect(to_disconnect_reason(error_), error_msg_);
}

void ssh_transport::handle_version_exchange(in_buffer& in) {
	logger_.log(logger::debug_trace, "SSH handle_version_exchange [state={}]", state());
	if(state() == ssh_state::none) {
		if(!is_valid_version(config_.my_version)) {
			logger_.log(logger::error, "SSH invalid local version information");
			set_state(ssh_state::disconnected, sshlink_invalid_setup);
			return;
		}
		if(!send_version_string(config_.my_version, output_)) {
			set_state(ssh_state::disconnected, sshlink_memory_error);
			return;
		}
		kex_data_.local_ver = to_version_line(config_.my_version);
		set_state(ssh_state::version_exchange);
	}

	if(state() == ssh_state::version_exchange && !remote_version_received_) {
		auto res = parse_ssh_version(in, config_.allow_non_version_lines, remote_version_, kex_data_.remote_ver);
		if(res == version_parse_result::ok) {
			remote_version_received_ = true;
			logger_.log(logger::debug, "SSH remote identification [{}]", kex_data_.remote_ver);
			on_version_exchange(remote_version_);
			if(error_ == ssh_noerror) {
				start_kex();
			}
		} else if(res == version_parse_result::error) {
			set_error(ssh_protocol_error, "failed to parse protocol version information");
			set_state(ssh_state::disconnected);
		} else {
			logger_.log(logger::debug_trace, "SSH parse_ssh_version requires more data [in_buffer.size={}]", in.get().size());
		}
	}
}

handler_result ssh_transport::handle_binary_packet(in_buffer& in) {
	auto data = in.get();
	auto& current = stream_in_.current_packet;

	if(current.status == in_packet_status::waiting_header) {
		if(!try_decode_header(data) && error_ != ssh_noerror) {
			set_error_and_disconnect(error_);
			return handler_result::handled;
		}
	}

	if(current.status == in_packet_status::waiting_data && current.packet_size <= data.size()) {
		if(decrypt_packet(data).empty()) {
			// authentication or framing failure is never recovered from
			set_error_and_disconnect(error_ ? error_ : sshlink_invalid_packet);
			return handler_result::handled;
		}
	}

	handler_result res = handler_result::handled;
	if(current.status == in_packet_status::data_ready) {
		res = process_transport_payload(current.payload);
		if(res != handler_result::pending) {
			in.consume(current.packet_size);
			current.clear();
		}
	}
	return res;
}

void ssh_transport::start_kex() {
	set_state(ssh_state::kex);
	if(!kexinit_sent_ && !send_kex_init(config_.guess_kex_packet)) {
		logger_.log(logger::error, "SSH key exchange failed, aborting...");
		set_error_and_disconnect(ssh_key_exchange_failed);
	}
}

bool ssh_transport::start_rekey() {
	if(state() != ssh_state::transport) {
		logger_.log(logger::debug, "SSH cannot start rekey [state={}]", state());
		return false;
	}
	logger_.log(logger::info, "SSH starting key re-exchange");
	start_kex();
	return state() != ssh_state::disconnected;
}

bool ssh_transport::do_rekeying() {
	if(state() != ssh_state::transport) {
		return false;
	}

	bool time_passed = config_.rekey_time_interval.count() && rekey_time_ <= std::chrono::steady_clock::now();
	bool data_reached = config_.rekey_data_interval
		&& stream_in_.transferred_bytes + stream_out_.transferred_bytes >= config_.rekey_data_interval;

	if(time_passed) {
		logger_.log(logger::debug, "SSH rekey time interval passed");
	}
	if(data_reached) {
		logger_.log(logger::debug, "SSH rekey data interval reached [in={}, out={}, limit={}]"
			, stream_in_.transferred_bytes, stream_out_.transferred_bytes, config_.rekey_data_interval);
	}

	if(time_passed || data_reached) {
		start_kex();
		return true;
	}
	return false;
}

transport_op ssh_transport::process(in_buffer& in) {
	if(state() == ssh_state::transport) {
		// buffered output may have blocked the upper layer from writing
		flush_service_ = flush_service_ || has_pending_out();
	}
	// we try to write even in case of disconnect (maybe we want to send disconnect packet)
	if(!send_pending(output_)) {
		return transport_op::want_write_more;
	}

	if(state() == ssh_state::disconnected) {
		return transport_op::disconnected;
	}

	if(state() == ssh_state::none || state() == ssh_state::version_exchange) {
		handle_version_exchange(in);
	} else {
		if(do_rekeying() && state() == ssh_state::disconnected) {
			return transport_op::disconnected;
		}

		if(handle_binary_packet(in) == handler_result::pending && state() != ssh_state::disconnected) {
			logger_.log(logger::debug_trace, "SSH action pending");
			return transport_op::pending_action;
		}

		if(flush_service_ && state() == ssh_state::transport) {
			flush_service_ = flush();
		}
	}

	if(has_pending_out()) {
		return transport_op::want_write_more;
	}

	if(state() == ssh_state::disconnected) {
		return transport_op::disconnected;
	}

	return transport_op::want_read_more;
}

handler_result ssh_transport::do_handle_transport_packet(ssh_packet_type type, const_span payload) {
	handler_result result = handle_transport_packet(type, payload.subspan(1));
	if(result == handler_result::unknown && state() != ssh_state::disconnected) {
		logger_.log(logger::debug, "SSH Unknown packet type, sending unimplemented packet [type={}]", type);
		send_packet<ser::unimplemented>(stream_in_.current_packet.sequence);
	}
	return result;
}

handler_result ssh_transport::process_transport_payload(span payload) {
	SSHLINK_ASSERT(payload.size() >= 1, "invalid payload size");
	ssh_packet_type type = ssh_packet_type(std::to_integer<std::uint8_t>(payload[0]));
	logger_.log(logger::debug, "SSH process_transport_payload [state={}, type={}, seq={}]", state(), type, stream_in_.current_packet.sequence);

	// these are handled in all states
	if(handle_basic_packets(type, payload.subspan(1))) {
		return handler_result::handled;
	}

	if(state() == ssh_state::transport && type == ssh_kexinit) {
		// key re-exchange started by the remote side
		start_kex();
	}

	if(state() == ssh_state::kex) {
		// give whole payload as the kexinit is saved for the exchange hash
		if(handle_raw_kex_packet(type, payload)) {
			return handler_result::handled;
		}
		if(state() == ssh_state::disconnected) {
			return handler_result::handled;
		}
		if(session_id_.empty()) {
			logger_.log(logger::error, "SSH Received non-kex packet during initial kex [type={}]", type);
			set_error_and_disconnect(ssh_protocol_error, "unexpected packet during key exchange");
			return handler_result::handled;
		}
		// during re-exchange the other packets are handled as normal
		return do_handle_transport_packet(type, payload);
	}

	if(state() == ssh_state::transport) {
		return do_handle_transport_packet(type, payload);
	}

	logger_.log(logger::debug, "SSH packet in invalid state [state={}, type={}]", state(), type);
	set_error_and_disconnect(ssh_protocol_error);
	return handler_result::handled;
}

bool ssh_transport::handle_basic_packets(ssh_packet_type type, const_span payload) {
	auto malformed = [&] {
		set_error_and_disconnect(ssh_protocol_error, logger_.format("invalid {} packet", type));
		return true;
	};

	switch(type) {
		case ssh_disconnect: {
			ser::disconnect::load packet(payload);
			if(!packet) {
				// the remote is going away anyway
				set_state(ssh_state::disconnected, ssh_protocol_error);
				return true;
			}
			auto& [code, desc, lang] = packet;
			set_error(ssh_error_code(code), desc.empty() ? to_string(ssh_error_code(code)) : desc);
			logger_.log(logger::info, "SSH Disconnect from remote [code={}, msg={}]", code, error_msg_);
			set_state(ssh_state::disconnected);
			return true;
		}
		case ssh_ignore:
			if(!ser::ignore::load(payload)) {
				return malformed();
			}
			logger_.log(logger::debug_trace, "SSH ignore packet received [size={}]", payload.size());
			return true;
		case ssh_unimplemented: {
			ser::unimplemented::load packet(payload);
			if(!packet) {
				return malformed();
			}
			logger_.log(logger::info, "SSH remote did not implement our packet [seq={}]", packet.get<0>());
			return true;
		}
		case ssh_debug: {
			ser::debug::load packet(payload);
			if(!packet) {
				return malformed();
			}
			auto& [always_display, message, lang] = packet;
			logger_.log(always_display ? logger::info : logger::debug, "SSH debug message from remote [{}]", message);
			return true;
		}
		default:
			return false;
	}
}

bool ssh_transport::send_kex_init(bool send_first_packet) {
	logger_.log(logger::debug_trace, "SSH send_kex_init [send guess={}]", send_first_packet);
	SSHLINK_ASSERT(!kex_, "invalid state");

	if(!config_.algorithms.valid()) {
		logger_.log(logger::error, "SSH Invalid algorithm configuration, aborting...");
		set_error(sshlink_invalid_setup);
		return false;
	}

	kex_cookie_.resize(cookie_size);
	rand_->random_bytes(kex_cookie_);

	auto const& algs = config_.algorithms;
	ser::kexinit::save packet(
		std::span<std::byte const, cookie_size>(kex_cookie_),
		algs.kexes.name_list(),
		algs.host_keys.name_list(),
		algs.client_server_ciphers.name_list(),
		algs.server_client_ciphers.name_list(),
		algs.client_server_macs.name_list(),
		algs.server_client_macs.name_list(),
		algs.client_server_compress.name_list(),
		algs.server_client_compress.name_list(),
		std::vector<std::string_view>(), //languages client to server
		std::vector<std::string_view>(), //languages server to client
		send_first_packet,
		0   // reserved for future use
		);

	kex_data_.local_kexinit.clear();
	ssh_bf_writer w(kex_data_.local_kexinit);
	if(!packet.write(w) || !send_payload(kex_data_.local_kexinit)) {
		return false;
	}
	kexinit_sent_ = true;

	if(send_first_packet) {
		logger_.log(logger::debug_trace, "SSH sending kex guess [type={}]", to_string(algs.kexes.front()));
		if(!create_kex(algs.kexes.front())) {
			return false;
		}
	}

	return true;
}

kex_context ssh_transport::kex_ctx() {
	return kex_context{*this, kex_data_};
}

std::unique_ptr<kex> ssh_transport::construct_kex(kex_type t) {
	if(config_.side == transport_side::client) {
		return construct_client_kex(t, kex_ctx());
	}
	return nullptr;
}

bool ssh_transport::create_kex(kex_type t) {
	kex_ = construct_kex(t);
	if(!kex_) {
		logger_.log(logger::error, "SSH Failed to construct kex [type={}]", to_string(t));
		set_error(ssh_key_exchange_failed, "unsupported key exchange");
		return false;
	}
	if(kex_->initiate() == kex_state::error) {
		set_error(kex_->error(), kex_->error_message());
		return false;
	}
	return true;
}

void ssh_transport::kex_set_done() {
	if(local_kex_done_ && remote_kex_done_) {
		kex_.reset();
		kexinit_sent_ = false;
		kexinit_received_ = false;
		ignore_next_kex_packet_ = false;
		local_kex_done_ = false;
		remote_kex_done_ = false;
		++kex_count_;

		rekey_time_ = std::chrono::steady_clock::now() + config_.rekey_time_interval;
		logger_.log(logger::info, "SSH key exchange done [count={}]", kex_count_);
		set_state(ssh_state::transport);
		send_deferred_packets();
	}
}

void ssh_transport::send_deferred_packets() {
	auto packets = std::move(deferred_packets_);
	deferred_packets_.clear();
	for(auto&& p : packets) {
		if(state() != ssh_state::transport || !send_payload(p)) {
			break;
		}
	}
}

/*
	New keys are taken in use for the first packet after each side's own NEWKEYS:
	output right after we have sent ours, input after we have received the remote's.
*/
handler_result ssh_transport::handle_kex_done(kex const& k) {
	logger_.log(logger::debug_trace, "SSH kex succeeded");

	exchange_hash_.assign(k.exchange_hash().begin(), k.exchange_hash().end());
	host_key_ = k.server_host_key();

	auto out_cipher = kex_->construct_out_cipher();
	if(!out_cipher) {
		set_error_and_disconnect(sshlink_crypto_error, "Failed to construct output cipher");
		return handler_result::handled;
	}

	if(!send_packet<ser::newkeys>()) {
		set_error_and_disconnect(ssh_key_exchange_failed, "Failed to send newkeys packet");
		return handler_result::handled;
	}

	set_output_crypto(std::move(out_cipher));
	local_kex_done_ = true;
	kex_set_done();

	return handler_result::handled;
}

bool ssh_transport::handle_remote_newkeys() {
	logger_.log(logger::debug_trace, "SSH kex remote newkeys");

	if(!kex_ || kex_->state() != kex_state::succeeded) {
		set_error_and_disconnect(ssh_protocol_error, "Unexpected newkeys packet");
		return true;
	}

	auto in_cipher = kex_->construct_in_cipher();
	if(!in_cipher) {
		set_error_and_disconnect(sshlink_crypto_error, "Failed to construct input cipher");
		return true;
	}

	set_input_crypto(std::move(in_cipher));
	remote_kex_done_ = true;

	// the session id is set only by the first key exchange
	if(session_id_.empty()) {
		auto s = kex_->session_id();
		session_id_.assign(s.begin(), s.end());
		kex_data_.session_id = session_id_;
	}
	kex_set_done();

	return true;
}

bool ssh_transport::handle_raw_kex_packet(ssh_packet_type type, const_span payload) {
	logger_.log(logger::debug_trace, "SSH handle_raw_kex_packet [type={}]", type);

	if(!is_kex_packet(type)) {
		return false;
	}

	if(!kexinit_received_) {
		if(type != ssh_kexinit) {
			set_error_and_disconnect(ssh_protocol_error, "Received kex packet before kexinit");
			return true;
		}
		handle_kexinit_packet(payload);
		return true;
	}

	if(ignore_next_kex_packet_) {
		ignore_next_kex_packet_ = false;
		logger_.log(logger::debug, "SSH ignoring wrongly guessed kex packet [type={}]", type);
		return true;
	}

	if(type == ssh_newkeys) {
		return handle_remote_newkeys();
	}
	return handle_kex_packet(type, payload);
}

bool ssh_transport::handle_kex_packet(ssh_packet_type type, const_span payload) {
	if(!kex_) {
		set_error_and_disconnect(ssh_protocol_error, "Kex packet without active key exchange");
		return true;
	}

	if(kex_->state() != kex_state::inprogress) {
		set_error_and_disconnect(ssh_protocol_error, "Unexpected kex packet");
		return true;
	}

	kex_state state = kex_->handle(type, payload);
	if(state == kex_state::error) {
		set_error_and_disconnect(kex_->error(), kex_->error_message());
	} else if(state == kex_state::succeeded) {
		handle_kex_done(*kex_);
	}
	return true;
}

bool ssh_transport::handle_kexinit_packet(const_span payload) {
	logger_.log(logger::debug_trace, "SSH handle_kexinit_packet");

	ser::kexinit::load packet(ser::match_type_t, payload);
	if(!packet) {
		set_error_and_disconnect(ssh_protocol_error, "Invalid kexinit packet from remote");
		return false;
	}

	// field 0 is the cookie, then the name-lists in kexinit order
	auto& [cookie, kexes, host_keys, ciphers_cs, ciphers_sc, macs_cs, macs_sc,
		compress_cs, compress_sc, lang_cs, lang_sc, sent_first_packet, reserved] = packet;

	logger_.log(logger::debug_trace, "SSH remote kexinit [kexes={}, host keys={}]", kexes.size(), host_keys.size());

	supported_algorithms remote_algs;
	remote_algs.kexes = algo_list_from_string_list<kex_type>(kexes);
	remote_algs.host_keys = algo_list_from_string_list<key_type>(host_keys);
	remote_algs.client_server_ciphers = algo_list_from_string_list<cipher_type>(ciphers_cs);
	remote_algs.server_client_ciphers = algo_list_from_string_list<cipher_type>(ciphers_sc);
	remote_algs.client_server_macs = algo_list_from_string_list<mac_type>(macs_cs);
	remote_algs.server_client_macs = algo_list_from_string_list<mac_type>(macs_sc);
	remote_algs.client_server_compress = algo_list_from_string_list<compress_type>(compress_cs);
	remote_algs.server_client_compress = algo_list_from_string_list<compress_type>(compress_sc);

	remote_algs.dump("remote", logger_);

	kexinit_agreement kagree(logger_, config_.side, config_.algorithms);
	if(!kagree.agree(remote_algs)) {
		config_.algorithms.dump("local", logger_);
		set_error_and_disconnect(sshlink_no_common_algorithm,
			logger_.format("No common algorithm [category={}]", kagree.failed_category()));
		return false;
	}

	crypto_conf_ = kagree.agreed_configuration();
	logger_.log(logger::debug, "SSH kexinit agreed on configuration [{}, sent_first_packet={}]", crypto_conf_, sent_first_packet);

	if(!kagree.was_guess_correct()) {
		// the remote's guessed packet is for wrong method, and our guess (if any) is useless
		ignore_next_kex_packet_ = sent_first_packet;
		kex_.reset();
	}

	// the remote kexinit is needed for exchange hash
	kex_data_.remote_kexinit = byte_vector{payload.begin(), payload.end()};
	kexinit_received_ = true;

	if(!kex_ && !create_kex(crypto_conf_.kex)) {
		set_error_and_disconnect(error_ ? error_ : ssh_key_exchange_failed);
		return false;
	}
	kex_->set_crypto_configuration(crypto_conf_);
	return true;
}

const_span ssh_transport::session_id() const {
	return session_id_;
}

std::optional<out_packet_record> ssh_transport::alloc_out_packet(std::size_t data_size) {
	return ssh_binary_packet::alloc_out_packet(data_size, output_);
}

bool ssh_transport::write_alloced_out_packet(out_packet_record const& r) {
	// only transport layer packets are allowed between our KEXINIT and NEWKEYS (rfc4253 section 7.1)
	if(state() == ssh_state::kex && !session_id_.empty() && !r.data.empty()) {
		auto type = ssh_packet_type(std::to_integer<std::uint8_t>(r.data[0]));
		if(type >= ssh_userauth_request) {
			logger_.log(logger::debug_trace, "SSH deferring packet until key exchange is done [type={}]", type);
			deferred_packets_.emplace_back(r.data.begin(), r.data.end());
			return true;
		}
	}
	return ssh_binary_packet::create_out_packet(r, output_);
}

std::uint32_t ssh_transport::max_in_packet_size() {
	// the remote may use random padding, so assume the maximum
	return std::uint32_t(config_.max_in_packet_size - packet_header_size - maximum_padding_size - stream_in_.tag_size);
}

std::uint32_t ssh_transport::max_out_packet_size() {
	std::size_t max_padding = config_.random_packet_padding ? maximum_padding_size : 2*stream_out_.block_size;
	return std::uint32_t(config_.max_out_packet_size - packet_header_size - max_padding - stream_out_.tag_size);
}

}
