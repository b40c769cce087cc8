#ifndef SSHLINK_CORE_PACKET_SER_IMPL_HEADER
#define SSHLINK_CORE_PACKET_SER_IMPL_HEADER

#include "packet_ser.hpp"
#include "ssh_binary_util.hpp"
#include "protocol_helpers.hpp"

#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace sshlink::ssh::ser {

inline std::size_t wire_size(bool) { return 1; }
inline std::size_t wire_size(std::uint32_t) { return 4; }
inline std::size_t wire_size(std::string_view s) { return 4 + s.size(); }
inline std::size_t wire_size(const_mpint_span s) { return encoded_size(s); }

// field whose value type the reader and writer handle directly
template<typename Type>
struct field {
	using type = Type;

	type data{};

	field() = default;
	field(type t) : data(t) {}

	std::size_t size() const { return wire_size(data); }

	bool read(ssh_bf_reader& r) { return r.read(data); }
	bool write(ssh_bf_writer& w) const { return w.write(data); }

	type& view() { return data; }
};

struct boolean : field<bool> { using field::field; };
struct uint32 : field<std::uint32_t> { using field::field; };
struct string : field<std::string_view> { using field::field; };
struct mpint : field<const_mpint_span> { using field::field; };

// comma separated list in ssh string, kept encoded for size()
struct name_list {
	using type = name_list_t;

	type value{};
	std::string data{};
	bool error{};

	name_list() = default;
	name_list(type const& t) : error(!to_string_list(t, data)) {}

	std::size_t size() const { return wire_size(std::string_view(data)); }

	bool read(ssh_bf_reader& r) {
		std::string_view in;
		return r.read(in) && parse_string_list(in, value);
	}

	bool write(ssh_bf_writer& w) const {
		return !error && w.write(std::string_view(data));
	}

	type& view() { return value; }
};

template<std::size_t Size>
struct bytes {
	using type = std::span<std::byte const, Size>;

	// constant size span is not default constructible
	std::optional<type> data{};

	bytes() = default;
	bytes(type t) : data(t) {}

	std::size_t size() const { return Size; }

	bool read(ssh_bf_reader& r) { return r.read(data); }

	bool write(ssh_bf_writer& w) const {
		SSHLINK_ASSERT(data, "invalid state");
		return w.write(*data);
	}

	type& view() {
		SSHLINK_ASSERT(data, "invalid state");
		return *data;
	}
};

template<std::uint8_t Type, typename... TypeTags> struct ssh_packet_ser_save;
template<std::uint8_t Type, typename... TypeTags> struct ssh_packet_ser_load;

/*
	Describes packet layout with the message number and the field type tags.

	Saving:
		disconnect::save p(code, description, "");
		p.write(out_span);

	Loading (payload without the message number):
		disconnect::load p(payload);
		if(p) {
			auto& [code, description, lang] = p;
		}
*/
template<std::uint8_t Type, typename... TypeTags>
struct ssh_packet_ser {
	using save = ssh_packet_ser_save<Type, TypeTags...>;
	using load = ssh_packet_ser_load<Type, TypeTags...>;

	using members = std::tuple<TypeTags...>;
	static constexpr std::uint8_t packet_type = Type;
};

struct packet_ser_save_base {};

template<std::uint8_t Type, typename... TypeTags>
struct ssh_packet_ser_save : packet_ser_save_base {
	using members = std::tuple<TypeTags...>;

	template<typename... Args>
	ssh_packet_ser_save(Args&&... args)
	: m_{std::forward<Args>(args)...}
	{
	}

	bool write(ssh_bf_writer& writer) const {
		return writer.write(std::uint8_t(Type))
			&& std::apply([&](auto const&... field) { return (field.write(writer) && ...); }, m_);
	}

	bool write(span out) const {
		ssh_bf_writer writer(out);
		return write(writer);
	}

	/// size of the serialised packet including the message number, use to allocate buffer for the write()
	std::size_t size() const {
		return 1
			+ std::apply([](auto const&... field) { return (field.size() + ... + 0); }, m_);
	}

private:
	members const m_;
};

struct match_type_tag {} constexpr match_type_t;

template<std::uint8_t Type, typename... TypeTags>
struct ssh_packet_ser_load {
	using members = std::tuple<TypeTags...>;

	/// expect the message number to be in front of the given span
	ssh_packet_ser_load(match_type_tag, const_span in_data)
	: reader_(in_data)
	{
		std::uint8_t tag{};
		if(reader_.read(tag) && tag == Type) {
			load_fields();
		}
	}

	/// expect the message number already matched and not to be in the in_data any more
	ssh_packet_ser_load(const_span in_data)
	: reader_(in_data)
	{
		load_fields();
	}

	explicit operator bool() const {
		return result_;
	}

	template<std::size_t Index>
	auto&& get() {
		return std::get<Index>(m_).view();
	}

	/// can be used to extract the type specific data at the end of the packet
	ssh_bf_reader& reader() {
		return reader_;
	}

	/// how much of the input was used by the fields
	std::size_t size() const {
		return size_;
	}

private:
	void load_fields() {
		result_ = std::apply([&](auto&... field) { return (field.read(reader_) && ...); }, m_);
		if(result_) {
			size_ = reader_.used_size();
		}
	}

private:
	members m_;
	ssh_bf_reader reader_;
	bool result_{};
	std::size_t size_{};
};

/// serialise a packet as ssh string, used to nest packets (e.g. channel data)
template<typename Packet>
struct packet_string_adaptor {
	packet_string_adaptor(Packet const& p) : packet_(p) {}

	Packet const& packet_;

	std::size_t size() const {
		return 4 + packet_.size();
	}

	bool write(ssh_bf_writer& w) const {
		return w.write(std::uint32_t(packet_.size())) && packet_.write(w);
	}
};

template<typename>
struct transform_args;

template<std::uint8_t Type, typename... TypeTags>
struct transform_args<ssh_packet_ser<Type, TypeTags...>> {
	template<typename... Args>
	static auto save(Args&&... args) {
		return ssh_packet_ser_save<Type,
			std::conditional_t<
				std::is_base_of_v<packet_ser_save_base, std::decay_t<Args>> && std::is_same_v<TypeTags, string>,
					packet_string_adaptor<std::decay_t<Args>>,
					TypeTags
			>...>
			{
				std::forward<Args>(args)...
			};
	}
};

/// creates save-type that can take another save-type in place of string field
template<typename Packet, typename... Args>
auto make_packet_saver(Args&&... args) {
	return transform_args<Packet>::save(std::forward<Args>(args)...);
}

}

namespace std {
	template<uint8_t Type, typename... Tags>
	struct tuple_size<::sshlink::ssh::ser::ssh_packet_ser_load<Type, Tags...>> {
		static constexpr std::size_t value = sizeof...(Tags);
	};

	template<size_t Index, uint8_t Type, typename... Tags>
	struct tuple_element<Index, ::sshlink::ssh::ser::ssh_packet_ser_load<Type, Tags...>> {
		static_assert(Index < sizeof...(Tags), "Index out of bounds");
		using type = typename std::tuple_element_t<Index, std::tuple<Tags...>>::type;
	};
}

#endif
