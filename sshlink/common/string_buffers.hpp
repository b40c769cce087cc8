#ifndef SSHLINK_COMMON_STRING_BUFFERS_HEADER
#define SSHLINK_COMMON_STRING_BUFFERS_HEADER

#include "buffers.hpp"

namespace sshlink::ssh {

class string_in_buffer : public in_buffer {
public:
	string_in_buffer(std::string s = {}) : data(std::move(s)) {}

	span get() override {
		return span{reinterpret_cast<std::byte*>(data.data()), data.size()};
	}

	void consume(std::size_t size) override {
		SSHLINK_ASSERT(size <= data.size(), "consuming more than available");
		data.erase(0, size);
	}

	void add(std::string_view s) {
		data.append(s);
	}

	void add(const_span s) {
		add(to_string_view(s));
	}

	std::size_t size() const {
		return data.size();
	}

	bool empty() const {
		return data.empty();
	}

	std::string data;
};


class string_out_buffer : public out_buffer {
public:
	string_out_buffer(std::size_t max_size = -1)
	: maximum_size(max_size)
	{}

	span get(std::size_t size) override {
		if(data.size() - used < size) {
			if(used+size > maximum_size) {
				return span();
			}
			data.resize(used + size);
		}
		return span{reinterpret_cast<std::byte*>(data.data()+used), data.size()-used};
	}

	void commit(std::size_t size) override {
		SSHLINK_ASSERT(size <= data.size()-used, "committing more than reserved");
		used += size;
	}

	std::size_t max_size() const override { return maximum_size; }

	bool empty() const {
		return used == 0;
	}

	/// committed bytes that have not been extracted yet
	const_span committed() const {
		return const_span{reinterpret_cast<std::byte const*>(data.data()), used};
	}

	std::string extract_committed() {
		auto s = data.substr(0, used);
		data.erase(0, used);
		used = 0;
		return s;
	}

	std::size_t const maximum_size;
	std::string data;
	std::size_t used{};
};

}

#endif
