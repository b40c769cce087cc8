#ifndef SSHLINK_COMMON_ALGO_LIST_HEADER
#define SSHLINK_COMMON_ALGO_LIST_HEADER

#include "util.hpp"
#include "types.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace sshlink::ssh {

/// Algorithms in preference order, each at most once
template<typename Type>
class algo_list {
public:
	using algo_type = Type;
	using const_iterator = typename std::vector<algo_type>::const_iterator;

	algo_list() = default;
	algo_list(std::initializer_list<algo_type> list) {
		for(auto t : list) {
			add_back(t);
		}
	}

	void add_back(algo_type t) {
		if(!supports(t)) {
			algos_.push_back(t);
		}
	}

	void remove(algo_type t) {
		std::erase(algos_, t);
	}

	bool supports(algo_type t) const {
		return std::find(algos_.begin(), algos_.end(), t) != algos_.end();
	}

	bool empty() const { return algos_.empty(); }
	std::size_t size() const { return algos_.size(); }

	/// most preferred
	algo_type front() const {
		SSHLINK_ASSERT(!empty(), "empty algorithm list");
		return algos_.front();
	}

	const_iterator begin() const { return algos_.begin(); }
	const_iterator end() const { return algos_.end(); }

	std::vector<std::string_view> name_list() const {
		std::vector<std::string_view> res;
		for(auto t : algos_) {
			res.push_back(to_string(t));
		}
		return res;
	}

	/// comma separated, as in the name-list wire format
	std::string name_list_string() const {
		std::string res;
		for(auto name : name_list()) {
			if(!res.empty()) {
				res += ',';
			}
			res += name;
		}
		return res;
	}

private:
	std::vector<algo_type> algos_;
};

template<typename Tag> struct type_tag {};

// unknown names are skipped, duplicates keep the first position
template<typename Type>
algo_list<Type> algo_list_from_string_list(std::vector<std::string_view> const& list) {
	algo_list<Type> ret;
	for(auto name : list) {
		Type t = from_string(type_tag<Type>{}, name);
		if(t != Type::unknown) {
			ret.add_back(t);
		}
	}
	return ret;
}

}

#endif
