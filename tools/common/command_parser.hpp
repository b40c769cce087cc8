#ifndef SSHLINK_TOOLS_COMMON_COMMAND_PARSER_HEADER
#define SSHLINK_TOOLS_COMMON_COMMAND_PARSER_HEADER

#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace sshlink {

struct command_base {
	virtual ~command_base() = default;
	virtual void parse(std::vector<std::string> const&) = 0;
	virtual void print(std::ostream&) const = 0;
	// flags do not take value
	virtual bool takes_value() const { return true; }
};

struct command {
	command(std::string n, std::string a, std::string i, bool req, std::unique_ptr<command_base> p)
	: name(std::move(n))
	, alias(std::move(a))
	, info(std::move(i))
	, required(req)
	, extract(std::move(p))
	{}

	std::string name;
	std::string alias;
	std::string info;
	bool required{};
	bool seen{};
	std::unique_ptr<command_base> extract;
};

/** \brief Named command line options
 *
 *  Options are given as "--name value" or "-alias value". Values that start with '-' must be
 *  given as "--name=value".
 */
class command_parser {
public:
	command_parser(bool show_value_in_help = true)
	: show_value_in_help_(show_value_in_help)
	{}

	template<typename T>
	void add(T& var, std::string name, std::string alias, std::string info);

	/// option that must be present, see check_required
	template<typename T>
	void add_required(T& var, std::string name, std::string alias, std::string info);

	template<typename T>
	void add(std::optional<T>& var, std::string name, std::string alias, std::string info);
	void add(bool& var, std::string name, std::string alias, std::string info);

	void parse(int argc, char const* const argv[]);
	void parse(std::vector<std::string> const& args);

	/// throws if some required option was not given
	void check_required() const;

	void print_help(std::ostream&) const;

private:
	template<typename Command, typename T>
	void add_impl(T& var, std::string name, std::string alias, std::string info, bool required = false);
	std::shared_ptr<command> find(std::string const& name) const;

private:
	std::map<std::string, std::shared_ptr<command>> commands_;
	bool const show_value_in_help_;
};

struct invalid_argument : std::runtime_error {
	using std::runtime_error::runtime_error;
};

template<typename T>
struct normal_command : command_base {
	normal_command(T& v)
	: value_(v)
	{}

	void parse(std::vector<std::string> const& args) override {
		if(args.size() != 1) {
			throw invalid_argument("expected exactly one value");
		}
		if constexpr(std::is_same_v<std::string, T>) {
			value_ = args[0];
		} else {
			std::istringstream in(args[0]);
			if(!(in >> value_) || !(in >> std::ws).eof()) {
				throw invalid_argument("failed to interpret argument '" + args[0] + "'");
			}
		}
	}

	void print(std::ostream& o) const override {
		o << value_;
	}

	T& value_;
};

template<typename T>
struct optional_command : command_base {
	optional_command(std::optional<T>& v)
	: value_(v)
	{}

	void parse(std::vector<std::string> const& args) override {
		T temp{};
		normal_command<T>(temp).parse(args);
		value_ = std::move(temp);
	}

	void print(std::ostream& o) const override {
		if(value_) {
			o << *value_;
		}
	}

	std::optional<T>& value_;
};

template<typename Command, typename T>
void command_parser::add_impl(T& var, std::string name, std::string alias, std::string info, bool required) {
	auto p = std::make_shared<command>(name, alias, std::move(info), required, std::make_unique<Command>(var));
	if(!name.empty()) {
		commands_.insert({"--"+name, p});
	}
	if(!alias.empty()) {
		commands_.insert({"-"+alias, p});
	}
}

template<typename T>
void command_parser::add(T& var, std::string name, std::string alias, std::string info) {
	add_impl<normal_command<T>>(var, std::move(name), std::move(alias), std::move(info));
}

template<typename T>
void command_parser::add_required(T& var, std::string name, std::string alias, std::string info) {
	add_impl<normal_command<T>>(var, std::move(name), std::move(alias), std::move(info), true);
}

template<typename T>
void command_parser::add(std::optional<T>& var, std::string name, std::string alias, std::string info) {
	add_impl<optional_command<T>>(var, std::move(name), std::move(alias), std::move(info));
}

}

#endif
