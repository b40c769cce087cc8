#include "command_parser.hpp"

#include <iomanip>

namespace sshlink {

namespace {

struct bool_command : command_base {
	bool_command(bool& v)
	: value_(v)
	{}

	void parse(std::vector<std::string> const& args) override {
		if(!args.empty()) {
			throw invalid_argument("flag does not take value");
		}
		value_ = true;
	}

	void print(std::ostream& o) const override {
		o << (value_ ? "true" : "false");
	}

	bool takes_value() const override { return false; }

	bool& value_;
};

}

void command_parser::add(bool& var, std::string name, std::string alias, std::string info) {
	add_impl<bool_command>(var, std::move(name), std::move(alias), std::move(info));
}

std::shared_ptr<command> command_parser::find(std::string const& name) const {
	auto it = commands_.find(name);
	if(it == commands_.end()) {
		throw invalid_argument("no parameter named '" + name + "'");
	}
	return it->second;
}

void command_parser::parse(int argc, char const* const argv[]) {
	std::vector<std::string> args;
	for(int i = 1; i < argc; ++i) {
		args.emplace_back(argv[i]);
	}
	parse(args);
}

void command_parser::parse(std::vector<std::string> const& args) {
	for(std::size_t i = 0; i != args.size(); ++i) {
		std::string const& arg = args[i];
		if(arg.empty() || arg[0] != '-') {
			throw invalid_argument("unexpected argument '" + arg + "'");
		}

		std::vector<std::string> values;
		std::string name = arg;
		auto eq = arg.find('=');
		if(eq != std::string::npos) {
			name = arg.substr(0, eq);
			values.push_back(arg.substr(eq+1));
		}

		auto cmd = find(name);
		if(cmd->extract->takes_value() && values.empty()) {
			if(i+1 == args.size() || (!args[i+1].empty() && args[i+1][0] == '-')) {
				throw invalid_argument("missing value for '" + name + "'");
			}
			values.push_back(args[++i]);
		}

		try {
			cmd->extract->parse(values);
		} catch(invalid_argument const& e) {
			throw invalid_argument(name + ": " + e.what());
		}
		cmd->seen = true;
	}
}

void command_parser::check_required() const {
	for(auto&& [key, cmd] : commands_) {
		if(cmd->required && !cmd->seen) {
			throw invalid_argument("missing required parameter '--" + cmd->name + "'");
		}
	}
}

void command_parser::print_help(std::ostream& out) const {
	for(auto&& [key, cmd] : commands_) {
		if(key.substr(0, 2) != "--") {
			continue;
		}
		std::string names = key;
		if(!cmd->alias.empty()) {
			names += ", -" + cmd->alias;
		}
		out << "  " << std::left << std::setw(24) << names << " " << cmd->info;
		if(cmd->required) {
			out << " [required]";
		}
		if(show_value_in_help_) {
			std::ostringstream value;
			cmd->extract->print(value);
			if(!value.str().empty()) {
				out << " (" << value.str() << ")";
			}
		}
		out << "\n";
	}
}

}
