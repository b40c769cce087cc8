#ifndef SSHLINK_COMMON_LOGGER_HEADER
#define SSHLINK_COMMON_LOGGER_HEADER

#include "types.hpp"

#include <mutex>
#include <ostream>
#include <sstream>
#include <source_location>

namespace sshlink::ssh {

namespace detail {
template<typename Arg>
void format_next(std::ostream& out, std::string_view& fmt, Arg const& arg) {
	auto pos = fmt.find("{}");
	if(pos != std::string_view::npos) {
		out << fmt.substr(0, pos) << arg;
		fmt.remove_prefix(pos + 2);
	}
}
}

/// replaces each {} in order with the next argument, surplus arguments are dropped
template<typename... Args>
std::string simple_format(std::string_view fmt, Args const&... args) {
	std::ostringstream out;
	(detail::format_next(out, fmt, args), ...);
	out << fmt;
	return out.str();
}

class logger {
public:
	// bit mask, the level set on the logger selects which types are written
	enum type {
		error         = 0x01,
		info          = 0x02,
		debug         = 0x04,
		debug_verbose = 0x08,
		debug_trace   = 0x10,

		log_none = 0,
		log_all  = error | info | debug | debug_verbose | debug_trace
	};

	logger(type level = log_all)
	: level_(level)
	{}

	virtual ~logger() = default;

	logger(logger const&) = delete;
	logger& operator=(logger const&) = delete;

	// captures the call site together with the type
	struct log_type {
		log_type(logger::type t, std::source_location l = std::source_location::current())
		: type(t)
		, location(l)
		{}

		logger::type type;
		std::source_location location;
	};

	template<typename... Args>
	void log(log_type t, std::string_view fmt, Args const&... args) {
		if(would_log(t.type)) {
			write(t.type, simple_format(fmt, args...), t.location);
		}
	}

	void log_line(log_type t, std::string const& line) {
		if(would_log(t.type)) {
			write(t.type, line, t.location);
		}
	}

	template<typename... Args>
	std::string format(std::string_view fmt, Args const&... args) const {
		return simple_format(fmt, args...);
	}

	bool would_log(type t) const { return (t & level_) != 0; }
	void set_level(type t) { level_ = t; }

protected:
	virtual void write(type, std::string const& line, std::source_location const&) = 0;

private:
	type level_;
};

std::string_view to_string(logger::type);

/// prints "[type] file:line message" to stdout, one line at a time
class stdout_logger : public logger {
public:
	using logger::logger;

protected:
	void write(type, std::string const& line, std::source_location const&) override;

private:
	std::mutex mutex_;
};

/// puts the tag in front of every line and forwards it, e.g. to tell client and server apart
class session_logger : public logger {
public:
	session_logger(logger& target, std::string tag);

protected:
	void write(type, std::string const& line, std::source_location const&) override;

private:
	logger& target_;
	std::string tag_;
};

}

#endif
