#include "logger.hpp"

#include <cstdio>
#include <utility>

namespace sshlink::ssh {

std::string_view to_string(logger::type t) {
	switch(t) {
		case logger::error:         return "error";
		case logger::info:          return "info";
		case logger::debug:         return "debug";
		case logger::debug_verbose: return "verbose";
		case logger::debug_trace:   return "trace";
		default: break;
	}
	return "log";
}

static std::string_view file_name(char const* path) {
	std::string_view s(path);
	auto pos = s.find_last_of('/');
	return pos == std::string_view::npos ? s : s.substr(pos + 1);
}

void stdout_logger::write(type t, std::string const& line, std::source_location const& loc) {
	auto name = file_name(loc.file_name());
	std::lock_guard lock(mutex_);
	std::printf("[%.*s] %.*s:%u %s\n",
		int(to_string(t).size()), to_string(t).data(),
		int(name.size()), name.data(),
		unsigned(loc.line()), line.c_str());
	std::fflush(stdout);
}

session_logger::session_logger(logger& target, std::string tag)
: target_(target)
, tag_(std::move(tag))
{}

void session_logger::write(type t, std::string const& line, std::source_location const& loc) {
	target_.log_line(logger::log_type(t, loc), tag_ + line);
}

}
