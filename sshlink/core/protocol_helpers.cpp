#include "protocol_helpers.hpp"
#include "ssh_constants.hpp"

namespace sshlink::ssh {

std::string to_version_line(ssh_version const& version) {
	std::string str = "SSH-" + version.ssh + "-" + version.software;
	if(!version.comment.empty()) {
		str += " ";
		str += version.comment;
	}
	return str;
}

// printable US-ASCII without space and minus (std::isprint is locale dependent)
static bool is_valid_version_char(char c) {
	return c >= 0x21 && c <= 0x7e && c != '-';
}

static bool is_valid_version_string(std::string_view str) {
	if(str.empty()) {
		return false;
	}
	for(auto c : str) {
		if(!is_valid_version_char(c)) {
			return false;
		}
	}
	return true;
}

bool is_valid_version(ssh_version const& version) {
	if(!is_valid_version_string(version.ssh)) {
		return false;
	}
	// software version may contain minus signs, only spaces and control chars are not allowed
	if(version.software.empty()) {
		return false;
	}
	for(auto c : version.software) {
		if(c < 0x21 || c > 0x7e) {
			return false;
		}
	}
	for(auto c : version.comment) {
		if(c == '\r' || c == '\n') {
			return false;
		}
	}
	return to_version_line(version).size() + 2 <= maximum_version_line_size;
}

// form: "SSH-2.0-softwareversion comments CR LF"
bool send_version_string(ssh_version const& version, out_buffer& out) {
	return out.write(to_version_line(version) + "\r\n");
}

std::string_view to_string(version_parse_result r) {
	using enum version_parse_result;
	switch(r) {
		case ok:        return "ok";
		case more_data: return "more_data";
		case error:     return "error";
	}
	return "unknown";
}

static version_parse_result parse_ssh_version_substrings(std::string_view str, ssh_version& version) {
	auto hyphen = str.find('-');
	if(hyphen == std::string_view::npos) {
		return version_parse_result::error;
	}

	std::string_view ssh_v = str.substr(0, hyphen);
	if(!is_valid_version_string(ssh_v)) {
		return version_parse_result::error;
	}

	std::string_view rest = str.substr(hyphen+1);
	auto comment_p = rest.find(' ');
	std::string_view soft_v = rest.substr(0, comment_p);

	if(soft_v.empty()) {
		return version_parse_result::error;
	}

	version.ssh = ssh_v;
	version.software = soft_v;
	version.comment.clear();
	if(comment_p != std::string_view::npos) {
		version.comment = rest.substr(comment_p+1);
	}

	return version_parse_result::ok;
}

// some implementations send only LF
static std::string_view strip_cr(std::string_view s) {
	if(!s.empty() && s.back() == '\r') {
		s.remove_suffix(1);
	}
	return s;
}

static version_parse_result parse_line(std::string_view str, ssh_version& version, std::string& line, std::size_t& used) {
	if(str.size() < 4) {
		return std::string_view("SSH-").starts_with(str)
			? version_parse_result::more_data : version_parse_result::error;
	}

	if(!str.starts_with("SSH-")) {
		return version_parse_result::error;
	}

	str = str.substr(0, maximum_version_line_size);

	auto p = str.find('\n');
	if(p == std::string_view::npos) {
		return str.size() == maximum_version_line_size
			? version_parse_result::error : version_parse_result::more_data;
	}

	std::string_view ident = strip_cr(str.substr(0, p));
	auto result = parse_ssh_version_substrings(ident.substr(4), version);
	if(result == version_parse_result::ok) {
		line = ident;
		used = p+1;
	}
	return result;
}

version_parse_result parse_ssh_version(in_buffer& in, bool allow_non_version_lines, ssh_version& version, std::string& line) {
	const_span buf = in.get();
	if(buf.empty()) {
		return version_parse_result::more_data;
	}

	std::string_view str = to_string_view(buf);
	std::size_t skipped = 0;
	version_parse_result result = version_parse_result::more_data;

	if(allow_non_version_lines) {
		while(!str.starts_with("SSH-") && result == version_parse_result::more_data) {
			auto p = str.find('\n');
			if(p == std::string_view::npos) {
				if(str.size() >= maximum_version_line_size) {
					result = version_parse_result::error;
				}
				break;
			}
			str = str.substr(p+1);
			skipped += p+1;
		}
	}

	std::size_t used = 0;
	if(result == version_parse_result::more_data && (!allow_non_version_lines || str.starts_with("SSH-"))) {
		result = parse_line(str, version, line, used);
	}

	// the views point to the buffer, so consume only at the end
	if(result != version_parse_result::error) {
		in.consume(skipped + used);
	}
	return result;
}

bool parse_string_list(std::string_view view, std::vector<std::string_view>& out) {
	while(!view.empty()) {
		auto end = view.find(',');
		out.emplace_back(view.substr(0, end));
		if(end == std::string_view::npos) {
			break;
		}
		view = view.substr(end+1);
	}
	return true;
}

bool to_string_list(std::vector<std::string_view> const& in, std::string& out) {
	bool first = true;
	for(auto&& v : in) {
		if(v.empty() || v.find(',') != std::string_view::npos) {
			return false;
		}
		if(!first) {
			out += ",";
		}
		first = false;
		out += v;
	}
	return true;
}

}
