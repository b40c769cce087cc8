#ifndef SSHLINK_CORE_PROTOCOL_HELPERS_HEADER
#define SSHLINK_CORE_PROTOCOL_HELPERS_HEADER

#include "sshlink/common/types.hpp"
#include "sshlink/common/buffers.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sshlink::ssh {

/// version line without the CR LF: "SSH-protoversion-softwareversion SP comments"
std::string to_version_line(ssh_version const& version);

/// check that the version has valid characters and fits in one line
bool is_valid_version(ssh_version const& version);

bool send_version_string(ssh_version const& version, out_buffer&);

enum class version_parse_result {
	ok,
	more_data,
	error
};

std::string_view to_string(version_parse_result);

/*
	Parse the remote identification line from the input buffer. Lines not starting with "SSH-"
	are skipped if allow_non_version_lines is set. On success the identification line (without CR LF)
	is stored to line and consumed from the buffer.
*/
version_parse_result parse_ssh_version(in_buffer&, bool allow_non_version_lines, ssh_version& version, std::string& line);

bool parse_string_list(std::string_view, std::vector<std::string_view>& out);
bool to_string_list(std::vector<std::string_view> const& in, std::string& out);

}

#endif
