#ifndef SSHLINK_TEST_LOG_HEADER
#define SSHLINK_TEST_LOG_HEADER

#include "sshlink/common/logger.hpp"

namespace sshlink::ssh::test {

// logging is off unless --show-ssh-log is given
stdout_logger& test_log();

}

#endif
