#ifndef SSHLINK_TEST_CONFIGS_HEADER
#define SSHLINK_TEST_CONFIGS_HEADER

#include "crypto.hpp"

#include "sshlink/client/client_config.hpp"

namespace sshlink::ssh::test {

// configurations for the client and the test server to connect

client_config test_client_config();
ssh_config test_server_config();

client_config test_client_aes_gcm_config();
ssh_config test_server_aes_gcm_config();

client_config test_client_dh_kex_config();
ssh_config test_server_dh_kex_config();

}

#endif
