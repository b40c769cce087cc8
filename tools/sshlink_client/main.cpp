#include "tcp_stream.hpp"

#include "tools/common/command_parser.hpp"

#include "sshlink/client/channel_exec.hpp"
#include "sshlink/client/channel_shell.hpp"
#include "sshlink/client/ssh_session.hpp"

#include <memory>
#include <iostream>
#include <mutex>
#include <thread>

namespace sshlink::ssh {

struct client_commands : command_parser {
	bool help{};
	bool verbose{};
	std::string host;
	std::uint16_t port{22};
	std::string user;
	std::string password;
	std::optional<std::string> exec;

	client_commands()
	: command_parser(false)
	{
		add(help, "help", "", "show help");
		add(verbose, "verbose", "v", "verbose logging");
		add_required(host, "host", "h", "host to connect");
		add(port, "port", "p", "port to connect");
		add_required(user, "user", "u", "username to connect");
		add_required(password, "password", "", "password");
		add(exec, "exec", "e", "run command instead of interactive shell");
	}
};

client_config make_config(client_commands const& cmd) {
	client_config c;
	c.side = transport_side::client;
	c.my_version.software = "sshlink_client_1.0";
	c.username = cmd.user;
	c.password = cmd.password;
	return c;
}

int run_exec(ssh_session& session, std::string const& command) {
	auto exec = session.open_exec();
	if(!exec) {
		std::cerr << "Failed to open channel: " << session.error_message() << "\n";
		return 1;
	}
	if(!exec->send_command(command)) {
		std::cerr << "Command rejected: " << exec->error_message() << "\n";
		return 1;
	}
	auto out = exec->get_output();
	if(!out) {
		std::cerr << "Failed to read output: " << exec->error_message() << "\n";
		return 1;
	}
	std::cout << *out << std::flush;
	std::cerr << exec->error_output() << std::flush;
	return exec->exit_status() ? int(*exec->exit_status()) : 0;
}

int run_shell(ssh_session& session) {
	auto shell = session.open_shell();
	if(!shell) {
		std::cerr << "Failed to open shell: " << session.error_message() << "\n";
		return 1;
	}

	// the reader thread blocks in getline and can outlive this function
	struct stdin_lines {
		std::mutex mutex;
		std::vector<std::string> lines;
		bool done{};
	};
	auto input = std::make_shared<stdin_lines>();

	std::thread([input] {
		std::string line;
		while(std::getline(std::cin, line)) {
			std::lock_guard lock(input->mutex);
			input->lines.push_back(line + "\n");
		}
		std::lock_guard lock(input->mutex);
		input->done = true;
	}).detach();

	while(shell->state() == channel_state::shell_ready) {
		std::vector<std::string> pending;
		bool input_done{};
		{
			std::lock_guard lock(input->mutex);
			pending.swap(input->lines);
			input_done = input->done;
		}
		for(auto const& l : pending) {
			if(!shell->write(l)) {
				std::cerr << "Write failed: " << shell->error_message() << "\n";
				return 1;
			}
		}

		auto data = shell->read();
		if(!data.empty()) {
			std::cout << to_string_view(data) << std::flush;
		} else if(shell->error()) {
			std::cerr << "Read failed: " << shell->error_message() << "\n";
			return 1;
		} else if(input_done && pending.empty()) {
			break;
		} else {
			std::this_thread::sleep_for(10ms);
		}
	}

	shell->close();
	return 0;
}

}

int main(int argc, char* argv[]) {
	using namespace sshlink::ssh;
	try {
		client_commands cmd;
		cmd.parse(argc, argv);
		if(cmd.help) {
			std::cout << "sshlink client\n";
			client_commands().print_help(std::cout);
			return 0;
		}
		cmd.check_required();

		stdout_logger log(cmd.verbose ? logger::log_all : logger::type(logger::error | logger::info));

		asio::io_context io;
		tcp_stream stream(io, log);
		if(!stream.connect(cmd.host, cmd.port)) {
			return 1;
		}

		ssh_session session(make_config(cmd), stream, log);
		if(!session.connect()) {
			std::cerr << "Connect failed (" << to_string(to_error_kind(session.error())) << "): "
				<< session.error_message() << "\n";
			return 1;
		}

		int res = cmd.exec ? run_exec(session, *cmd.exec) : run_shell(session);
		session.close();
		stream.close();
		return res;
	} catch(sshlink::invalid_argument const& e) {
		std::cerr << "Invalid arguments: " << e.what() << "\n";
		client_commands().print_help(std::cerr);
		return 2;
	} catch(std::exception const& e) {
		std::cerr << "Exception: " << e.what() << "\n";
		return 1;
	}
}
