#include <chat_client.hpp>
#include <utils.hpp>
#include <csignal>
#include <cstring>
#include <iostream>

using namespace std;

/*
 * No SA_RESTART: Ctrl+C interrupts the blocking read on stdin, the
 * command loop sees end of input and the client stops cleanly.
 */
static void signal_handler(int)
{
}

static void install_signal_handlers()
{
	struct sigaction sa;
	memset(&sa, 0, sizeof(sa));
	sa.sa_handler = signal_handler;
	sigemptyset(&sa.sa_mask);
	sa.sa_flags = 0;
	sigaction(SIGINT, &sa, nullptr);
	sigaction(SIGTERM, &sa, nullptr);
}

static void usage(const char *prog)
{
	cerr << "usage: " << prog << " <peer_id> [--port <port>] [--tracker-host <host>]"
		 << " [--tracker-port <port>] [--advertise-ip <ip>]"
		 << " [--heartbeat-interval <s>] [--prune-stale]" << endl;
}

int main(int argc, char *argv[])
{
	if (argc < 2 || argv[1][0] == '-') {
		usage(argv[0]);
		return 1;
	}

	ChatConfig config;
	config.peer_id = argv[1];

	try {
		for (int i = 2; i < argc; i++) {
			string flag(argv[i]);
			if (flag == "--prune-stale") {
				config.prune_stale = true;
				continue;
			}
			if (i + 1 >= argc) {
				usage(argv[0]);
				return 1;
			}

			string value(argv[++i]);
			if (flag == "--port") {
				config.listen_port = parse_port(value);
			} else if (flag == "--tracker-host") {
				config.tracker_host = value;
			} else if (flag == "--tracker-port") {
				config.tracker_port = parse_port(value);
			} else if (flag == "--advertise-ip") {
				config.advertise_ip = value;
			} else if (flag == "--heartbeat-interval") {
				config.heartbeat_interval = parse_seconds(value);
			} else {
				cerr << "unknown option " << flag << endl;
				usage(argv[0]);
				return 1;
			}
		}
	} catch (const invalid_argument &e) {
		cerr << "error: " << e.what() << endl;
		usage(argv[0]);
		return 1;
	}

	install_signal_handlers();

	cout << "Peer ID: " << config.peer_id << endl;
	cout << "Tracker: " << config.tracker_host << ":" << config.tracker_port << endl;

	try {
		ChatClient client(config);
		client.run(cin, cout);
	} catch (const exception &e) {
		cerr << "error: " << e.what() << endl;
		return 1;
	}

	return 0;
}
