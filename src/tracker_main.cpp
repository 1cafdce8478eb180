#include <peer_registry.hpp>
#include <tracker_server.hpp>
#include <utils.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <thread>

using namespace std;

atomic<bool> should_exit(false);

void signal_handler(int)
{
	should_exit = true;
}

static void usage(const char *prog)
{
	cerr << "usage: " << prog << " [--host <addr>] [--port <port>] [--timeout <s>]"
		 << " [--sweep-interval <s>] [--read-timeout <s>]" << endl;
}

int main(int argc, char *argv[])
{
	string host = "0.0.0.0";
	uint16_t port = TRACKER_PORT;
	int timeout = PEER_TIMEOUT;
	int sweep_interval = SWEEP_INTERVAL;
	int read_timeout = READ_TIMEOUT;

	try {
		for (int i = 1; i < argc; i++) {
			if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
				usage(argv[0]);
				return 0;
			}
			if (i + 1 >= argc) {
				usage(argv[0]);
				return 1;
			}

			string flag(argv[i]);
			string value(argv[++i]);
			if (flag == "--host") {
				host = value;
			} else if (flag == "--port") {
				port = parse_port(value);
			} else if (flag == "--timeout") {
				timeout = parse_seconds(value);
			} else if (flag == "--sweep-interval") {
				sweep_interval = parse_seconds(value);
			} else if (flag == "--read-timeout") {
				read_timeout = parse_seconds(value);
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

	signal(SIGINT, signal_handler);
	signal(SIGTERM, signal_handler);

	try {
		PeerRegistry registry(timeout);
		TrackerServer server(registry, host, port, sweep_interval, read_timeout);

		cout << "peer timeout " << timeout << "s, sweep every " << sweep_interval << "s" << endl;
		thread server_thread(&TrackerServer::run, &server);

		while (!should_exit) {
			this_thread::sleep_for(chrono::milliseconds(200));
		}

		cout << "\nshutting down..." << endl;
		server.stop();
		server_thread.join();

	} catch (const exception &e) {
		cerr << "error: " << e.what() << endl;
		return 1;
	}

	return 0;
}
