#include <tracker_server.hpp>
#include <errors.hpp>
#include <array>
#include <chrono>
#include <iostream>
#include <memory>

using namespace std;
using boost::asio::ip::tcp;
using json = nlohmann::json;

static json error_reply(const string &message)
{
	return json{{"status", "error"}, {"message", message}};
}

TrackerServer::TrackerServer(PeerRegistry &registry, const string &host, uint16_t port,
							 int sweep_interval, int read_timeout)
	: acceptor(io),
	  registry(registry),
	  sweep_interval(sweep_interval),
	  read_timeout(read_timeout),
	  running(true),
	  active_clients(0)
{
	tcp::endpoint endpoint(boost::asio::ip::make_address(host), port);
	acceptor.open(endpoint.protocol());
	acceptor.set_option(tcp::acceptor::reuse_address(true));
	acceptor.bind(endpoint);
	acceptor.listen(50);
}

TrackerServer::~TrackerServer()
{
	stop();
	if (sweep_thread.joinable()) {
		sweep_thread.join();
	}
}

uint16_t TrackerServer::get_port() const
{
	return acceptor.local_endpoint().port();
}

void TrackerServer::run()
{
	cout << "tracker listening on " << acceptor.local_endpoint() << endl;

	sweep_thread = thread(&TrackerServer::run_sweeper, this);
	acceptor.non_blocking(true);

	while (running) {
		tcp::socket socket(io);
		boost::system::error_code ec;
		acceptor.accept(socket, ec);
		if (ec == boost::asio::error::would_block) {
			this_thread::sleep_for(chrono::milliseconds(100));
			continue;
		}

		if (ec) {
			if (running) {
				cerr << "accept error: " << ec.message() << endl;
			}
			continue;
		}

		cout << "client connected: " << socket.remote_endpoint(ec) << endl;

		{
			lock_guard<mutex> lock(clients_mutex);
			active_clients++;
		}
		auto client = make_shared<tcp::socket>(std::move(socket));
		thread([this, client]() mutable {
			handle_client(*client);
			client.reset();
			lock_guard<mutex> lock(clients_mutex);
			active_clients--;
			clients_cv.notify_all();
		}).detach();
	}

	if (sweep_thread.joinable()) {
		sweep_thread.join();
	}

	unique_lock<mutex> lock(clients_mutex);
	clients_cv.wait(lock, [this] { return active_clients == 0; });

	boost::system::error_code ec;
	acceptor.close(ec);
	cout << "tracker stopped" << endl;
}

void TrackerServer::stop()
{
	lock_guard<mutex> lock(sweep_mutex);
	running = false;
	sweep_cv.notify_all();
}

void TrackerServer::run_sweeper()
{
	unique_lock<mutex> lock(sweep_mutex);

	while (running) {
		sweep_cv.wait_for(lock, chrono::seconds(sweep_interval), [this] { return !running; });
		if (!running) {
			break;
		}

		lock.unlock();
		vector<string> evicted = registry.sweep();
		for (const auto &peer_id : evicted) {
			cout << "removing inactive peer: " << peer_id << endl;
		}
		if (!evicted.empty()) {
			cout << "total active peers: " << registry.size() << endl;
		}
		lock.lock();
	}
}

/*
 * One exchange per connection: a single read bounded by read_timeout,
 * one reply, close.
 */
void TrackerServer::handle_client(tcp::socket &socket)
{
	json response;

	try {
		if (!wait_readable(socket.native_handle(), seconds_to_ms(read_timeout))) {
			cerr << "client sent nothing within " << read_timeout << "s, closing" << endl;
			boost::system::error_code ec;
			socket.close(ec);
			return;
		}

		array<char, MAX_COMMAND_SIZE> buffer;
		boost::system::error_code ec;
		size_t len = socket.read_some(boost::asio::buffer(buffer), ec);
		if (ec == boost::asio::error::eof || len == 0) {
			socket.close(ec);
			return;
		}
		if (ec) {
			throw boost::system::system_error(ec);
		}

		string line = first_line(string(buffer.data(), len));
		cout << "received: " << line << endl;
		response = handle_command(line);

	} catch (const exception &e) {
		cerr << "exception handling client: " << e.what() << endl;
		response = error_reply("Internal server error");
	}

	send_response(socket, response);

	boost::system::error_code ec;
	socket.shutdown(tcp::socket::shutdown_both, ec);
	socket.close(ec);
}

void TrackerServer::send_response(tcp::socket &socket, const json &response)
{
	/* peer ids and ips in a reply are client bytes, never trust them to be UTF-8 */
	string body = response.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";

	boost::system::error_code ec;
	boost::asio::write(socket, boost::asio::buffer(body), ec);
	if (ec) {
		cerr << "error sending response: " << ec.message() << endl;
	}
}

json TrackerServer::handle_command(const string &line)
{
	TrackerCommand cmd = parse_tracker_command(line);
	if (cmd.name.empty()) {
		return error_reply("Empty command");
	}

	try {
		if (cmd.name == "REGISTER") {
			return handle_register(cmd);
		} else if (cmd.name == "GET_PEERS") {
			return handle_get_peers(cmd);
		} else if (cmd.name == "UNREGISTER") {
			return handle_unregister(cmd);
		} else if (cmd.name == "HEARTBEAT") {
			return handle_heartbeat(cmd);
		}
	} catch (const ProtocolError &e) {
		cerr << "bad " << cmd.name << " command: " << e.what() << endl;
		return error_reply(e.what());
	} catch (const NotFound &e) {
		return error_reply(e.what());
	}

	return error_reply("Unknown command");
}

/* REGISTER <peer_id> <ip> <port> */
json TrackerServer::handle_register(const TrackerCommand &cmd)
{
	if (cmd.args.size() != 3) {
		throw ProtocolError("Invalid format. Use: REGISTER <peer_id> <ip> <port>");
	}

	for (const auto &arg : cmd.args) {
		if (!is_valid_utf8(arg)) {
			throw ProtocolError("Invalid format. Arguments must be UTF-8 text");
		}
	}

	const string &peer_id = cmd.args[0];
	const string &ip = cmd.args[1];
	uint16_t port;
	try {
		port = parse_port(cmd.args[2]);
	} catch (const invalid_argument &e) {
		throw ProtocolError(e.what());
	}

	size_t peer_count = registry.register_peer(peer_id, ip, port);

	cout << "registered peer: " << peer_id << " (" << ip << ":" << port << ")" << endl;
	cout << "total active peers: " << peer_count << endl;

	return json{
		{"status", "success"},
		{"message", "Peer registered successfully"},
		{"peer_count", peer_count}
	};
}

json TrackerServer::handle_get_peers(const TrackerCommand &)
{
	vector<PeerRecord> snapshot = registry.list();

	json peers = json::array();
	for (const auto &peer : snapshot) {
		peers.push_back({
			{"peer_id", peer.peer_id},
			{"ip", peer.ip},
			{"port", peer.port}
		});
	}

	cout << "sending peer list (" << snapshot.size() << " peers)" << endl;

	return json{
		{"status", "success"},
		{"peers", peers},
		{"peer_count", snapshot.size()}
	};
}

/* UNREGISTER <peer_id> */
json TrackerServer::handle_unregister(const TrackerCommand &cmd)
{
	if (cmd.args.size() != 1) {
		throw ProtocolError("Invalid format. Use: UNREGISTER <peer_id>");
	}

	registry.unregister_peer(cmd.args[0]);

	cout << "unregistered peer: " << cmd.args[0] << endl;
	cout << "total active peers: " << registry.size() << endl;

	return json{
		{"status", "success"},
		{"message", "Peer unregistered successfully"}
	};
}

/* HEARTBEAT <peer_id> */
json TrackerServer::handle_heartbeat(const TrackerCommand &cmd)
{
	if (cmd.args.size() != 1) {
		throw ProtocolError("Invalid format. Use: HEARTBEAT <peer_id>");
	}

	registry.heartbeat(cmd.args[0]);

	return json{
		{"status", "success"},
		{"message", "Heartbeat received"}
	};
}
