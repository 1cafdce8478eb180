#include <chat_client.hpp>
#include <errors.hpp>
#include <boost/algorithm/string.hpp>
#include <chrono>
#include <memory>
#include <sstream>

using namespace std;
using boost::asio::ip::tcp;

ChatClient::ChatClient(const ChatConfig &config)
	: config(config),
	  state(ClientState::Idle),
	  running(false),
	  acceptor(io),
	  listen_port(config.listen_port),
	  tracker(config.tracker_host, config.tracker_port),
	  connections(io, directory, [this](const Message &msg) { deliver(msg); }),
	  active_peers(0)
{
}

ChatClient::~ChatClient()
{
	stop();
}

void ChatClient::start()
{
	ClientState expected = ClientState::Idle;
	if (!state.compare_exchange_strong(expected, ClientState::Registering)) {
		throw logic_error("chat client already started");
	}

	/* Listener first, so the advertised port is the one actually bound */
	try {
		tcp::endpoint endpoint(tcp::v4(), config.listen_port);
		acceptor.open(endpoint.protocol());
		acceptor.set_option(tcp::acceptor::reuse_address(true));
		acceptor.bind(endpoint);
		acceptor.listen(10);
		listen_port = acceptor.local_endpoint().port();
	} catch (const boost::system::system_error &e) {
		state = ClientState::Stopped;
		throw ConnectFailed("cannot listen on port " + to_string(config.listen_port) +
							": " + e.what());
	}

	string ip = config.advertise_ip.empty() ? detect_local_ip() : config.advertise_ip;

	try {
		size_t peer_count = tracker.register_peer(config.peer_id, ip, listen_port);
		cout << "registered with tracker as " << config.peer_id
			 << " (" << ip << ":" << listen_port << ")" << endl;
		cout << "total peers in network: " << peer_count << endl;
	} catch (const exception &e) {
		cerr << "failed to register with tracker: " << e.what() << endl;
		boost::system::error_code ec;
		acceptor.close(ec);
		state = ClientState::Stopped;
		throw;
	}

	running = true;
	state = ClientState::Running;

	listen_thread = thread(&ChatClient::run_listener, this);
	heartbeat_thread = thread(&ChatClient::run_heartbeat, this);

	refresh_peers();
}

void ChatClient::run(istream &in, ostream &out)
{
	start();
	run_cli(in, out);
	stop();
}

void ChatClient::stop()
{
	ClientState expected = ClientState::Running;
	if (!state.compare_exchange_strong(expected, ClientState::Stopping)) {
		return;
	}

	{
		lock_guard<mutex> lock(heartbeat_mutex);
		running = false;
		heartbeat_cv.notify_all();
	}

	try {
		tracker.unregister_peer(config.peer_id);
		cout << "unregistered from tracker" << endl;
	} catch (const exception &e) {
		cerr << "error unregistering: " << e.what() << endl;
	}

	connections.close_all();

	if (listen_thread.joinable()) {
		listen_thread.join();
	}
	boost::system::error_code ec;
	acceptor.close(ec);

	if (heartbeat_thread.joinable()) {
		heartbeat_thread.join();
	}

	{
		unique_lock<mutex> lock(peers_mutex);
		peers_cv.wait(lock, [this] { return active_peers == 0; });
	}

	state = ClientState::Stopped;
	cout << "chat client stopped" << endl;
}

void ChatClient::run_listener()
{
	cout << "listening for P2P connections on port " << listen_port << endl;

	acceptor.non_blocking(true);

	while (running) {
		tcp::socket sock(io);
		boost::system::error_code ec;
		acceptor.accept(sock, ec);
		if (ec == boost::asio::error::would_block) {
			this_thread::sleep_for(chrono::milliseconds(100));
			continue;
		}

		if (ec) {
			if (running) {
				cerr << "socket error in listen loop: " << ec.message() << endl;
			}
			break;
		}

		{
			lock_guard<mutex> lock(peers_mutex);
			active_peers++;
		}
		auto peer = make_shared<tcp::socket>(std::move(sock));
		thread([this, peer]() mutable {
			connections.handle_inbound(std::move(*peer));
			peer.reset();
			lock_guard<mutex> lock(peers_mutex);
			active_peers--;
			peers_cv.notify_all();
		}).detach();
	}

	cout << "listener thread exiting" << endl;
}

void ChatClient::run_heartbeat()
{
	unique_lock<mutex> lock(heartbeat_mutex);

	while (running) {
		heartbeat_cv.wait_for(lock, chrono::seconds(config.heartbeat_interval),
							  [this] { return !running; });
		if (!running) {
			break;
		}

		lock.unlock();
		try {
			tracker.heartbeat(config.peer_id);
		} catch (const exception &e) {
			/* next tick tries again */
			cerr << "error sending heartbeat: " << e.what() << endl;
		}
		lock.lock();
	}
}

void ChatClient::deliver(const Message &msg)
{
	history.append(msg);

	if (msg.type == MessageType::Direct) {
		cout << "\n[" << msg.from << "] Direct message: " << msg.content << endl;
	} else {
		cout << "\n[" << msg.from << "] Broadcast: " << msg.content << endl;
	}
	cout << "> " << flush;
}

size_t ChatClient::refresh_peers()
{
	try {
		vector<PeerInfo> peer_list = tracker.get_peers();
		size_t available = directory.update(peer_list, config.peer_id, config.prune_stale);
		cout << "updated peer list: " << available << " peers available" << endl;
	} catch (const exception &e) {
		cerr << "error updating peer list: " << e.what() << endl;
	}
	return directory.size();
}

bool ChatClient::send_direct(const string &peer_id, const string &text)
{
	Message msg{MessageType::Direct, config.peer_id, text, time(nullptr)};

	shared_ptr<PeerConnection> conn;
	try {
		conn = connections.get_or_connect(peer_id);
	} catch (const PeerUnknown &e) {
		cerr << e.what() << endl;
		return false;
	} catch (const ConnectFailed &e) {
		cerr << e.what() << endl;
		return false;
	}

	try {
		conn->send_message(msg);
	} catch (const Unreachable &e) {
		cerr << e.what() << endl;
		connections.drop(peer_id);
		return false;
	} catch (const exception &e) {
		cerr << "error sending to " << peer_id << ": " << e.what() << endl;
		return false;
	}

	cout << "sent direct message to " << peer_id << endl;
	return true;
}

size_t ChatClient::broadcast(const string &text)
{
	Message msg{MessageType::Broadcast, config.peer_id, text, time(nullptr)};
	size_t sent_count = 0;

	for (const PeerInfo &peer : directory.list()) {
		try {
			connections.get_or_connect(peer.peer_id)->send_message(msg);
			sent_count++;
		} catch (const Unreachable &e) {
			cerr << "error broadcasting to " << peer.peer_id << ": " << e.what() << endl;
			connections.drop(peer.peer_id);
		} catch (const exception &e) {
			cerr << "error broadcasting to " << peer.peer_id << ": " << e.what() << endl;
		}
	}

	cout << "broadcast sent to " << sent_count << " peers" << endl;
	return sent_count;
}

void ChatClient::run_cli(istream &in, ostream &out)
{
	print_help(out);

	string line;
	while (state == ClientState::Running) {
		out << "> " << flush;
		if (!getline(in, line)) {
			out << "\nExiting..." << endl;
			break;
		}

		boost::algorithm::trim(line);
		if (line.empty()) {
			continue;
		}

		try {
			if (!handle_command(line, out)) {
				break;
			}
		} catch (const exception &e) {
			out << "Error: " << e.what() << endl;
		}
	}
}

bool ChatClient::handle_command(const string &line, ostream &out)
{
	istringstream line_stream(line);
	string command;
	line_stream >> command;

	string rest;
	getline(line_stream, rest);
	boost::algorithm::trim(rest);

	if (command == "/msg") {
		istringstream rest_stream(rest);
		string peer_id;
		rest_stream >> peer_id;
		string text;
		getline(rest_stream, text);
		boost::algorithm::trim(text);

		if (peer_id.empty() || text.empty()) {
			out << "Usage: /msg <peer_id> <message>" << endl;
		} else if (!send_direct(peer_id, text)) {
			out << "Could not deliver message to " << peer_id << endl;
		}
	} else if (command == "/broadcast") {
		if (rest.empty()) {
			out << "Usage: /broadcast <message>" << endl;
		} else {
			size_t sent_count = broadcast(rest);
			out << "Broadcast sent to " << sent_count << " peers" << endl;
		}
	} else if (command == "/peers") {
		print_peers(out);
	} else if (command == "/refresh") {
		size_t available = refresh_peers();
		out << available << " peers available" << endl;
	} else if (command == "/history") {
		print_history(out);
	} else if (command == "/help") {
		print_help(out);
	} else if (command == "/quit") {
		out << "Exiting..." << endl;
		return false;
	} else {
		out << "Unknown command. Type /help for available commands" << endl;
	}
	return true;
}

void ChatClient::print_help(ostream &out) const
{
	out << "Chat Commands:\n"
		<< "  /msg <peer_id> <message>  - Send direct message\n"
		<< "  /broadcast <message>      - Broadcast to all peers\n"
		<< "  /peers                    - List available peers\n"
		<< "  /refresh                  - Refresh peer list\n"
		<< "  /history                  - Show message history\n"
		<< "  /help                     - Show this help\n"
		<< "  /quit                     - Exit chat" << endl;
}

void ChatClient::print_peers(ostream &out) const
{
	vector<PeerInfo> peer_list = directory.list();
	if (peer_list.empty()) {
		out << "No peers available" << endl;
		return;
	}

	out << "Available peers:" << endl;
	for (const auto &peer : peer_list) {
		const char *status = connections.is_connected(peer.peer_id) ? "connected" : "available";
		out << "  " << peer.peer_id << " - " << peer.ip << ":" << peer.port
			<< " [" << status << "]" << endl;
	}
}

void ChatClient::print_history(ostream &out) const
{
	vector<Message> messages = history.recent(HISTORY_SHOWN);
	if (messages.empty()) {
		out << "No message history" << endl;
		return;
	}

	out << "Message history:" << endl;
	for (const auto &msg : messages) {
		out << "  " << format_time(msg.time) << " [" << message_type_name(msg.type) << "] "
			<< msg.from << ": " << msg.content << endl;
	}
}

ClientState ChatClient::get_state() const
{
	return state;
}

uint16_t ChatClient::get_listen_port() const
{
	return listen_port;
}

const string &ChatClient::get_peer_id() const
{
	return config.peer_id;
}

const MessageHistory &ChatClient::get_history() const
{
	return history;
}

const PeerDirectory &ChatClient::get_directory() const
{
	return directory;
}

PeerDirectory &ChatClient::get_directory()
{
	return directory;
}

const PeerConnectionManager &ChatClient::get_connections() const
{
	return connections;
}
