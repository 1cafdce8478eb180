#ifndef CHAT_CLIENT_HPP
#define CHAT_CLIENT_HPP

#include <boost/asio.hpp>
#include <atomic>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <message.hpp>
#include <peer_connection_manager.hpp>
#include <peer_directory.hpp>
#include <tracker_client.hpp>
#include <utils.hpp>

#define HEARTBEAT_INTERVAL 60
#define HISTORY_SHOWN 20

struct ChatConfig {
	std::string peer_id;
	uint16_t listen_port = P2P_PORT;
	std::string tracker_host = "127.0.0.1";
	uint16_t tracker_port = TRACKER_PORT;
	std::string advertise_ip;	/* empty: detect_local_ip() */
	int heartbeat_interval = HEARTBEAT_INTERVAL;
	bool prune_stale = false;
};

enum class ClientState {
	Idle,
	Registering,
	Running,
	Stopping,
	Stopped
};

class ChatClient {
private:
	ChatConfig config;
	std::atomic<ClientState> state;
	std::atomic<bool> running;

	/* Connection */
	boost::asio::io_context io;
	boost::asio::ip::tcp::acceptor acceptor;
	uint16_t listen_port;

	TrackerClient tracker;
	PeerDirectory directory;
	MessageHistory history;
	PeerConnectionManager connections;

	std::thread listen_thread;
	std::thread heartbeat_thread;
	std::mutex heartbeat_mutex;
	std::condition_variable heartbeat_cv;

	/* Detached inbound handlers still in flight */
	int active_peers;
	std::mutex peers_mutex;
	std::condition_variable peers_cv;

	void run_listener();
	void run_heartbeat();
	void deliver(const Message &msg);

	/* Returns false once the user asked to quit */
	bool handle_command(const std::string &line, std::ostream &out);
	void print_help(std::ostream &out) const;
	void print_peers(std::ostream &out) const;
	void print_history(std::ostream &out) const;

public:
	explicit ChatClient(const ChatConfig &config);
	~ChatClient();

	/*
	 * Bind the listener, register with the tracker, spawn the listener
	 * and heartbeat threads, fetch the first peer list. A failed
	 * registration leaves the client Stopped and rethrows.
	 */
	void start();

	/* start(), interactive loop on in/out, stop() */
	void run(std::istream &in, std::ostream &out);
	void run_cli(std::istream &in, std::ostream &out);

	/* Best-effort unregister, close every socket, join threads */
	void stop();

	size_t refresh_peers();
	bool send_direct(const std::string &peer_id, const std::string &text);
	size_t broadcast(const std::string &text);

	ClientState get_state() const;
	uint16_t get_listen_port() const;
	const std::string &get_peer_id() const;
	const MessageHistory &get_history() const;
	const PeerDirectory &get_directory() const;
	PeerDirectory &get_directory();
	const PeerConnectionManager &get_connections() const;
};

#endif /* chat_client.hpp */
