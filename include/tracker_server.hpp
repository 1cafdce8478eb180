#ifndef TRACKER_SERVER_HPP
#define TRACKER_SERVER_HPP

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <peer_registry.hpp>
#include <utils.hpp>

#define READ_TIMEOUT 10
#define MAX_COMMAND_SIZE 4096

class TrackerServer {
private:

	/* Connection */
	boost::asio::io_context io;
	boost::asio::ip::tcp::acceptor acceptor;

	PeerRegistry &registry;
	int sweep_interval;
	int read_timeout;

	/* Shutdown state */
	std::atomic<bool> running;
	std::mutex sweep_mutex;
	std::condition_variable sweep_cv;
	std::thread sweep_thread;

	/* Detached client handlers still in flight */
	int active_clients;
	std::mutex clients_mutex;
	std::condition_variable clients_cv;

	void handle_client(boost::asio::ip::tcp::socket &socket);
	void send_response(boost::asio::ip::tcp::socket &socket, const nlohmann::json &response);
	void run_sweeper();

	nlohmann::json handle_register(const TrackerCommand &cmd);
	nlohmann::json handle_get_peers(const TrackerCommand &cmd);
	nlohmann::json handle_unregister(const TrackerCommand &cmd);
	nlohmann::json handle_heartbeat(const TrackerCommand &cmd);

public:
	TrackerServer(PeerRegistry &registry,
				  const std::string &host = "0.0.0.0",
				  uint16_t port = TRACKER_PORT,
				  int sweep_interval = SWEEP_INTERVAL,
				  int read_timeout = READ_TIMEOUT);
	~TrackerServer();

	uint16_t get_port() const;

	/* Accept loop, returns after stop() once in-flight clients are done */
	void run();
	void stop();

	/* Parse and execute one command line, never throws for bad input */
	nlohmann::json handle_command(const std::string &line);
};

#endif /* tracker_server.hpp */
