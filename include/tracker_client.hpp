#ifndef TRACKER_CLIENT_HPP
#define TRACKER_CLIENT_HPP

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <cstdint>
#include <peer_info.hpp>

/*
 * Client half of the tracker protocol. Every call opens its own
 * connection, sends one command line and reads the JSON reply until the
 * tracker closes.
 *
 * Failures: ConnectFailed (dial), DecodeError (reply is not JSON),
 * NotFound ("Peer not found" reply), ProtocolError (any other error reply).
 */
class TrackerClient {
private:
	boost::asio::io_context io;
	std::string host;
	uint16_t port;
	int read_timeout;

	nlohmann::json expect_success(const nlohmann::json &reply);

public:
	TrackerClient(const std::string &host, uint16_t port, int read_timeout = 10);

	nlohmann::json send_command(const std::string &command);

	/* Returns the tracker's peer count */
	size_t register_peer(const std::string &peer_id, const std::string &ip, uint16_t port);
	void unregister_peer(const std::string &peer_id);
	void heartbeat(const std::string &peer_id);
	std::vector<PeerInfo> get_peers();
};

#endif /* tracker_client.hpp */
