#ifndef PEER_CONNECTION_MANAGER_HPP
#define PEER_CONNECTION_MANAGER_HPP

#include <boost/asio.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <peer_connection.hpp>
#include <peer_directory.hpp>

/*
 * Outbound connections are cached by peer_id and opened on first use.
 * Inbound connections (accepted on our listener) are tracked separately,
 * only so close_all() can unblock their readers.
 */
class PeerConnectionManager {
public:
	using MessageHandler = std::function<void(const Message &)>;

private:
	boost::asio::io_context &io;
	PeerDirectory &directory;
	MessageHandler on_message;
	std::atomic<bool> running;

	std::unordered_map<std::string, std::shared_ptr<PeerConnection>> connections;
	mutable std::mutex connections_mutex;

	std::vector<std::weak_ptr<PeerConnection>> inbound;
	std::mutex inbound_mutex;

public:
	PeerConnectionManager(boost::asio::io_context &io, PeerDirectory &directory,
						  MessageHandler handler);
	~PeerConnectionManager();

	/* Throws PeerUnknown or ConnectFailed */
	std::shared_ptr<PeerConnection> get_or_connect(const std::string &peer_id);

	/* Forget a cached connection after it failed */
	void drop(const std::string &peer_id);

	/* Reader loop for one accepted socket, returns when the peer closes */
	void handle_inbound(boost::asio::ip::tcp::socket socket);

	void close_all();

	bool is_connected(const std::string &peer_id) const;
	size_t size() const;
};

#endif /* peer_connection_manager.hpp */
