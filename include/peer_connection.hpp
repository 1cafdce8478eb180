#ifndef PEER_CONNECTION_HPP
#define PEER_CONNECTION_HPP

#include <boost/asio.hpp>
#include <mutex>
#include <string>
#include "peer_info.hpp"
#include "message.hpp"

class PeerConnection {
private:

	/* Connection */
	boost::asio::ip::tcp::socket socket;
	std::string peer_id;
	std::string remote;

	/* Bytes received past the last complete line */
	boost::asio::streambuf read_buffer;
	std::mutex write_mutex;

public:
	PeerConnection(boost::asio::io_context &io, const std::string &peer_id);

	/* For outgoing connections (we initiate), throws ConnectFailed */
	void connect(const PeerInfo &peer);

	/* For incoming connections (they initiated, we have socket) */
	void start_with_socket(boost::asio::ip::tcp::socket sock);

	/* One envelope per line, throws Unreachable on socket error */
	void send_message(const Message &msg);

	/*
	 * Next envelope from the stream. Returns false once the peer closed.
	 * Throws DecodeError for a bad line (the stream stays usable) and
	 * boost::system::system_error for socket errors.
	 */
	bool read_message(Message &out);

	/*
	 * True once the far end closed or reset the stream. Only meaningful for
	 * outbound connections, where the peer never sends us anything.
	 */
	bool peer_closed();

	/* Unblocks a reader in another thread */
	void shutdown();
	void close();

	bool is_open() const;
	const std::string &get_peer_id() const;
	const std::string &remote_address() const;
};

#endif /* peer_connection.hpp */
