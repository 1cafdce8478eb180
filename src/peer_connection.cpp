#include <peer_connection.hpp>
#include <errors.hpp>
#include <utils.hpp>
#include <boost/asio.hpp>
#include <iostream>
#include <istream>

#define MAX_LINE_SIZE (64 * 1024)

PeerConnection::PeerConnection(boost::asio::io_context &io, const std::string &peer_id)
	: socket(io),
	  peer_id(peer_id),
	  read_buffer(MAX_LINE_SIZE)
{
}

void PeerConnection::connect(const PeerInfo &peer)
{
	remote = peer.ip + ":" + std::to_string(peer.port);

	try {
		boost::asio::ip::tcp::resolver resolver(socket.get_executor());
		auto endpoints = resolver.resolve(peer.ip, std::to_string(peer.port));
		boost::asio::connect(socket, endpoints);
	} catch (const boost::system::system_error &e) {
		throw ConnectFailed("Failed to connect to " + peer.peer_id + " at " + remote +
							" - " + e.what());
	}

	std::cout << "connected to peer " << peer.peer_id << " (" << remote << ")" << std::endl;
}

void PeerConnection::start_with_socket(boost::asio::ip::tcp::socket sock)
{
	socket = std::move(sock);

	boost::system::error_code ec;
	auto endpoint = socket.remote_endpoint(ec);
	if (!ec) {
		remote = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
	}
}

void PeerConnection::send_message(const Message &msg)
{
	std::string line = encode_message(msg);

	std::lock_guard<std::mutex> lock(write_mutex);
	boost::system::error_code ec;
	boost::asio::write(socket, boost::asio::buffer(line), ec);
	if (ec) {
		throw Unreachable("error sending to " + peer_id + ": " + ec.message());
	}
}

bool PeerConnection::read_message(Message &out)
{
	while (true) {
		boost::system::error_code ec;
		boost::asio::read_until(socket, read_buffer, '\n', ec);

		if (ec == boost::asio::error::eof || ec == boost::asio::error::operation_aborted) {
			/* A final unterminated line is dropped */
			return false;
		}
		if (ec == boost::asio::error::not_found) {
			read_buffer.consume(read_buffer.size());
			throw DecodeError("envelope exceeds " + std::to_string(MAX_LINE_SIZE) + " bytes");
		}
		if (ec) {
			throw boost::system::system_error(ec);
		}

		std::istream line_stream(&read_buffer);
		std::string line;
		std::getline(line_stream, line);
		if (!line.empty() && line.back() == '\r') {
			line.pop_back();
		}

		/* blank lines between envelopes are allowed */
		if (line.empty()) {
			continue;
		}

		out = decode_message(line);
		return true;
	}
}

bool PeerConnection::peer_closed()
{
	if (!socket.is_open()) {
		return true;
	}
	if (!wait_readable(socket.native_handle(), 0)) {
		return false;
	}

	/* readable with nothing to read: EOF or a pending error */
	boost::system::error_code ec;
	size_t pending = socket.available(ec);
	return ec || pending == 0;
}

void PeerConnection::shutdown()
{
	boost::system::error_code ec;
	socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
}

void PeerConnection::close()
{
	boost::system::error_code ec;
	socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
	socket.close(ec);
}

bool PeerConnection::is_open() const
{
	return socket.is_open();
}

const std::string &PeerConnection::get_peer_id() const
{
	return peer_id;
}

const std::string &PeerConnection::remote_address() const
{
	return remote;
}
