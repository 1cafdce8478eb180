#include <tracker_client.hpp>
#include <errors.hpp>
#include <utils.hpp>
#include <iterator>

using boost::asio::ip::tcp;
using json = nlohmann::json;

TrackerClient::TrackerClient(const std::string &host, uint16_t port, int read_timeout)
	: host(host), port(port), read_timeout(read_timeout) {}

json TrackerClient::send_command(const std::string &command)
{
	tcp::socket tracker_socket(io);
	tcp::resolver resolver(io);

	try {
		auto endpoints = resolver.resolve(host, std::to_string(port));
		boost::asio::connect(tracker_socket, endpoints);
	} catch (const boost::system::system_error &e) {
		throw ConnectFailed("cannot reach tracker " + host + ":" + std::to_string(port) +
							" - " + e.what());
	}

	boost::system::error_code ec;
	boost::asio::write(tracker_socket, boost::asio::buffer(command + "\n"), ec);
	if (ec) {
		throw Unreachable("error sending to tracker: " + ec.message());
	}

	/* Reply runs until the tracker closes the connection */
	boost::asio::streambuf response_buf;
	while (true) {
		if (!wait_readable(tracker_socket.native_handle(), seconds_to_ms(read_timeout))) {
			tracker_socket.close(ec);
			throw Unreachable("tracker did not answer within " +
							  std::to_string(read_timeout) + "s");
		}
		boost::asio::read(tracker_socket, response_buf, boost::asio::transfer_at_least(1), ec);
		if (ec == boost::asio::error::eof) {
			break;
		}
		if (ec) {
			tracker_socket.close(ec);
			throw Unreachable("error reading from tracker: " + ec.message());
		}
	}
	tracker_socket.close(ec);

	std::string body {
		std::istreambuf_iterator<char>(&response_buf),
		std::istreambuf_iterator<char>()
	};

	try {
		return json::parse(body);
	} catch (const json::parse_error &e) {
		throw DecodeError(std::string("malformed tracker reply: ") + e.what());
	}
}

json TrackerClient::expect_success(const json &reply)
{
	if (!reply.is_object() || !reply.contains("status")) {
		throw DecodeError("tracker reply has no status");
	}

	if (reply["status"] == "success") {
		return reply;
	}

	std::string message = reply.value("message", std::string("unknown tracker error"));
	if (message == "Peer not found") {
		throw NotFound(message);
	}
	throw ProtocolError(message);
}

size_t TrackerClient::register_peer(const std::string &peer_id, const std::string &ip,
									uint16_t listen_port)
{
	json reply = expect_success(send_command(
		"REGISTER " + peer_id + " " + ip + " " + std::to_string(listen_port)));
	return reply.value("peer_count", static_cast<size_t>(0));
}

void TrackerClient::unregister_peer(const std::string &peer_id)
{
	expect_success(send_command("UNREGISTER " + peer_id));
}

void TrackerClient::heartbeat(const std::string &peer_id)
{
	expect_success(send_command("HEARTBEAT " + peer_id));
}

std::vector<PeerInfo> TrackerClient::get_peers()
{
	json reply = expect_success(send_command("GET_PEERS"));

	if (!reply.contains("peers") || !reply["peers"].is_array()) {
		throw DecodeError("No peers list provided from tracker");
	}

	std::vector<PeerInfo> peer_list;
	try {
		for (const auto &peer : reply["peers"]) {
			peer_list.emplace_back(peer.at("peer_id").get<std::string>(),
								   peer.at("ip").get<std::string>(),
								   peer.at("port").get<uint16_t>());
		}
	} catch (const json::exception &e) {
		throw DecodeError(std::string("malformed peer entry: ") + e.what());
	}
	return peer_list;
}
