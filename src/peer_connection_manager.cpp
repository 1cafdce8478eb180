#include <peer_connection_manager.hpp>
#include <errors.hpp>
#include <algorithm>
#include <iostream>

using boost::asio::ip::tcp;

PeerConnectionManager::PeerConnectionManager(boost::asio::io_context &io,
											 PeerDirectory &directory,
											 MessageHandler handler)
	: io(io),
	  directory(directory),
	  on_message(std::move(handler)),
	  running(true)
{
}

PeerConnectionManager::~PeerConnectionManager()
{
	close_all();
}

std::shared_ptr<PeerConnection> PeerConnectionManager::get_or_connect(const std::string &peer_id)
{
	std::shared_ptr<PeerConnection> stale;
	{
		std::lock_guard<std::mutex> lock(connections_mutex);
		auto it = connections.find(peer_id);
		if (it != connections.end()) {
			if (!it->second->peer_closed()) {
				return it->second;
			}
			stale = it->second;
			connections.erase(it);
		}
	}

	if (stale) {
		std::cout << "connection to " << peer_id << " was closed by the peer, redialing"
				  << std::endl;
		stale->close();
	}

	std::optional<PeerInfo> peer = directory.find(peer_id);
	if (!peer) {
		throw PeerUnknown("Peer " + peer_id + " not found");
	}

	/* Dial outside connections_mutex */
	auto conn = std::make_shared<PeerConnection>(io, peer_id);
	conn->connect(*peer);

	std::lock_guard<std::mutex> lock(connections_mutex);
	if (!running) {
		conn->close();
		throw ConnectFailed("shutting down");
	}

	auto [it, inserted] = connections.emplace(peer_id, conn);
	if (!inserted) {
		/* Lost a race with another sender, keep the cached one */
		conn->close();
	}
	return it->second;
}

void PeerConnectionManager::drop(const std::string &peer_id)
{
	std::shared_ptr<PeerConnection> conn;
	{
		std::lock_guard<std::mutex> lock(connections_mutex);
		auto it = connections.find(peer_id);
		if (it == connections.end()) {
			return;
		}
		conn = it->second;
		connections.erase(it);
	}
	conn->close();
}

void PeerConnectionManager::handle_inbound(tcp::socket socket)
{
	auto conn = std::make_shared<PeerConnection>(io, "");
	conn->start_with_socket(std::move(socket));

	{
		std::lock_guard<std::mutex> lock(inbound_mutex);
		if (!running) {
			conn->close();
			return;
		}
		inbound.erase(std::remove_if(inbound.begin(), inbound.end(),
			[](const std::weak_ptr<PeerConnection> &w) { return w.expired(); }),
			inbound.end());
		inbound.push_back(conn);
	}

	std::cout << "incoming P2P connection from " << conn->remote_address() << std::endl;

	try {
		Message msg;
		while (running) {
			try {
				if (!conn->read_message(msg)) {
					break;
				}
			} catch (const DecodeError &e) {
				std::cerr << "bad message from " << conn->remote_address() << ": "
						  << e.what() << std::endl;
				continue;
			}
			on_message(msg);
		}
	} catch (const boost::system::system_error &e) {
		if (running) {
			std::cerr << "connection error with peer " << conn->remote_address() << ": "
					  << e.what() << std::endl;
		}
	} catch (const std::exception &e) {
		std::cerr << "error in peer connection: " << e.what() << std::endl;
	}

	conn->close();
	std::cout << "peer connection from " << conn->remote_address() << " ended" << std::endl;
}

void PeerConnectionManager::close_all()
{
	running = false;

	std::unordered_map<std::string, std::shared_ptr<PeerConnection>> outbound;
	{
		std::lock_guard<std::mutex> lock(connections_mutex);
		outbound.swap(connections);
	}
	for (auto &[peer_id, conn] : outbound) {
		conn->close();
	}

	std::lock_guard<std::mutex> lock(inbound_mutex);
	for (auto &weak : inbound) {
		if (auto conn = weak.lock()) {
			conn->shutdown();
		}
	}
	inbound.clear();
}

bool PeerConnectionManager::is_connected(const std::string &peer_id) const
{
	std::lock_guard<std::mutex> lock(connections_mutex);
	return connections.count(peer_id) > 0;
}

size_t PeerConnectionManager::size() const
{
	std::lock_guard<std::mutex> lock(connections_mutex);
	return connections.size();
}
