#include <peer_registry.hpp>
#include <errors.hpp>
#include <algorithm>

PeerRegistry::PeerRegistry(int timeout)
	: peer_timeout(timeout) {}

size_t PeerRegistry::register_peer(const std::string &peer_id, const std::string &ip,
								   uint16_t port)
{
	return register_peer(peer_id, ip, port, time(nullptr));
}

size_t PeerRegistry::register_peer(const std::string &peer_id, const std::string &ip,
								   uint16_t port, time_t now)
{
	std::lock_guard<std::mutex> lock(registry_mutex);

	auto it = peers.find(peer_id);
	if (it == peers.end()) {
		peers.emplace(peer_id, PeerRecord(peer_id, ip, port, now));
		return peers.size();
	}

	PeerRecord &existing_peer = it->second;
	existing_peer.ip = ip;
	existing_peer.port = port;
	existing_peer.last_seen = std::max(existing_peer.last_seen, now);
	return peers.size();
}

void PeerRegistry::unregister_peer(const std::string &peer_id)
{
	std::lock_guard<std::mutex> lock(registry_mutex);

	if (peers.erase(peer_id) == 0) {
		throw NotFound("Peer not found");
	}
}

void PeerRegistry::heartbeat(const std::string &peer_id)
{
	heartbeat(peer_id, time(nullptr));
}

void PeerRegistry::heartbeat(const std::string &peer_id, time_t now)
{
	std::lock_guard<std::mutex> lock(registry_mutex);

	auto it = peers.find(peer_id);
	if (it == peers.end()) {
		throw NotFound("Peer not found");
	}
	it->second.last_seen = std::max(it->second.last_seen, now);
}

std::vector<PeerRecord> PeerRegistry::list() const
{
	std::lock_guard<std::mutex> lock(registry_mutex);

	std::vector<PeerRecord> snapshot;
	snapshot.reserve(peers.size());
	for (const auto &[peer_id, record] : peers) {
		snapshot.push_back(record);
	}
	return snapshot;
}

std::vector<std::string> PeerRegistry::sweep()
{
	return sweep(time(nullptr));
}

std::vector<std::string> PeerRegistry::sweep(time_t now)
{
	std::lock_guard<std::mutex> lock(registry_mutex);

	std::vector<std::string> evicted;
	for (auto it = peers.begin(); it != peers.end();) {
		if ((now - it->second.last_seen) > peer_timeout) {
			evicted.push_back(it->first);
			it = peers.erase(it);
		} else {
			++it;
		}
	}
	return evicted;
}

size_t PeerRegistry::size() const
{
	std::lock_guard<std::mutex> lock(registry_mutex);
	return peers.size();
}

int PeerRegistry::get_timeout() const
{
	return peer_timeout;
}
