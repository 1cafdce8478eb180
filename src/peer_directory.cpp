#include <peer_directory.hpp>

size_t PeerDirectory::update(const std::vector<PeerInfo> &peer_list, const std::string &self_id,
							 bool prune)
{
	std::lock_guard<std::mutex> lock(directory_mutex);

	if (prune) {
		peers.clear();
	}

	for (const auto &peer : peer_list) {
		if (peer.peer_id == self_id) {
			continue;
		}
		peers.insert_or_assign(peer.peer_id, peer);
	}
	return peers.size();
}

void PeerDirectory::add(const PeerInfo &peer)
{
	std::lock_guard<std::mutex> lock(directory_mutex);
	peers.insert_or_assign(peer.peer_id, peer);
}

std::optional<PeerInfo> PeerDirectory::find(const std::string &peer_id) const
{
	std::lock_guard<std::mutex> lock(directory_mutex);

	auto it = peers.find(peer_id);
	if (it == peers.end()) {
		return std::nullopt;
	}
	return it->second;
}

std::vector<PeerInfo> PeerDirectory::list() const
{
	std::lock_guard<std::mutex> lock(directory_mutex);

	std::vector<PeerInfo> snapshot;
	snapshot.reserve(peers.size());
	for (const auto &[peer_id, peer] : peers) {
		snapshot.push_back(peer);
	}
	return snapshot;
}

bool PeerDirectory::contains(const std::string &peer_id) const
{
	std::lock_guard<std::mutex> lock(directory_mutex);
	return peers.count(peer_id) > 0;
}

size_t PeerDirectory::size() const
{
	std::lock_guard<std::mutex> lock(directory_mutex);
	return peers.size();
}
