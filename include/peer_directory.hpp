#ifndef PEER_DIRECTORY_HPP
#define PEER_DIRECTORY_HPP

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <peer_info.hpp>

/* Local, possibly stale, copy of the tracker's peer list */
class PeerDirectory {
private:
	std::map<std::string, PeerInfo> peers;
	mutable std::mutex directory_mutex;

public:
	/*
	 * Overwrite or add every peer except self_id. Entries the tracker no
	 * longer reports are kept unless prune is set.
	 * Returns the directory size afterwards.
	 */
	size_t update(const std::vector<PeerInfo> &peer_list, const std::string &self_id,
				  bool prune = false);

	void add(const PeerInfo &peer);
	std::optional<PeerInfo> find(const std::string &peer_id) const;
	std::vector<PeerInfo> list() const;
	bool contains(const std::string &peer_id) const;
	size_t size() const;
};

#endif /* peer_directory.hpp */
