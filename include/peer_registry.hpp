#ifndef PEER_REGISTRY_HPP
#define PEER_REGISTRY_HPP

#include <unordered_map>
#include <vector>
#include <string>
#include <mutex>
#include <ctime>
#include <peer_info.hpp>

#define PEER_TIMEOUT 300
#define SWEEP_INTERVAL 60

/*
 * Table of registered peers. Every operation takes registry_mutex, so
 * register/unregister/heartbeat/sweep/list are totally ordered.
 */
class PeerRegistry {
private:
	std::unordered_map<std::string, PeerRecord> peers;
	mutable std::mutex registry_mutex;
	int peer_timeout;

public:
	PeerRegistry(int timeout = PEER_TIMEOUT);

	/* Insert or overwrite, returns the peer count afterwards */
	size_t register_peer(const std::string &peer_id, const std::string &ip, uint16_t port);
	size_t register_peer(const std::string &peer_id, const std::string &ip, uint16_t port,
						 time_t now);

	/* Both throw NotFound for an unknown peer_id */
	void unregister_peer(const std::string &peer_id);
	void heartbeat(const std::string &peer_id);
	void heartbeat(const std::string &peer_id, time_t now);

	std::vector<PeerRecord> list() const;

	/* Evict records idle for longer than the timeout, returns their ids */
	std::vector<std::string> sweep();
	std::vector<std::string> sweep(time_t now);

	size_t size() const;
	int get_timeout() const;
};

#endif /* peer_registry.hpp */
