#include <peer_info.hpp>
#include <utility>

PeerRecord::PeerRecord(std::string id, std::string ip, uint16_t port, time_t seen)
	: peer_id(std::move(id)), ip(std::move(ip)), port(port), last_seen(seen) {}

PeerInfo::PeerInfo(std::string id, std::string ip, uint16_t port)
	: peer_id(std::move(id)), ip(std::move(ip)), port(port) {}
