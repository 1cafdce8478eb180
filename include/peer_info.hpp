#ifndef PEER_INFO_H
#define PEER_INFO_H

#include <string>
#include <cstdint>
#include <ctime>

/* Tracker side entry, owned by PeerRegistry */
class PeerRecord {
public:
	std::string peer_id;
	std::string ip;
	uint16_t port;
	time_t last_seen;

	PeerRecord(std::string id, std::string ip, uint16_t port, time_t seen = 0);
};

/* Client side copy of a PeerRecord, possibly stale */
class PeerInfo {
public:
	std::string peer_id;
	std::string ip;
	uint16_t port;

	PeerInfo(std::string id, std::string ip, uint16_t port);
};

#endif /* peer_info.hpp */
