#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

/* Malformed tracker command or error reply from the tracker */
class ProtocolError : public std::runtime_error {
public:
	explicit ProtocolError(const std::string &what) : std::runtime_error(what) {}
};

/* Unknown peer_id on the tracker side (unregister, heartbeat) */
class NotFound : public std::runtime_error {
public:
	explicit NotFound(const std::string &what) : std::runtime_error(what) {}
};

/* peer_id missing from the local peer directory */
class PeerUnknown : public std::runtime_error {
public:
	explicit PeerUnknown(const std::string &what) : std::runtime_error(what) {}
};

class ConnectFailed : public std::runtime_error {
public:
	explicit ConnectFailed(const std::string &what) : std::runtime_error(what) {}
};

/* Socket error in the middle of a send */
class Unreachable : public std::runtime_error {
public:
	explicit Unreachable(const std::string &what) : std::runtime_error(what) {}
};

class DecodeError : public std::runtime_error {
public:
	explicit DecodeError(const std::string &what) : std::runtime_error(what) {}
};

#endif /* errors.hpp */
