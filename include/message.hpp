#ifndef MESSAGE_HPP
#define MESSAGE_HPP

#include <string>
#include <vector>
#include <mutex>
#include <ctime>

enum class MessageType {
	Direct,
	Broadcast
};

struct Message {
	MessageType type;
	std::string from;
	std::string content;
	time_t time;
};

std::string message_type_name(MessageType type);

/*
 * Envelope on the peer stream: one JSON object per line,
 * {"type": "direct"|"broadcast", "from": ..., "content": ...}
 * The receive time is not on the wire.
 */
std::string encode_message(const Message &msg);

/* Throws DecodeError for anything that is not a valid envelope */
Message decode_message(const std::string &line);

/* Append-only history of received messages */
class MessageHistory {
private:
	std::vector<Message> messages;
	mutable std::mutex history_mutex;

public:
	void append(const Message &msg);
	std::vector<Message> snapshot() const;
	std::vector<Message> recent(size_t count) const;
	size_t size() const;
};

#endif /* message.hpp */
