#include <message.hpp>
#include <errors.hpp>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::string message_type_name(MessageType type)
{
	switch (type) {
		case MessageType::Direct:
			return "direct";
		case MessageType::Broadcast:
			return "broadcast";
	}
	return "unknown";
}

std::string encode_message(const Message &msg)
{
	json envelope = {
		{"type", message_type_name(msg.type)},
		{"from", msg.from},
		{"content", msg.content}
	};
	/* dump() escapes control characters, so the envelope stays on one line;
	 * invalid UTF-8 in typed text becomes U+FFFD */
	return envelope.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

Message decode_message(const std::string &line)
{
	json envelope;
	try {
		envelope = json::parse(line);
	} catch (const json::parse_error &e) {
		throw DecodeError(std::string("malformed envelope: ") + e.what());
	}

	if (!envelope.is_object()) {
		throw DecodeError("envelope is not a JSON object");
	}

	for (const char *field : {"type", "from", "content"}) {
		if (!envelope.contains(field) || !envelope[field].is_string()) {
			throw DecodeError(std::string("envelope missing string field '") + field + "'");
		}
	}

	Message msg;
	std::string type = envelope["type"].get<std::string>();
	if (type == "direct") {
		msg.type = MessageType::Direct;
	} else if (type == "broadcast") {
		msg.type = MessageType::Broadcast;
	} else {
		throw DecodeError("unknown message type '" + type + "'");
	}
	msg.from = envelope["from"].get<std::string>();
	msg.content = envelope["content"].get<std::string>();
	msg.time = time(nullptr);
	return msg;
}

void MessageHistory::append(const Message &msg)
{
	std::lock_guard<std::mutex> lock(history_mutex);
	messages.push_back(msg);
}

std::vector<Message> MessageHistory::snapshot() const
{
	std::lock_guard<std::mutex> lock(history_mutex);
	return messages;
}

std::vector<Message> MessageHistory::recent(size_t count) const
{
	std::lock_guard<std::mutex> lock(history_mutex);
	size_t start = messages.size() > count ? messages.size() - count : 0;
	return std::vector<Message>(messages.begin() + start, messages.end());
}

size_t MessageHistory::size() const
{
	std::lock_guard<std::mutex> lock(history_mutex);
	return messages.size();
}
