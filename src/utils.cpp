#include <utils.hpp>
#include <boost/asio.hpp>
#include <boost/algorithm/string.hpp>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <limits>
#include <sstream>
#include <stdexcept>

TrackerCommand parse_tracker_command(const std::string &line)
{
	std::istringstream line_stream(line);
	TrackerCommand cmd;

	line_stream >> cmd.name;
	boost::algorithm::to_upper(cmd.name);

	std::string token;
	while (line_stream >> token) {
		cmd.args.push_back(token);
	}
	return cmd;
}

/* Text up to the first line break, surrounding whitespace removed */
std::string first_line(const std::string &data)
{
	std::string line = data.substr(0, data.find('\n'));
	boost::algorithm::trim(line);
	return line;
}

uint16_t parse_port(const std::string &str)
{
	size_t used = 0;
	long value;
	try {
		value = std::stol(str, &used);
	} catch (const std::exception &) {
		throw std::invalid_argument("Invalid port: " + str);
	}

	if (used != str.size() || value < 0 || value > 65535) {
		throw std::invalid_argument("Invalid port: " + str);
	}
	return static_cast<uint16_t>(value);
}

int parse_seconds(const std::string &str)
{
	size_t used = 0;
	int value;
	try {
		value = std::stoi(str, &used);
	} catch (const std::exception &) {
		throw std::invalid_argument("Invalid number of seconds: " + str);
	}

	/* capped so the value still fits in milliseconds as an int */
	if (used != str.size() || value <= 0 || value > MAX_SECONDS) {
		throw std::invalid_argument("Invalid number of seconds: " + str);
	}
	return value;
}

/* Well-formed UTF-8: no overlongs, surrogates or code points past U+10FFFF */
bool is_valid_utf8(const std::string &str)
{
	size_t i = 0;
	while (i < str.size()) {
		unsigned char c = static_cast<unsigned char>(str[i]);
		size_t len;
		uint32_t cp;
		if (c < 0x80) {
			i++;
			continue;
		} else if ((c & 0xE0) == 0xC0) {
			len = 2;
			cp = c & 0x1F;
		} else if ((c & 0xF0) == 0xE0) {
			len = 3;
			cp = c & 0x0F;
		} else if ((c & 0xF8) == 0xF0) {
			len = 4;
			cp = c & 0x07;
		} else {
			return false;
		}

		if (i + len > str.size()) {
			return false;
		}
		for (size_t k = 1; k < len; k++) {
			unsigned char cc = static_cast<unsigned char>(str[i + k]);
			if ((cc & 0xC0) != 0x80) {
				return false;
			}
			cp = (cp << 6) | (cc & 0x3F);
		}

		if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
			cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
			return false;
		}
		i += len;
	}
	return true;
}

/* Saturates instead of overflowing int */
int seconds_to_ms(int seconds)
{
	int64_t ms = static_cast<int64_t>(seconds) * 1000;
	return static_cast<int>(std::min<int64_t>(ms, std::numeric_limits<int>::max()));
}

/*
 * Block until fd has data (or EOF) to read.
 * Returns false if timeout_ms elapsed first.
 */
bool wait_readable(int fd, int timeout_ms)
{
	struct pollfd pfd;
	pfd.fd = fd;
	pfd.events = POLLIN;
	pfd.revents = 0;

	while (true) {
		int rc = poll(&pfd, 1, timeout_ms);
		if (rc < 0 && errno == EINTR) {
			continue;
		}
		if (rc < 0) {
			throw std::runtime_error("poll failed");
		}
		return rc > 0;
	}
}

/*
 * Address other hosts can reach us on. Connecting a UDP socket sends no
 * packet, it only makes the kernel pick the outgoing interface.
 */
std::string detect_local_ip()
{
	try {
		boost::asio::io_context io;
		boost::asio::ip::udp::socket probe(io);
		probe.connect(boost::asio::ip::udp::endpoint(
			boost::asio::ip::make_address("8.8.8.8"), 80));
		std::string ip = probe.local_endpoint().address().to_string();
		boost::system::error_code ec;
		probe.close(ec);
		if (!ip.empty() && ip != "0.0.0.0") {
			return ip;
		}
	} catch (const boost::system::system_error &) {
		/* no route, fall through */
	}
	return "127.0.0.1";
}

std::string format_time(time_t t)
{
	char buf[9];
	struct tm tm_buf;
	localtime_r(&t, &tm_buf);
	strftime(buf, sizeof(buf), "%H:%M:%S", &tm_buf);
	return std::string(buf);
}
