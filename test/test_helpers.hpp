#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <ostream>
#include <thread>

/* Poll pred until it holds or timeout_ms elapsed */
inline bool wait_until(const std::function<bool()> &pred, int timeout_ms = 5000)
{
	auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
	while (std::chrono::steady_clock::now() < deadline) {
		if (pred()) {
			return true;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(20));
	}
	return pred();
}

/* A localhost port nothing listens on (bound once, then released) */
inline uint16_t unused_port()
{
	boost::asio::io_context io;
	boost::asio::ip::tcp::acceptor acceptor(io,
		boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
	uint16_t port = acceptor.local_endpoint().port();
	acceptor.close();
	return port;
}

namespace nlohmann {
/* gtest would otherwise print json as a container of itself */
inline void PrintTo(const json &j, std::ostream *os)
{
	*os << j.dump();
}
}

#endif /* test_helpers.hpp */
