#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

#define TRACKER_PORT 5000
#define P2P_PORT 6000
#define MAX_SECONDS 1000000

struct TrackerCommand {
	std::string name;	/* upper-cased command word */
	std::vector<std::string> args;
};

TrackerCommand parse_tracker_command(const std::string &line);
std::string first_line(const std::string &data);
uint16_t parse_port(const std::string &str);
int parse_seconds(const std::string &str);
bool is_valid_utf8(const std::string &str);
bool wait_readable(int fd, int timeout_ms);
int seconds_to_ms(int seconds);
std::string detect_local_ip();
std::string format_time(time_t t);

#endif /* utils.hpp */
