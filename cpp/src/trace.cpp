#include "trace.hpp"

#include <chrono>
#include <iomanip>
#include <ctime>

struct time now;

const std::filesystem::path trace_path("natsort.log");

std::ostream& operator <<(std::ostream& output, const struct time& _) {
	auto clock = std::chrono::system_clock::now();
	auto stamp = std::chrono::system_clock::to_time_t(clock);
	auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
		clock.time_since_epoch()).count() % 1000;
	std::tm local;
	localtime_r(&stamp, &local);
	return output << std::put_time(&local, "%F %T") << '.'
		<< std::setw(3) << std::setfill('0') << millis << std::setfill(' ');
}

void tracef(std::ostream& out) {
	out << std::endl;
}
