#include <time.h>
#include <unistd.h>

#include "logger.hpp"

const costream_ns::costream<std::cerr> Log_level_traits<LogLevel::LEVEL_FATAL>::outstream(costream_ns::LIGHT_RED);
const costream_ns::costream<std::cerr> Log_level_traits<LogLevel::LEVEL_INFO>::outstream(costream_ns::LAKE_BLUE);
const costream_ns::costream<std::cerr> Log_level_traits<LogLevel::LEVEL_WARNING>::outstream(costream_ns::LIGHT_YELLOW);
const costream_ns::costream<std::cerr> Log_level_traits<LogLevel::LEVEL_DEBUG>::outstream(costream_ns::LIGHT_PURPLE);
const costream_ns::costream<std::cerr> Log_level_traits<LogLevel::LEVEL_PROFILE>::outstream(costream_ns::WHITE);

std::string get_ymd_hms_in_local_time_zone(time_t time) noexcept
{
	char datetime[100];
	struct tm local;

	localtime_r(&time, &local);
	strftime(datetime, 99, "%Y-%m-%d %H:%M:%S", &local);

	return datetime;
}
