#ifndef LOGGER_H
#define LOGGER_H

#include <iostream>
#include <fstream>
#include <sstream>
#include <mutex>
#include <ctime>
#include <typeinfo>
#include <boost/format.hpp>
#include <boost/current_function.hpp>
#include <kerbal/utility/costream.hpp>
#include <kerbal/compatibility/chrono_suffix.hpp>

namespace costream_ns = kerbal::utility::costream;

/**
 * @addtogroup log_level
 * @{
 */
enum class LogLevel
{
	LEVEL_FATAL = 0, LEVEL_WARNING = 1, LEVEL_INFO = 2, LEVEL_DEBUG = 3, LEVEL_PROFILE = 4
};

/**
 * 日志告警级别萃取器
 * @tparam level 日志告警级别
 */
template <LogLevel level>
struct Log_level_traits;

template <>
struct Log_level_traits<LogLevel::LEVEL_FATAL>
{
		static constexpr const char * str = "FATAL";
		static const costream_ns::costream<std::cerr> outstream;
};

template <>
struct Log_level_traits<LogLevel::LEVEL_INFO>
{
		static constexpr const char * str = "INFO";
		static const costream_ns::costream<std::cerr> outstream;
};

template <>
struct Log_level_traits<LogLevel::LEVEL_WARNING>
{
		static constexpr const char * str = "WARNING";
		static const costream_ns::costream<std::cerr> outstream;
};

template <>
struct Log_level_traits<LogLevel::LEVEL_DEBUG>
{
		static constexpr const char * str = "DEBUG";
		static const costream_ns::costream<std::cerr> outstream;
};

template <>
struct Log_level_traits<LogLevel::LEVEL_PROFILE>
{
		static constexpr const char * str = "PROF";
		static const costream_ns::costream<std::cerr> outstream;
};

/**
 * @}
 */

std::string get_ymd_hms_in_local_time_zone(time_t time) noexcept;

template <typename Tp>
void multi_args_write(std::ostream & log_fp, Tp && arg0)
{
	log_fp << arg0;
}

template <typename Tp, typename ...Up>
void multi_args_write(std::ostream & log_fp, Tp && arg0, Up&& ...args)
{
	log_fp << arg0;
	multi_args_write(log_fp, std::forward<Up>(args)...);
}

namespace ts_tester
{
	namespace log
	{
		static const boost::format templ("[%s] %s case:%s [%s:%d] ");
		/*           datetime logLevelStr case_id srcFileName line */

		/// 高于 (数值上小于等于) 此级别的日志会同时回显到控制台
		inline LogLevel console_level = LogLevel::LEVEL_WARNING;

		/// 多个 worker 线程共享同一个日志文件, 写入时需互斥
		inline std::mutex log_mtx;

		template <LogLevel level, typename ...T>
		void __log_write(const std::string & case_id, const char source_filename[], int line, std::ostream & log_file, T&& ... args) noexcept
		{
			try {
				const time_t now = time(NULL);
				const std::string datetime = get_ymd_hms_in_local_time_zone(now);

				std::ostringstream buffer;

				boost::format head(templ);
				multi_args_write(buffer, head % datetime % (const char *) Log_level_traits<level>::str % case_id % source_filename % line, std::forward<T>(args)...);

				std::lock_guard<std::mutex> lck(log_mtx);
				if (static_cast<int>(level) <= static_cast<int>(console_level)) {
					Log_level_traits<level>::outstream << buffer.str() << std::endl;
				}

				if (!log_file) {
					return;
				}
				log_file << buffer.str() << std::endl;

				if (log_file.fail()) { //http://www.cplusplus.com/reference/ios/ios/fail/
					std::cerr << "write error!" << std::endl;
					log_file.clear();
					return;
				}
			} catch (const std::exception & e) {
				std::cerr << "log write failed: " << e.what() << std::endl;
			}
		}

	} /* namespace log */

} /* namespace ts_tester */

template <LogLevel level, typename ...T>
void log_write(const std::string & case_id, const char source_filename[], int line, std::ostream & log_file, T&& ... args) noexcept
{
	ts_tester::log::__log_write<level>(case_id, source_filename, line, log_file, std::forward<T>(args)...);
}

template <LogLevel level, typename ...T>
void log_write(const std::string & case_id, const char source_filename[], int line, std::ofstream & log_file, T&& ... args) noexcept
{
	ts_tester::log::__log_write<level>(case_id, source_filename, line, (std::ostream&)(log_file), std::forward<T>(args)...);
}

#define UNKNOWN_EXCEPTION_WHAT (const char*)("unknown exception")

/// 与具体测试用例无关的日志使用此 id
#define RUN_LEVEL_ID "-"

#ifdef LOG_DEBUG
#	undef LOG_DEBUG
#endif
#define LOG_DEBUG(case_id, log_fp, x...) \
	log_write<LogLevel::LEVEL_DEBUG>(case_id, __FILE__, __LINE__, log_fp, ##x)

#ifdef LOG_INFO
#	undef LOG_INFO
#endif
#define LOG_INFO(case_id, log_fp, x...) \
	log_write<LogLevel::LEVEL_INFO>(case_id, __FILE__, __LINE__, log_fp, ##x)

#ifdef LOG_WARNING
#	undef LOG_WARNING
#endif
#define LOG_WARNING(case_id, log_fp, x...)	 \
	log_write<LogLevel::LEVEL_WARNING>(case_id, __FILE__, __LINE__, log_fp, ##x)

#ifdef LOG_FATAL
#	undef LOG_FATAL
#endif
#define LOG_FATAL(case_id, log_fp, x...) \
	log_write<LogLevel::LEVEL_FATAL>(case_id, __FILE__, __LINE__, log_fp, ##x)

#ifdef LOG_PROFILE
#	undef LOG_PROFILE
#	undef PROFILE_HEAD
#	undef PROFILE_TAIL
#endif
#ifdef PROFILE
#	define LOG_PROFILE(case_id, log_fp, args...) \
		log_write<LogLevel::LEVEL_PROFILE>(case_id, __FILE__, __LINE__, log_fp, ##args)
#	define PROFILE_HEAD \
		auto __profile_start = std::chrono::steady_clock::now();
#	define PROFILE_TAIL(case_id, log_fp, args...) \
		LOG_PROFILE(case_id, log_fp, BOOST_CURRENT_FUNCTION, ": consume: ", \
		std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - __profile_start).count(), " ms ", ##args);
#else
#	define LOG_PROFILE(case_id, log_fp, args...)
#	define PROFILE_HEAD
#	define PROFILE_TAIL(case_id, log_fp, args...)
#endif

#ifdef EXCEPT_WARNING
#	undef EXCEPT_WARNING
#endif
#define EXCEPT_WARNING(case_id, log_fp, events, exception, x...)	LOG_WARNING(case_id, log_fp, events, \
																		" Error information: ", exception.what(), "  Exception type: ", typeid(exception).name(), ##x)
#ifdef UNKNOWN_EXCEPT_WARNING
#	undef UNKNOWN_EXCEPT_WARNING
#endif
#define UNKNOWN_EXCEPT_WARNING(case_id, log_fp, events, x...)	LOG_WARNING(case_id, log_fp, events, \
																		" Error information: ", UNKNOWN_EXCEPTION_WHAT, ##x)

#ifdef EXCEPT_FATAL
#	undef EXCEPT_FATAL
#endif
#define EXCEPT_FATAL(case_id, log_fp, events, exception, x...)	    LOG_FATAL(case_id, log_fp, events, \
																		" Error information: ", exception.what(), "  Exception type: ", typeid(exception).name(), ##x)
#ifdef UNKNOWN_EXCEPT_FATAL
#	undef UNKNOWN_EXCEPT_FATAL
#endif
#define UNKNOWN_EXCEPT_FATAL(case_id, log_fp, events, x...)	    LOG_FATAL(case_id, log_fp, events, \
																		" Error information: ", UNKNOWN_EXCEPTION_WHAT, ##x)

#endif //LOGGER_H
