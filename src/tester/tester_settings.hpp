/*
 * tester_settings.hpp
 *
 *  Created on: 2019年4月10日
 */

#ifndef SRC_TESTER_TESTER_SETTINGS_HPP_
#define SRC_TESTER_TESTER_SETTINGS_HPP_

#include <string>
#include <stdexcept>

#include <boost/filesystem/path.hpp>
#include <nlohmann/json.hpp>

#include "RunConfig.hpp"

/**
 * @brief 配置文件无法读取或内容不合法
 */
class SettingsParseException : public std::runtime_error
{
	public:
		using std::runtime_error::runtime_error;
};

/**
 * @brief JSON 配置文件。文件中的每一项都可省略, 省略的项保持默认值, 命令行参数优先于文件
 *
 * {
 *     "runtime": { "log_file_path": "/tmp/ts_tester.log" },
 *     "test": {
 *         "time_limit_ms": 2000, "memory_limit_mb": 256, "compare_mode": "whitespace", "epsilon": 1e-6, "rstrip": false,
 *         "concurrency": 4, "fail_fast": false, "hard_stop": false, "output_limit_mb": 64, "kill_grace_ms": 200,
 *         "judge_grace_ms": 1000, "checker_time_limit_ms": 10000, "judge_exit_codes": { "3": "JE" }
 *     }
 * }
 */
class Settings
{
	public:

		struct
		{
				boost::filesystem::path log_file_path; ///< 为空时不写日志文件
		} runtime;

		RunConfig test; ///< 运行配置的默认值

		/**
		 * @throws SettingsParseException
		 */
		void parse(const boost::filesystem::path & config_file);

		/**
		 * @throws SettingsParseException
		 */
		void parse(const nlohmann::json & json_obj);
};

#endif /* SRC_TESTER_TESTER_SETTINGS_HPP_ */
