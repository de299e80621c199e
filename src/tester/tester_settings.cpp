/*
 * tester_settings.cpp
 *
 *  Created on: 2019年4月10日
 */

#include "tester_settings.hpp"

#include <fstream>
#include <boost/lexical_cast.hpp>

void Settings::parse(const boost::filesystem::path & config_file)
{
	nlohmann::json json_obj;
	{
		std::ifstream config_file_stream {config_file.native()};
		if (!config_file_stream) {
			throw SettingsParseException("cannot open config file " + config_file.string());
		}
		try {
			config_file_stream >> json_obj;
		} catch (const nlohmann::json::exception & e) {
			throw SettingsParseException(config_file.string() + ": " + e.what());
		}
	}
	this->parse(json_obj);
}

void Settings::parse(const nlohmann::json & json_obj)
{
	using namespace kerbal::utility;
	using std::chrono::milliseconds;

	try {
		auto runtime_it = json_obj.find("runtime");
		if (runtime_it != json_obj.end()) {
			const auto & runtime_node = *runtime_it;
			if (runtime_node.count("log_file_path")) {
				runtime.log_file_path = runtime_node.at("log_file_path").get<std::string>();
			}
		}

		auto test_it = json_obj.find("test");
		if (test_it == json_obj.end()) {
			return;
		}
		const auto & test_node = *test_it;

		if (test_node.count("time_limit_ms")) {
			test.limits.time_limit = milliseconds(test_node.at("time_limit_ms").get<long long>());
		}
		if (test_node.count("memory_limit_mb")) {
			test.limits.memory_limit = storage_cast<Byte>(MB(test_node.at("memory_limit_mb").get<long long>()));
		}
		if (test_node.count("compare_mode")) {
			test.policy = parse_compare_policy(test_node.at("compare_mode").get<std::string>());
		}
		if (test_node.count("rstrip")) {
			test.rstrip = test_node.at("rstrip").get<bool>();
		}
		if (test_node.count("epsilon")) {
			test.epsilon = test_node.at("epsilon").get<double>();
		}
		if (test_node.count("concurrency")) {
			test.concurrency = test_node.at("concurrency").get<int>();
		}
		if (test_node.count("fail_fast")) {
			test.fail_fast = test_node.at("fail_fast").get<bool>();
		}
		if (test_node.count("hard_stop")) {
			test.hard_stop = test_node.at("hard_stop").get<bool>();
		}
		if (test_node.count("output_limit_mb")) {
			test.output_limit = storage_cast<Byte>(MB(test_node.at("output_limit_mb").get<long long>()));
		}
		if (test_node.count("kill_grace_ms")) {
			test.kill_grace = milliseconds(test_node.at("kill_grace_ms").get<long long>());
		}
		if (test_node.count("judge_grace_ms")) {
			test.judge_grace = milliseconds(test_node.at("judge_grace_ms").get<long long>());
		}
		if (test_node.count("checker_time_limit_ms")) {
			test.checker_time_limit = milliseconds(test_node.at("checker_time_limit_ms").get<long long>());
		}
		if (test_node.count("judge_exit_codes")) {
			for (const auto & ele : test_node.at("judge_exit_codes").items()) {
				const int code = boost::lexical_cast<int>(ele.key());
				test.judge_exit_codes[code] = parse_verdict(ele.value().get<std::string>());
			}
		}
	} catch (const nlohmann::json::exception & e) {
		throw SettingsParseException(std::string("bad settings: ") + e.what());
	} catch (const boost::bad_lexical_cast & e) {
		throw SettingsParseException("bad settings: judge_exit_codes keys must be integers");
	} catch (const std::invalid_argument & e) {
		throw SettingsParseException(std::string("bad settings: ") + e.what());
	}
}
