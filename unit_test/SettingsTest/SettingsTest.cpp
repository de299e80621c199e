/*
 * SettingsTest.cpp
 *
 *  Created on: 2019年4月11日
 */

#define BOOST_TEST_MODULE SettingsTest

#include <chrono>
#include <fstream>
#include <string>

#include <boost/test/included/unit_test.hpp>
#include <nlohmann/json.hpp>

#include "tester_settings.hpp"
#include "RunConfig.hpp"
#include "TemporaryDirectory.hpp"

std::ofstream log_fp("/dev/null");

using namespace std::chrono;

BOOST_AUTO_TEST_CASE(defaults)
{
	Settings settings;
	settings.parse(nlohmann::json::object());

	const RunConfig & config = settings.test;
	BOOST_CHECK(config.limits.time_limit == milliseconds(2000));
	BOOST_CHECK(!config.limits.memory_limit.has_value());
	BOOST_CHECK_EQUAL(config.policy, ComparePolicy::WHITESPACE_INSENSITIVE);
	BOOST_CHECK_EQUAL(config.concurrency, 1);
	BOOST_CHECK(!config.fail_fast);
	BOOST_CHECK(!config.reactive());
	BOOST_CHECK(settings.runtime.log_file_path.empty());
	BOOST_CHECK_NO_THROW(config.validate());
}

BOOST_AUTO_TEST_CASE(parse_object)
{
	const nlohmann::json json_obj = nlohmann::json::parse(R"({
		"runtime": { "log_file_path": "/tmp/ts_tester.log" },
		"test": {
			"time_limit_ms": 1500,
			"memory_limit_mb": 256,
			"compare_mode": "float",
			"epsilon": 1e-4,
			"rstrip": true,
			"concurrency": 4,
			"fail_fast": true,
			"hard_stop": true,
			"kill_grace_ms": 50,
			"judge_exit_codes": { "7": "WA", "8": "JUDGE_ERROR" }
		}
	})");

	Settings settings;
	settings.parse(json_obj);
	const RunConfig & config = settings.test;

	BOOST_CHECK_EQUAL(settings.runtime.log_file_path.string(), "/tmp/ts_tester.log");
	BOOST_CHECK(config.limits.time_limit == milliseconds(1500));
	BOOST_REQUIRE(config.limits.memory_limit.has_value());
	BOOST_CHECK_EQUAL(config.limits.memory_limit.value().count(), 256LL * 1024 * 1024);
	BOOST_CHECK_EQUAL(config.policy, ComparePolicy::FLOAT_TOLERANT);
	BOOST_CHECK_CLOSE(config.epsilon, 1e-4, 1e-9);
	BOOST_CHECK(config.rstrip);
	BOOST_CHECK_EQUAL(config.concurrency, 4);
	BOOST_CHECK(config.fail_fast);
	BOOST_CHECK(config.hard_stop);
	BOOST_CHECK(config.kill_grace == milliseconds(50));
	BOOST_CHECK_EQUAL(config.map_exit_code(7), Verdict::WRONG_ANSWER);
	BOOST_CHECK_EQUAL(config.map_exit_code(8), Verdict::JUDGE_ERROR);
	BOOST_CHECK_EQUAL(config.map_exit_code(0), Verdict::ACCEPTED);
	BOOST_CHECK_EQUAL(config.map_exit_code(3), Verdict::JUDGE_ERROR);
	BOOST_CHECK_EQUAL(config.map_exit_code(99), Verdict::WRONG_ANSWER);
	BOOST_CHECK_NO_THROW(config.validate());
}

BOOST_AUTO_TEST_CASE(parse_file)
{
	TemporaryDirectory dir("ts_tester-settings");
	const boost::filesystem::path path = dir.write_file("settings.json", R"({ "test": { "concurrency": 3 } })");

	Settings settings;
	settings.parse(path);
	BOOST_CHECK_EQUAL(settings.test.concurrency, 3);

	BOOST_CHECK_THROW(settings.parse(dir.path() / "missing.json"), SettingsParseException);

	const boost::filesystem::path broken = dir.write_file("broken.json", "{ \"test\": ");
	BOOST_CHECK_THROW(settings.parse(broken), SettingsParseException);
}

BOOST_AUTO_TEST_CASE(bad_values)
{
	Settings settings;
	BOOST_CHECK_THROW(settings.parse(nlohmann::json::parse(R"({ "test": { "time_limit_ms": "fast" } })")), SettingsParseException);
	BOOST_CHECK_THROW(settings.parse(nlohmann::json::parse(R"({ "test": { "compare_mode": "fuzzy" } })")), SettingsParseException);
	BOOST_CHECK_THROW(settings.parse(nlohmann::json::parse(R"({ "test": { "judge_exit_codes": { "x": "WA" } } })")), SettingsParseException);
	BOOST_CHECK_THROW(settings.parse(nlohmann::json::parse(R"({ "test": { "judge_exit_codes": { "4": "maybe" } } })")), SettingsParseException);
}

BOOST_AUTO_TEST_CASE(config_validation)
{
	{
		RunConfig config;
		config.limits.time_limit = milliseconds(0);
		BOOST_CHECK_THROW(config.validate(), InvalidConfigException);
	}
	{
		RunConfig config;
		config.epsilon = -1;
		BOOST_CHECK_THROW(config.validate(), InvalidConfigException);
	}
	{
		RunConfig config;
		config.judge_exit_codes[5] = Verdict::TIME_LIMIT_EXCEEDED;
		BOOST_CHECK_THROW(config.validate(), InvalidConfigException);
	}
	{
		RunConfig config;
		config.judge_exit_codes[0] = Verdict::WRONG_ANSWER;
		BOOST_CHECK_THROW(config.validate(), InvalidConfigException);
	}
	{
		RunConfig config;
		config.unmapped_exit_code_verdict = Verdict::ACCEPTED;
		BOOST_CHECK_THROW(config.validate(), InvalidConfigException);
	}
	{
		RunConfig config;
		TestCase test_case("1", "", "");
		test_case.limits = Limits(milliseconds(-1));
		BOOST_CHECK_THROW(config.validate({test_case}), InvalidConfigException);
		BOOST_CHECK_NO_THROW(config.validate({TestCase("1", "", "")}));
		BOOST_CHECK_THROW(config.validate({TestCase("1", "")}), InvalidConfigException);
	}
}

BOOST_AUTO_TEST_CASE(per_case_limits)
{
	RunConfig config;
	TestCase plain("1", "", "");
	TestCase special("2", "", "");
	special.limits = Limits(milliseconds(5000));

	BOOST_CHECK(config.limits_for(plain).time_limit == milliseconds(2000));
	BOOST_CHECK(config.limits_for(special).time_limit == milliseconds(5000));
}

BOOST_AUTO_TEST_CASE(process_config_from_limits)
{
	using namespace kerbal::utility;

	RunConfig config;
	Limits limits(milliseconds(1500));
	limits.memory_limit = Byte(32LL * 1024 * 1024);

	const ProtectedProcessConfig process_config = config.process_config(limits, nullptr);
	BOOST_CHECK(process_config.max_real_time == milliseconds(1500));
	BOOST_REQUIRE(process_config.max_cpu_time.has_value());
	BOOST_CHECK(process_config.max_cpu_time.value() == milliseconds(1500));
	BOOST_REQUIRE(process_config.max_memory.has_value());
	BOOST_CHECK(process_config.max_memory.value() == Byte(32LL * 1024 * 1024));
	BOOST_CHECK(process_config.cancel_token == nullptr);
}
