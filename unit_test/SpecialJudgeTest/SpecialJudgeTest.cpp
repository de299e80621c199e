/*
 * SpecialJudgeTest.cpp
 *
 *  Created on: 2019年4月11日
 */

#define BOOST_TEST_MODULE SpecialJudgeTest

#include <chrono>
#include <fstream>
#include <string>

#include <boost/test/included/unit_test.hpp>
#include <boost/filesystem.hpp>

#include "SpecialJudge.hpp"
#include "RunConfig.hpp"

std::ofstream log_fp("/dev/null");

using namespace std::chrono;

namespace
{
	/// 以 sh -c 执行脚本, checker 的参数从 $1 开始
	ProcessSpec shell_spec(const std::string & script)
	{
		return ProcessSpec::from_command(script, true);
	}

	CheckResult run_checker(RunConfig & config, const std::string & script, const TestCase & test_case, const std::string & produced)
	{
		config.checker = shell_spec(script);
		return SpecialJudge(config).check(test_case, produced, nullptr);
	}
}

BOOST_AUTO_TEST_CASE(exit_code_decides)
{
	RunConfig config;
	const TestCase test_case("1", "2 3\n", "5\n");

	CheckResult res = run_checker(config, "cmp -s \"$2\" \"$3\"", test_case, "5\n");
	BOOST_CHECK_EQUAL(res.verdict, Verdict::ACCEPTED);

	res = run_checker(config, "cmp -s \"$2\" \"$3\"", test_case, "6\n");
	BOOST_CHECK_EQUAL(res.verdict, Verdict::WRONG_ANSWER);
}

BOOST_AUTO_TEST_CASE(checker_sees_input_file)
{
	RunConfig config;
	const char * script = "read a b < \"$1\"; read c < \"$2\"; [ \"$c\" -eq $((a + b)) ]";
	CheckResult res = run_checker(config, script, TestCase("1", "2 3\n"), "5\n");
	BOOST_CHECK_EQUAL(res.verdict, Verdict::ACCEPTED);
}

BOOST_AUTO_TEST_CASE(expected_argument_only_when_present)
{
	RunConfig config;
	CheckResult res = run_checker(config, "[ $# -eq 2 ]", TestCase("1", ""), "");
	BOOST_CHECK_EQUAL(res.verdict, Verdict::ACCEPTED);

	res = run_checker(config, "[ $# -eq 3 ]", TestCase("1", "", ""), "");
	BOOST_CHECK_EQUAL(res.verdict, Verdict::ACCEPTED);
}

BOOST_AUTO_TEST_CASE(checker_comment)
{
	RunConfig config;
	CheckResult res = run_checker(config, "echo '  ok, 3 numbers '; exit 0", TestCase("1", "", ""), "");
	BOOST_CHECK_EQUAL(res.verdict, Verdict::ACCEPTED);
	BOOST_CHECK_EQUAL(res.comment, "ok, 3 numbers");

	res = run_checker(config, "echo 'line 2 differs' >&2; exit 1", TestCase("1", "", ""), "");
	BOOST_CHECK_EQUAL(res.verdict, Verdict::WRONG_ANSWER);
	BOOST_CHECK_EQUAL(res.comment, "line 2 differs");
}

BOOST_AUTO_TEST_CASE(checker_failures_are_judge_errors)
{
	RunConfig config;
	const TestCase test_case("1", "", "");

	CheckResult res = run_checker(config, "exit 3", test_case, "");
	BOOST_CHECK_EQUAL(res.verdict, Verdict::JUDGE_ERROR);

	res = run_checker(config, "exit 42", test_case, "");
	BOOST_CHECK_EQUAL(res.verdict, Verdict::WRONG_ANSWER);

	res = run_checker(config, "kill -9 $$", test_case, "");
	BOOST_CHECK_EQUAL(res.verdict, Verdict::JUDGE_ERROR);
	BOOST_CHECK(res.comment.find("signal 9") != std::string::npos);

	config.checker_time_limit = milliseconds(300);
	res = run_checker(config, "sleep 10", test_case, "");
	BOOST_CHECK_EQUAL(res.verdict, Verdict::JUDGE_ERROR);
	BOOST_CHECK(res.comment.find("time limit") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(missing_checker)
{
	RunConfig config;
	config.checker = ProcessSpec::from_command("/nonexistent/ts_tester_checker", false);
	CheckResult res = SpecialJudge(config).check(TestCase("1", "", ""), "", nullptr);
	BOOST_CHECK_EQUAL(res.verdict, Verdict::JUDGE_ERROR);
	BOOST_CHECK(res.comment.find("checker failed to start") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(temporary_files_are_removed)
{
	RunConfig config;
	CheckResult res = run_checker(config, "dirname \"$1\"", TestCase("1", "", ""), "");
	BOOST_REQUIRE_EQUAL(res.verdict, Verdict::ACCEPTED);
	BOOST_CHECK(!res.comment.empty());
	BOOST_CHECK(!boost::filesystem::exists(res.comment));
}

BOOST_AUTO_TEST_CASE(shell_command_receives_files_as_positional_args)
{
	RunConfig config;
	config.checker = ProcessSpec::from_command("[ $# -eq 3 ] && [ \"$(cat \"$2\")\" = 5 ] && cmp -s \"$2\" \"$3\"", true);
	CheckResult res = SpecialJudge(config).check(TestCase("1", "2 3\n", "5\n"), "5\n", nullptr);
	BOOST_CHECK_EQUAL(res.verdict, Verdict::ACCEPTED);
}

BOOST_AUTO_TEST_CASE(checker_program_with_own_args)
{
	namespace fs = boost::filesystem;

	const fs::path script = fs::temp_directory_path() / fs::unique_path("ts_tester-chk-%%%%-%%%%.sh");
	{
		std::ofstream fout(script.native());
		fout << "#!/bin/sh\n"
				"[ \"$1\" = --strict ] || exit 3\n"
				"[ $# -eq 4 ] || exit 3\n"
				"cmp -s \"$3\" \"$4\"\n";
	}
	fs::permissions(script, fs::owner_all);

	RunConfig config;
	config.checker = ProcessSpec::from_command(script.string() + " --strict", false);
	CheckResult res = SpecialJudge(config).check(TestCase("1", "1\n", "2\n"), "2\n", nullptr);
	BOOST_CHECK_EQUAL(res.verdict, Verdict::ACCEPTED);

	res = SpecialJudge(config).check(TestCase("1", "1\n", "2\n"), "3\n", nullptr);
	BOOST_CHECK_EQUAL(res.verdict, Verdict::WRONG_ANSWER);

	fs::remove(script);
}
