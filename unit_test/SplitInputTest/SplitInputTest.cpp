/*
 * SplitInputTest.cpp
 *
 *  Created on: 2019年4月12日
 */

#define BOOST_TEST_MODULE SplitInputTest

#include <chrono>
#include <fstream>
#include <string>

#include <boost/test/included/unit_test.hpp>
#include <boost/filesystem.hpp>

#include "SplitInput.hpp"
#include "CaseStore.hpp"
#include "TemporaryDirectory.hpp"

std::ofstream log_fp("/dev/null");

using namespace std::chrono;

namespace
{
	/// 每个测试用例以其行数 n 开头, 随后 n 行; 读完一个测试用例输出一行, 读到 0 时结束
	const char * const COUNTED_CASES =
			"while read n; do [ \"$n\" = 0 ] && exit 0; i=0; "
			"while [ $i -lt $n ]; do read x; i=$((i + 1)); done; echo done; done";

	/// 首行为测试用例数 t, 之后是 t 个同上格式的测试用例
	const char * const COUNTED_WITH_TOTAL =
			"read t; j=0; while [ $j -lt $t ]; do read n; i=0; "
			"while [ $i -lt $n ]; do read x; i=$((i + 1)); done; echo ok; j=$((j + 1)); done";
}

BOOST_AUTO_TEST_CASE(index_substitution)
{
	BOOST_CHECK_EQUAL(format_case_index("test/sample-%i.in", 3), "test/sample-3.in");
	BOOST_CHECK_EQUAL(format_case_index("%i%%.in", 12), "12%.in");
	BOOST_CHECK_EQUAL(format_case_index("%s-%i", 1), "%s-1");
}

BOOST_AUTO_TEST_CASE(auto_footer)
{
	TemporaryDirectory dir("ts_tester-split");
	SplitInputOptions options;
	options.input = dir.write_file("all.txt", "1\na\n2\nb\nc\n0\n");
	options.output_format = (dir.path() / "case/%i.in").string();
	options.interval = milliseconds(200);
	options.auto_footer = true;

	SplitInputReport report = split_input(options, ProcessSpec::from_command(COUNTED_CASES, true), RunConfig());

	BOOST_REQUIRE_EQUAL(report.written.size(), 2u);
	BOOST_CHECK_EQUAL(report.written[0].string(), (dir.path() / "case/1.in").string());
	BOOST_CHECK_EQUAL(read_whole_file(report.written[0]), "1\na\n0\n");
	BOOST_CHECK_EQUAL(read_whole_file(report.written[1]), "2\nb\nc\n0\n");
	// 结尾的 0 不构成测试用例
	BOOST_CHECK_EQUAL(report.leftover, "0\n");
}

BOOST_AUTO_TEST_CASE(ignore_and_header)
{
	TemporaryDirectory dir("ts_tester-split");
	SplitInputOptions options;
	options.input = dir.write_file("all.txt", "2\n1\na\n2\nb\nc\n");
	options.output_format = (dir.path() / "%i.in").string();
	options.interval = milliseconds(200);
	options.ignore = 1;
	options.header = "1";

	SplitInputReport report = split_input(options, ProcessSpec::from_command(COUNTED_WITH_TOTAL, true), RunConfig());

	BOOST_REQUIRE_EQUAL(report.written.size(), 2u);
	BOOST_CHECK_EQUAL(read_whole_file(report.written[0]), "1\n1\na\n");
	BOOST_CHECK_EQUAL(read_whole_file(report.written[1]), "1\n2\nb\nc\n");
	BOOST_CHECK(report.leftover.empty());
}

BOOST_AUTO_TEST_CASE(explicit_footer)
{
	TemporaryDirectory dir("ts_tester-split");
	SplitInputOptions options;
	options.input = dir.write_file("all.txt", "1\nx\n");
	options.output_format = (dir.path() / "%i.in").string();
	options.interval = milliseconds(200);
	options.footer = std::string("0\n");

	SplitInputReport report = split_input(options, ProcessSpec::from_command(COUNTED_CASES, true), RunConfig());
	BOOST_REQUIRE_EQUAL(report.written.size(), 1u);
	BOOST_CHECK_EQUAL(read_whole_file(report.written[0]), "1\nx\n0\n");
}

BOOST_AUTO_TEST_CASE(bad_arguments)
{
	TemporaryDirectory dir("ts_tester-split");
	SplitInputOptions options;
	options.input = dir.write_file("all.txt", "1\n");
	options.output_format = (dir.path() / "case.in").string();
	BOOST_CHECK_THROW(split_input(options, ProcessSpec::from_command("cat", false), RunConfig()), CaseLoadException);

	options.output_format = (dir.path() / "%i.in").string();
	BOOST_CHECK_THROW(split_input(options, ProcessSpec::from_command("/nonexistent/ts_tester_prog", false), RunConfig()),
						CaseLoadException);

	options.input = dir.path() / "missing.txt";
	BOOST_CHECK_THROW(split_input(options, ProcessSpec::from_command("cat", false), RunConfig()), CaseLoadException);
}
