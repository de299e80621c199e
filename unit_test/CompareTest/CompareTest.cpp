/*
 * CompareTest.cpp
 *
 *  Created on: 2019年4月11日
 */

#define BOOST_TEST_MODULE CompareTest

#include <fstream>
#include <stdexcept>

#include <boost/test/included/unit_test.hpp>

#include "compare.hpp"

std::ofstream log_fp("/dev/null");

BOOST_AUTO_TEST_CASE(exact_is_byte_for_byte)
{
	BOOST_CHECK(compare("3\n", "3\n", ComparePolicy::EXACT));
	BOOST_CHECK(!compare("3\n", "3", ComparePolicy::EXACT));
	BOOST_CHECK(!compare("3\r\n", "3\n", ComparePolicy::EXACT));
	BOOST_CHECK(compare("", "", ComparePolicy::EXACT));
}

BOOST_AUTO_TEST_CASE(whitespace_ignores_layout)
{
	BOOST_CHECK(compare("3\n", "3", ComparePolicy::WHITESPACE_INSENSITIVE));
	BOOST_CHECK(compare("1  2\n3\n\n", "1 2 3", ComparePolicy::WHITESPACE_INSENSITIVE));
	BOOST_CHECK(compare("a\r\nb\t\n", "a\nb\n", ComparePolicy::WHITESPACE_INSENSITIVE));
	BOOST_CHECK(compare("  \n\n", "", ComparePolicy::WHITESPACE_INSENSITIVE));

	// token 内部不做任何放宽
	BOOST_CHECK(!compare("12", "1 2", ComparePolicy::WHITESPACE_INSENSITIVE));
	BOOST_CHECK(!compare("1.0", "1", ComparePolicy::WHITESPACE_INSENSITIVE));
	BOOST_CHECK(!compare("1 2", "1 2 3", ComparePolicy::WHITESPACE_INSENSITIVE));
}

BOOST_AUTO_TEST_CASE(float_tolerance)
{
	BOOST_CHECK(compare("1.000001", "1.0000015", ComparePolicy::FLOAT_TOLERANT, 1e-5));
	BOOST_CHECK(!compare("1.01", "1.0", ComparePolicy::FLOAT_TOLERANT, 1e-5));
	BOOST_CHECK(compare("1 2.5\n", "1.0 2.5000001", ComparePolicy::FLOAT_TOLERANT));

	// 相对误差
	BOOST_CHECK(compare("1000000.5", "1000000", ComparePolicy::FLOAT_TOLERANT, 1e-6));

	// 非数值 token 按文本比较
	BOOST_CHECK(compare("yes 0.5", "yes 0.5000000001", ComparePolicy::FLOAT_TOLERANT));
	BOOST_CHECK(!compare("Yes 0.5", "yes 0.5", ComparePolicy::FLOAT_TOLERANT));
	BOOST_CHECK(!compare("1.5abc", "1.5", ComparePolicy::FLOAT_TOLERANT));
	BOOST_CHECK(compare("nan", "nan", ComparePolicy::FLOAT_TOLERANT));
	BOOST_CHECK(!compare("inf", "1e308", ComparePolicy::FLOAT_TOLERANT));
}

BOOST_AUTO_TEST_CASE(line_by_line)
{
	BOOST_CHECK(compare("1 2\n3\n", "1 2\n3", ComparePolicy::LINE));
	BOOST_CHECK(compare("", "", ComparePolicy::LINE));
	BOOST_CHECK(!compare("1  2\n3\n", "1 2\n3\n", ComparePolicy::LINE));
	BOOST_CHECK(!compare("1\n\n", "1\n", ComparePolicy::LINE));
	BOOST_CHECK(!compare("1 2 3\n", "1 2\n3\n", ComparePolicy::LINE));

	BOOST_CHECK_EQUAL(describe_mismatch("a\nb c\n", "a\nb  c\n", ComparePolicy::LINE), "line 2: expected \"b  c\", found \"b c\"");
	BOOST_CHECK(describe_mismatch("a\n", "a\nb\n", ComparePolicy::LINE).find("output ended after 1 lines") != std::string::npos);
	BOOST_CHECK(describe_mismatch("a\nb\n", "a\n", ComparePolicy::LINE).find("extra output at line 2") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(rstrip_before_exact)
{
	BOOST_CHECK_EQUAL(rstrip_copy("3 \n\n"), "3");
	BOOST_CHECK_EQUAL(rstrip_copy("  a b\t"), "  a b");
	BOOST_CHECK(compare(rstrip_copy("3\n"), rstrip_copy("3 \n\n"), ComparePolicy::EXACT));
	BOOST_CHECK(!compare(rstrip_copy(" 3\n"), rstrip_copy("3\n"), ComparePolicy::EXACT));
}

BOOST_AUTO_TEST_CASE(policy_names)
{
	BOOST_CHECK_EQUAL(parse_compare_policy("line"), ComparePolicy::LINE);
	BOOST_CHECK_EQUAL(parse_compare_policy("all"), ComparePolicy::WHITESPACE_INSENSITIVE);
	BOOST_CHECK_EQUAL(getComparePolicyName(ComparePolicy::LINE), std::string("line"));
	BOOST_CHECK_THROW(parse_compare_policy("fuzzy"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(float_token_equal_parses_whole_token)
{
	BOOST_CHECK(float_token_equal("0.1", "1e-1", 0));
	BOOST_CHECK(float_token_equal("-0", "0", 0));
	BOOST_CHECK(!float_token_equal("1,5", "1.5", 0.1));
	BOOST_CHECK(!float_token_equal("", "0", 1));
}

BOOST_AUTO_TEST_CASE(checker_policy_is_not_a_text_comparison)
{
	BOOST_CHECK_THROW(compare("1", "1", ComparePolicy::EXTERNAL_CHECKER), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(mismatch_description)
{
	BOOST_CHECK_EQUAL(describe_mismatch("1 2\n", "1 2", ComparePolicy::WHITESPACE_INSENSITIVE), "");

	const std::string token_diff = describe_mismatch("1\n2 4\n", "1\n2 3\n", ComparePolicy::WHITESPACE_INSENSITIVE);
	BOOST_CHECK_EQUAL(token_diff, "line 2, token 3: expected \"3\", found \"4\"");

	const std::string too_short = describe_mismatch("1\n", "1\n2\n", ComparePolicy::WHITESPACE_INSENSITIVE);
	BOOST_CHECK(too_short.find("output ended after 1 tokens") != std::string::npos);

	const std::string too_long = describe_mismatch("1 2\n", "1\n", ComparePolicy::WHITESPACE_INSENSITIVE);
	BOOST_CHECK(too_long.find("extra output at line 1") != std::string::npos);

	const std::string byte_diff = describe_mismatch("ab\ncd\n", "ab\nce\n", ComparePolicy::EXACT);
	BOOST_CHECK_EQUAL(byte_diff, "line 2, column 2: expected \"ce\", found \"cd\"");

	const std::string missing_newline = describe_mismatch("3", "3\n", ComparePolicy::EXACT);
	BOOST_CHECK(missing_newline.find("output ended early") != std::string::npos);
}
