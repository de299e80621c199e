/*
 * compare.cpp
 *
 *  Created on: 2019年4月4日
 */

#include "compare.hpp"
#include "boost_format_suffix.hpp"

#include <cmath>
#include <cerrno>
#include <cstdlib>
#include <vector>
#include <utility>
#include <stdexcept>

#include <boost/tokenizer.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

namespace
{
	using tokenizer = boost::tokenizer<boost::char_separator<char>>;

	const boost::char_separator<char> & whitespace_separator()
	{
		static const boost::char_separator<char> sep(" \t\n\r\v\f");
		return sep;
	}

	std::vector<std::string> split_tokens(const std::string & text)
	{
		tokenizer tok(text, whitespace_separator());
		return std::vector<std::string>(tok.begin(), tok.end());
	}

	/**
	 * @brief 切分为 token, 同时记录每个 token 所在的行号 (从 1 开始)
	 */
	std::vector<std::pair<size_t, std::string>> split_tokens_with_line(const std::string & text)
	{
		std::vector<std::pair<size_t, std::string>> res;
		size_t line_no = 1;
		std::string::size_type begin = 0;
		while (begin <= text.size()) {
			std::string::size_type end = text.find('\n', begin);
			if (end == std::string::npos) {
				end = text.size();
			}
			tokenizer tok(text.begin() + begin, text.begin() + end, whitespace_separator());
			for (const std::string & token : tok) {
				res.emplace_back(line_no, token);
			}
			++line_no;
			begin = end + 1;
		}
		return res;
	}

	/**
	 * @brief 按 '\n' 切分为行。以换行结尾的文本不会因此多出一个空行
	 */
	std::vector<std::string> split_lines(const std::string & text)
	{
		std::vector<std::string> res;
		if (text.empty()) {
			return res;
		}
		boost::algorithm::split(res, text, boost::algorithm::is_any_of("\n"));
		if (text.back() == '\n') {
			res.pop_back();
		}
		return res;
	}

	bool parse_finite(const std::string & token, double & value) noexcept
	{
		if (token.empty()) {
			return false;
		}
		const char * begin = token.c_str();
		char * end = nullptr;
		errno = 0;
		value = std::strtod(begin, &end);
		if (end != begin + token.size() || errno == ERANGE) {
			return false;
		}
		return std::isfinite(value);
	}

	bool token_equal(const std::string & produced, const std::string & expected, ComparePolicy policy, double epsilon)
	{
		if (policy == ComparePolicy::FLOAT_TOLERANT) {
			return float_token_equal(produced, expected, epsilon);
		}
		return produced == expected;
	}

	std::string shorten(const std::string & s, size_t max_len = 64)
	{
		if (s.size() <= max_len) {
			return s;
		}
		return s.substr(0, max_len) + "...";
	}

	std::string describe_exact(const std::string & produced, const std::string & expected)
	{
		size_t pos = 0;
		size_t line_no = 1;
		size_t line_begin = 0;
		while (pos < produced.size() && pos < expected.size() && produced[pos] == expected[pos]) {
			if (produced[pos] == '\n') {
				++line_no;
				line_begin = pos + 1;
			}
			++pos;
		}

		auto line_of = [line_begin](const std::string & s) {
			if (line_begin >= s.size()) {
				return std::string();
			}
			std::string::size_type end = s.find('\n', line_begin);
			return s.substr(line_begin, end == std::string::npos ? std::string::npos : end - line_begin);
		};

		if (pos == produced.size()) {
			return "line %d: output ended early, expected \"%s\""_fmt(line_no, shorten(line_of(expected))).str();
		}
		if (pos == expected.size()) {
			return "line %d: extra output \"%s\""_fmt(line_no, shorten(line_of(produced))).str();
		}
		return "line %d, column %d: expected \"%s\", found \"%s\""_fmt(
					line_no, pos - line_begin + 1, shorten(line_of(expected)), shorten(line_of(produced))).str();
	}

	std::string describe_lines(const std::string & produced, const std::string & expected)
	{
		const std::vector<std::string> a = split_lines(produced);
		const std::vector<std::string> b = split_lines(expected);
		size_t i = 0;
		for (; i < a.size() && i < b.size(); ++i) {
			if (a[i] != b[i]) {
				return "line %d: expected \"%s\", found \"%s\""_fmt(i + 1, shorten(b[i]), shorten(a[i])).str();
			}
		}
		if (i < b.size()) {
			return "output ended after %d lines, expected \"%s\""_fmt(i, shorten(b[i])).str();
		}
		return "extra output at line %d: \"%s\""_fmt(i + 1, shorten(a[i])).str();
	}

} /* namespace */

std::string rstrip_copy(const std::string & text)
{
	return boost::algorithm::trim_right_copy(text);
}

bool float_token_equal(const std::string & produced, const std::string & expected, double epsilon)
{
	double a, b;
	if (!parse_finite(produced, a) || !parse_finite(expected, b)) {
		return produced == expected;
	}
	double diff = std::fabs(a - b);
	return diff <= epsilon || diff <= epsilon * std::fabs(b);
}

bool compare(const std::string & produced, const std::string & expected, ComparePolicy policy, double epsilon)
{
	switch (policy) {
		case ComparePolicy::EXACT:
			return produced == expected;
		case ComparePolicy::LINE:
			return split_lines(produced) == split_lines(expected);
		case ComparePolicy::WHITESPACE_INSENSITIVE:
		case ComparePolicy::FLOAT_TOLERANT: {
			const std::vector<std::string> a = split_tokens(produced);
			const std::vector<std::string> b = split_tokens(expected);
			if (a.size() != b.size()) {
				return false;
			}
			for (size_t i = 0; i < a.size(); ++i) {
				if (!token_equal(a[i], b[i], policy, epsilon)) {
					return false;
				}
			}
			return true;
		}
		case ComparePolicy::EXTERNAL_CHECKER:
			break;
	}
	throw std::invalid_argument("compare: policy " + std::string(getComparePolicyName(policy)) + " is not a text comparison");
}

std::string describe_mismatch(const std::string & produced, const std::string & expected, ComparePolicy policy, double epsilon)
{
	if (compare(produced, expected, policy, epsilon)) {
		return "";
	}
	if (policy == ComparePolicy::EXACT) {
		return describe_exact(produced, expected);
	}
	if (policy == ComparePolicy::LINE) {
		return describe_lines(produced, expected);
	}

	const auto a = split_tokens_with_line(produced);
	const auto b = split_tokens_with_line(expected);
	size_t i = 0;
	for (; i < a.size() && i < b.size(); ++i) {
		if (!token_equal(a[i].second, b[i].second, policy, epsilon)) {
			return "line %d, token %d: expected \"%s\", found \"%s\""_fmt(
						a[i].first, i + 1, shorten(b[i].second), shorten(a[i].second)).str();
		}
	}
	if (i < b.size()) {
		return "output ended after %d tokens, expected \"%s\" at line %d"_fmt(i, shorten(b[i].second), b[i].first).str();
	}
	return "extra output at line %d: \"%s\""_fmt(a[i].first, shorten(a[i].second)).str();
}
