/*
 * united_resource.cpp
 *
 *  Created on: 2019年4月2日
 */

#include "united_resource.hpp"

#include <stdexcept>

#include <boost/algorithm/string/case_conv.hpp>

const char * getVerdictName(Verdict verdict) noexcept
{
	switch (verdict) {
		case Verdict::ACCEPTED:
			return "ACCEPTED";
		case Verdict::WRONG_ANSWER:
			return "WRONG_ANSWER";
		case Verdict::TIME_LIMIT_EXCEEDED:
			return "TIME_LIMIT_EXCEEDED";
		case Verdict::MEMORY_LIMIT_EXCEEDED:
			return "MEMORY_LIMIT_EXCEEDED";
		case Verdict::RUNTIME_ERROR:
			return "RUNTIME_ERROR";
		case Verdict::JUDGE_ERROR:
			return "JUDGE_ERROR";
	}
	return "UNKNOWN VERDICT";
}

const char * getVerdictAbbr(Verdict verdict) noexcept
{
	switch (verdict) {
		case Verdict::ACCEPTED:
			return "AC";
		case Verdict::WRONG_ANSWER:
			return "WA";
		case Verdict::TIME_LIMIT_EXCEEDED:
			return "TLE";
		case Verdict::MEMORY_LIMIT_EXCEEDED:
			return "MLE";
		case Verdict::RUNTIME_ERROR:
			return "RE";
		case Verdict::JUDGE_ERROR:
			return "JE";
	}
	return "??";
}

Verdict parse_verdict(const std::string & name)
{
	const std::string upper = boost::algorithm::to_upper_copy(name);
	for (int i = 0; i < VERDICT_KIND_NUM; ++i) {
		Verdict verdict = static_cast<Verdict>(i);
		if (upper == getVerdictName(verdict) || upper == getVerdictAbbr(verdict)) {
			return verdict;
		}
	}
	throw std::invalid_argument("Unknown verdict name: " + name);
}

std::ostream& operator<<(std::ostream& out, Verdict verdict)
{
	return out << getVerdictName(verdict);
}

const char * getComparePolicyName(ComparePolicy policy) noexcept
{
	switch (policy) {
		case ComparePolicy::EXACT:
			return "exact";
		case ComparePolicy::WHITESPACE_INSENSITIVE:
			return "whitespace";
		case ComparePolicy::FLOAT_TOLERANT:
			return "float";
		case ComparePolicy::EXTERNAL_CHECKER:
			return "checker";
		case ComparePolicy::LINE:
			return "line";
	}
	return "unknown";
}

ComparePolicy parse_compare_policy(const std::string & name)
{
	const std::string lower = boost::algorithm::to_lower_copy(name);
	if (lower == "exact") {
		return ComparePolicy::EXACT;
	}
	if (lower == "whitespace" || lower == "all") {
		return ComparePolicy::WHITESPACE_INSENSITIVE;
	}
	if (lower == "float") {
		return ComparePolicy::FLOAT_TOLERANT;
	}
	if (lower == "checker" || lower == "special") {
		return ComparePolicy::EXTERNAL_CHECKER;
	}
	if (lower == "line") {
		return ComparePolicy::LINE;
	}
	throw std::invalid_argument("Unknown compare mode: " + name);
}

std::ostream& operator<<(std::ostream& out, ComparePolicy policy)
{
	return out << getComparePolicyName(policy);
}
