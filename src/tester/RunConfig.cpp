/*
 * RunConfig.cpp
 *
 *  Created on: 2019年4月5日
 */

#include "RunConfig.hpp"
#include "compare.hpp"
#include "boost_format_suffix.hpp"

std::ostream& operator<<(std::ostream & out, const Limits & limits)
{
	out << "time_limit: " << limits.time_limit.count() << " ms";
	if (limits.memory_limit) {
		out << " memory_limit: " << limits.memory_limit.value().count() << " Byte";
	} else {
		out << " memory_limit: unlimited";
	}
	return out;
}

RunConfig::RunConfig() :
		limits(), policy(ComparePolicy::WHITESPACE_INSENSITIVE), epsilon(DEFAULT_EPSILON), rstrip(false),
		concurrency(1), fail_fast(false), hard_stop(false), output_limit(0),
		kill_grace(200), judge_grace(1000), checker_time_limit(10000),
		unmapped_exit_code_verdict(Verdict::WRONG_ANSWER)
{
	using namespace kerbal::utility;
	this->output_limit = 64_MB;
	this->judge_exit_codes = {
		{0, Verdict::ACCEPTED},
		{1, Verdict::WRONG_ANSWER},
		{2, Verdict::WRONG_ANSWER},
		{3, Verdict::JUDGE_ERROR},
	};
}

Verdict RunConfig::map_exit_code(int exit_code) const
{
	auto it = judge_exit_codes.find(exit_code);
	if (it != judge_exit_codes.end()) {
		return it->second;
	}
	return exit_code == 0 ? Verdict::ACCEPTED : unmapped_exit_code_verdict;
}

void RunConfig::validate() const
{
	using namespace std::chrono;

	if (limits.time_limit <= milliseconds::zero()) {
		throw InvalidConfigException("time limit must be positive");
	}
	if (limits.memory_limit && limits.memory_limit.value().count() <= 0) {
		throw InvalidConfigException("memory limit must be positive");
	}
	if (concurrency < 1) {
		throw InvalidConfigException("concurrency must be at least 1, got " + std::to_string(concurrency));
	}
	if (epsilon < 0) {
		throw InvalidConfigException("epsilon must not be negative");
	}
	if (policy == ComparePolicy::EXTERNAL_CHECKER && !checker) {
		throw InvalidConfigException("compare mode 'checker' requires a checker program");
	}
	if (checker && checker.value().args.empty()) {
		throw InvalidConfigException("checker command is empty");
	}
	if (judge && judge.value().args.empty()) {
		throw InvalidConfigException("judge command is empty");
	}
	if (checker_time_limit <= milliseconds::zero()) {
		throw InvalidConfigException("checker time limit must be positive");
	}
	if (kill_grace < milliseconds::zero() || judge_grace < milliseconds::zero()) {
		throw InvalidConfigException("grace periods must not be negative");
	}
	if (output_limit.count() <= 0) {
		throw InvalidConfigException("output limit must be positive");
	}

	for (const auto & ele : judge_exit_codes) {
		switch (ele.second) {
			case Verdict::ACCEPTED:
			case Verdict::WRONG_ANSWER:
			case Verdict::JUDGE_ERROR:
				break;
			default:
				throw InvalidConfigException("exit code %d is mapped to %s, only ACCEPTED, WRONG_ANSWER and JUDGE_ERROR are allowed"_fmt(
												ele.first, getVerdictName(ele.second)).str());
		}
	}
	if (map_exit_code(0) != Verdict::ACCEPTED) {
		throw InvalidConfigException("exit code 0 must be mapped to ACCEPTED");
	}
	if (unmapped_exit_code_verdict == Verdict::ACCEPTED) {
		throw InvalidConfigException("non-zero exit codes must not default to ACCEPTED");
	}
}

void RunConfig::validate(const std::vector<TestCase> & cases) const
{
	this->validate();

	const bool delegated = checker.has_value() || judge.has_value();
	for (const TestCase & test_case : cases) {
		if (!test_case.expected_output && !delegated) {
			throw InvalidConfigException("case " + test_case.id + " has no expected output and neither a checker nor a judge is configured");
		}
		if (test_case.limits && test_case.limits.value().time_limit <= std::chrono::milliseconds::zero()) {
			throw InvalidConfigException("case " + test_case.id + " has a non-positive time limit");
		}
	}
}

ProtectedProcessConfig RunConfig::process_config(const Limits & limits, const CancellationToken * token) const
{
	ProtectedProcessConfig res(limits.time_limit);
	res.set_max_cpu_time(limits.time_limit)
		.set_max_output_size(output_limit)
		.set_kill_grace(kill_grace)
		.set_cancel_token(token);
	if (limits.memory_limit) {
		res.set_max_memory(limits.memory_limit.value());
		res.set_max_stack(limits.memory_limit.value());
	}
	return res;
}

std::ostream& operator<<(std::ostream & out, const RunConfig & config)
{
	out << config.limits
		<< " compare_mode: " << config.policy
		<< " epsilon: " << config.epsilon
		<< " rstrip: " << std::boolalpha << config.rstrip << std::noboolalpha
		<< " concurrency: " << config.concurrency
		<< " fail_fast: " << std::boolalpha << config.fail_fast << " hard_stop: " << config.hard_stop << std::noboolalpha;
	if (config.checker) {
		out << " checker: " << config.checker.value();
	}
	if (config.judge) {
		out << " judge: " << config.judge.value();
	}
	return out;
}
