/*
 * SpecialJudge.cpp
 *
 *  Created on: 2019年4月6日
 */

#include "SpecialJudge.hpp"
#include "ProtectedProcess.hpp"
#include "TemporaryDirectory.hpp"
#include "logger.hpp"
#include "boost_format_suffix.hpp"

#include <vector>

#include <boost/algorithm/string/trim.hpp>

extern std::ofstream log_fp;

SpecialJudge::SpecialJudge(const RunConfig & config) :
		config(config)
{
}

CheckResult SpecialJudge::check(const TestCase & test_case, const std::string & produced, const CancellationToken * token) const
{
	CheckResult res;
	res.verdict = Verdict::JUDGE_ERROR;

	if (!config.checker) {
		res.comment = "no checker configured";
		return res;
	}

	try {
		TemporaryDirectory dir("ts_tester-checker");
		std::vector<std::string> files = {
			dir.write_file("input.txt", test_case.input).string(),
			dir.write_file("output.txt", produced).string(),
		};
		if (test_case.expected_output) {
			files.push_back(dir.write_file("expected.txt", test_case.expected_output.value()).string());
		}
		const ProcessSpec spec = config.checker.value().with_extra_args(files);

		ProtectedProcessConfig checker_config(config.checker_time_limit);
		checker_config.set_max_output_size(config.output_limit)
						.set_kill_grace(config.kill_grace)
						.set_cancel_token(token);

		res.checker_result = protected_process(test_case.id, spec, "", checker_config);
	} catch (const std::exception & e) {
		EXCEPT_WARNING(test_case.id, log_fp, "Prepare checker files failed.", e);
		res.comment = std::string("prepare checker files failed: ") + e.what();
		return res;
	}

	const ExecutionResult & checker_result = res.checker_result;
	res.comment = boost::algorithm::trim_copy(checker_result.output.display() + checker_result.error_output.display());

	if (checker_result.setup_failed()) {
		res.comment = "checker failed to start: " + checker_result.setup_error.value();
		return res;
	}
	if (checker_result.cancelled) {
		res.comment = "checker cancelled";
		return res;
	}
	if (checker_result.timed_out) {
		res.comment = "checker exceeded its time limit of %d ms"_fmt(config.checker_time_limit.count()).str();
		return res;
	}
	if (checker_result.term_signal) {
		res.comment = "checker killed by signal %d"_fmt(checker_result.term_signal.value()).str();
		return res;
	}
	if (!checker_result.exit_code) {
		res.comment = "checker exit status unknown";
		return res;
	}

	res.verdict = config.map_exit_code(checker_result.exit_code.value());
	LOG_DEBUG(test_case.id, log_fp, "Checker exit code: ", checker_result.exit_code.value(), " verdict: ", res.verdict);
	return res;
}
