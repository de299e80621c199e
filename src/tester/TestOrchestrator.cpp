/*
 * TestOrchestrator.cpp
 *
 *  Created on: 2019年4月8日
 */

#include "TestOrchestrator.hpp"
#include "ProtectedProcess.hpp"
#include "ReactivePipe.hpp"
#include "SpecialJudge.hpp"
#include "compare.hpp"
#include "logger.hpp"

#include <deque>
#include <mutex>
#include <future>
#include <algorithm>

extern std::ofstream log_fp;

bool RunSummary::all_accepted() const noexcept
{
	if (hard_stopped || !skipped.empty()) {
		return false;
	}
	return std::all_of(reports.begin(), reports.end(), [](const CaseReport & report) {
		return report.verdict == Verdict::ACCEPTED;
	});
}

Verdict derive_verdict(const ExecutionResult & result, bool matched) noexcept
{
	if (result.setup_failed() || result.cancelled) {
		return Verdict::JUDGE_ERROR;
	}
	if (result.timed_out) {
		return Verdict::TIME_LIMIT_EXCEEDED;
	}
	if (result.memory_exceeded) {
		return Verdict::MEMORY_LIMIT_EXCEEDED;
	}
	if (result.term_signal || !result.exit_code || result.exit_code.value() != 0) {
		return Verdict::RUNTIME_ERROR;
	}
	return matched ? Verdict::ACCEPTED : Verdict::WRONG_ANSWER;
}

TestOrchestrator::TestOrchestrator(const RunConfig & config) :
		config(config), token()
{
}

CaseReport TestOrchestrator::run_case(size_t index, const TestCase & test_case, const ProcessSpec & candidate)
{
	CaseReport report;
	report.index = index;
	report.case_id = test_case.id;
	report.result.case_id = test_case.id;

	if (token.hard_stop_requested()) {
		report.result.cancelled = true;
		report.verdict = Verdict::JUDGE_ERROR;
		report.comment = "run stopped";
		return report;
	}

	try {
		if (config.reactive()) {
			ReactiveOutcome outcome = ReactivePipe(config).run(test_case, candidate, &token);
			report.result = std::move(outcome.candidate);
			report.judge_result = std::move(outcome.judge);
			report.verdict = outcome.verdict;
			report.comment = std::move(outcome.comment);
			return report;
		}

		const Limits & limits = config.limits_for(test_case);
		report.result = protected_process(test_case.id, candidate, test_case.input, config.process_config(limits, &token));
		const ExecutionResult & result = report.result;

		bool matched = false;
		if (result.exited_normally()) {
			const bool use_checker = config.policy == ComparePolicy::EXTERNAL_CHECKER || !test_case.expected_output;
			if (result.output.truncated()) {
				report.comment = "output truncated";
			} else if (use_checker) {
				CheckResult check = SpecialJudge(config).check(test_case, result.output.data, &token);
				report.comment = std::move(check.comment);
				if (check.verdict == Verdict::JUDGE_ERROR) {
					report.verdict = Verdict::JUDGE_ERROR;
					return report;
				}
				matched = check.verdict == Verdict::ACCEPTED;
			} else {
				std::string produced = result.output.data;
				std::string expected = test_case.expected_output.value();
				if (config.rstrip) {
					produced = rstrip_copy(produced);
					expected = rstrip_copy(expected);
				}
				matched = compare(produced, expected, config.policy, config.epsilon);
				if (!matched) {
					report.comment = describe_mismatch(produced, expected, config.policy, config.epsilon);
				}
			}
		} else if (result.setup_failed()) {
			report.comment = "failed to start: " + result.setup_error.value();
		} else if (result.term_signal) {
			report.comment = "killed by signal " + std::to_string(result.term_signal.value());
		} else if (result.exit_code) {
			report.comment = "exit code " + std::to_string(result.exit_code.value());
		}
		report.verdict = derive_verdict(result, matched);
	} catch (const std::exception & e) {
		EXCEPT_FATAL(test_case.id, log_fp, "Run case failed.", e);
		report.verdict = Verdict::JUDGE_ERROR;
		report.comment = e.what();
	}
	return report;
}

RunSummary TestOrchestrator::run(const std::vector<TestCase> & cases, const ProcessSpec & candidate, const observer_type & observer)
{
	config.validate(cases);
	token.reset();
	LOG_INFO(RUN_LEVEL_ID, log_fp, "Run started. cases: ", cases.size(), " command: ", candidate, " ", config);

	const size_t total = cases.size();
	std::vector<CaseReport> slots(total);
	std::vector<bool> done(total, false);
	std::mutex dispatch_mtx;
	std::mutex collect_mtx;
	size_t next = 0;

	auto worker = [&]() {
		while (true) {
			size_t index;
			{
				std::lock_guard<std::mutex> lck(dispatch_mtx);
				if (token.stop_requested() || next >= total) {
					return;
				}
				index = next++;
			}

			CaseReport report = run_case(index, cases[index], candidate);
			LOG_INFO(report.case_id, log_fp, "Verdict: ", report.verdict, " ", report.result);

			std::lock_guard<std::mutex> lck(collect_mtx);
			if (report.verdict != Verdict::ACCEPTED && config.fail_fast) {
				if (config.hard_stop) {
					token.request_hard_stop();
				} else {
					token.request_stop();
				}
			}
			slots[index] = std::move(report);
			done[index] = true;
			if (observer) {
				try {
					observer(slots[index]);
				} catch (const std::exception & e) {
					EXCEPT_WARNING(slots[index].case_id, log_fp, "Observer failed.", e);
				}
			}
		}
	};

	std::deque<std::future<void> > future_group;
	const size_t worker_num = std::min(total, static_cast<size_t>(config.concurrency));
	try {
		for (size_t i = 0; i < worker_num; ++i) {
			future_group.push_back(std::async(std::launch::async, worker));
		}
	} catch (const std::system_error & e) {
		EXCEPT_WARNING(RUN_LEVEL_ID, log_fp, "Start worker failed.", e, " started: ", future_group.size());
		if (future_group.empty()) {
			worker();
		}
	}

	while (!future_group.empty()) {
		try {
			future_group.front().get();
		} catch (const std::exception & e) {
			EXCEPT_FATAL(RUN_LEVEL_ID, log_fp, "Worker failed.", e);
		}
		future_group.pop_front();
	}

	RunSummary summary;
	summary.hard_stopped = token.hard_stop_requested();
	for (size_t i = 0; i < total; ++i) {
		if (!done[i]) {
			summary.skipped.push_back(cases[i].id);
			continue;
		}
		++summary.counts[static_cast<size_t>(slots[i].verdict)];
		summary.reports.push_back(std::move(slots[i]));
	}

	LOG_INFO(RUN_LEVEL_ID, log_fp, "Run finished. reported: ", summary.reports.size(), " skipped: ", summary.skipped.size(),
				" accepted: ", summary.count(Verdict::ACCEPTED));
	return summary;
}
