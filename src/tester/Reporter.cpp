/*
 * Reporter.cpp
 *
 *  Created on: 2019年4月10日
 */

#include "Reporter.hpp"
#include "boost_format_suffix.hpp"

namespace
{
	constexpr size_t MAX_SHOWN_BYTES = 4096;

	std::string excerpt(const std::string & s)
	{
		if (s.size() <= MAX_SHOWN_BYTES) {
			return s;
		}
		return s.substr(0, MAX_SHOWN_BYTES) + "\n[... %d more bytes]"_fmt(s.size() - MAX_SHOWN_BYTES).str();
	}

	void print_block(const char * title, const std::string & content)
	{
		std::cout << title << ":" << std::endl;
		std::cout << excerpt(content);
		if (!content.empty() && content.back() != '\n') {
			std::cout << std::endl;
		}
	}

} /* namespace */

ConsoleReporter::ConsoleReporter(const std::vector<TestCase> & cases, bool silent) :
		cases(cases), silent(silent), finished(0),
		accepted_stream(kerbal::utility::costream::GREEN),
		wrong_answer_stream(kerbal::utility::costream::RED),
		time_limit_stream(kerbal::utility::costream::YELLOW),
		memory_limit_stream(kerbal::utility::costream::LIGHT_YELLOW),
		runtime_error_stream(kerbal::utility::costream::PURPLE),
		judge_error_stream(kerbal::utility::costream::LIGHT_RED)
{
}

const kerbal::utility::costream::costream<std::cout> & ConsoleReporter::stream_of(Verdict verdict) const noexcept
{
	switch (verdict) {
		case Verdict::ACCEPTED:
			return accepted_stream;
		case Verdict::WRONG_ANSWER:
			return wrong_answer_stream;
		case Verdict::TIME_LIMIT_EXCEEDED:
			return time_limit_stream;
		case Verdict::MEMORY_LIMIT_EXCEEDED:
			return memory_limit_stream;
		case Verdict::RUNTIME_ERROR:
			return runtime_error_stream;
		case Verdict::JUDGE_ERROR:
			return judge_error_stream;
	}
	return judge_error_stream;
}

void ConsoleReporter::on_case(const CaseReport & report)
{
	++finished;
	const ExecutionResult & result = report.result;

	std::cout << "[%d/%d] %s "_fmt(finished, cases.size(), report.case_id).str();
	stream_of(report.verdict) << getVerdictAbbr(report.verdict);
	std::cout << "  %d ms  %d KB"_fmt(result.elapsed.count(), result.peak_memory.count() / 1024).str() << std::endl;

	if (result.output.truncated()) {
		std::cout << "  stdout truncated: %d of %d bytes kept"_fmt(result.output.data.size(), result.output.total_size).str() << std::endl;
	}
	if (result.error_output.truncated()) {
		std::cout << "  stderr truncated: %d of %d bytes kept"_fmt(result.error_output.data.size(), result.error_output.total_size).str() << std::endl;
	}
	if (!report.comment.empty()) {
		std::cout << "  " << report.comment << std::endl;
	}

	if (!silent && (report.verdict == Verdict::WRONG_ANSWER || report.verdict == Verdict::RUNTIME_ERROR)) {
		this->print_diagnostics(report);
	}
}

void ConsoleReporter::print_diagnostics(const CaseReport & report) const
{
	const ExecutionResult & result = report.result;
	print_block("output", result.output.display());
	if (report.index < cases.size() && cases[report.index].expected_output) {
		print_block("expected", cases[report.index].expected_output.value());
	}
	if (!result.error_output.data.empty()) {
		print_block("stderr", result.error_output.display());
	}
}

void ConsoleReporter::on_summary(const RunSummary & summary) const
{
	std::cout << std::endl;
	for (int i = 0; i < VERDICT_KIND_NUM; ++i) {
		const Verdict verdict = static_cast<Verdict>(i);
		if (summary.count(verdict) == 0) {
			continue;
		}
		stream_of(verdict) << getVerdictAbbr(verdict);
		std::cout << ": " << summary.count(verdict) << std::endl;
	}
	if (!summary.skipped.empty()) {
		std::cout << "skipped: " << summary.skipped.size() << std::endl;
	}
	if (summary.hard_stopped) {
		std::cout << "run was stopped" << std::endl;
	}

	if (summary.all_accepted()) {
		accepted_stream << "test success: " << summary.reports.size() << " cases" << std::endl;
	} else {
		wrong_answer_stream << "test failed: " << summary.count(Verdict::ACCEPTED) << " AC / " << summary.reports.size() + summary.skipped.size()
							<< " cases" << std::endl;
	}
}

nlohmann::json to_json(const ExecutionResult & result)
{
	nlohmann::json obj;
	obj["elapsed_ms"] = result.elapsed.count();
	obj["cpu_time_ms"] = result.cpu_time.count();
	obj["peak_memory_bytes"] = result.peak_memory.count();
	obj["exit_code"] = result.exit_code ? nlohmann::json(result.exit_code.value()) : nlohmann::json();
	obj["signal"] = result.term_signal ? nlohmann::json(result.term_signal.value()) : nlohmann::json();
	obj["timed_out"] = result.timed_out;
	obj["memory_exceeded"] = result.memory_exceeded;
	obj["cancelled"] = result.cancelled;
	obj["stdout_bytes"] = result.output.total_size;
	obj["stdout_truncated"] = result.output.truncated();
	obj["stderr_bytes"] = result.error_output.total_size;
	obj["stderr_truncated"] = result.error_output.truncated();
	if (result.setup_error) {
		obj["setup_error"] = result.setup_error.value();
	}
	return obj;
}

nlohmann::json to_json(const CaseReport & report)
{
	nlohmann::json obj;
	obj["index"] = report.index;
	obj["id"] = report.case_id;
	obj["verdict"] = getVerdictAbbr(report.verdict);
	obj["comment"] = report.comment;
	obj["result"] = to_json(report.result);
	if (report.judge_result) {
		obj["judge_result"] = to_json(report.judge_result.value());
	}
	return obj;
}

nlohmann::json to_json(const RunSummary & summary)
{
	nlohmann::json obj;
	obj["cases"] = nlohmann::json::array();
	for (const CaseReport & report : summary.reports) {
		obj["cases"].push_back(to_json(report));
	}
	nlohmann::json counts = nlohmann::json::object();
	for (int i = 0; i < VERDICT_KIND_NUM; ++i) {
		const Verdict verdict = static_cast<Verdict>(i);
		counts[getVerdictAbbr(verdict)] = summary.count(verdict);
	}
	obj["counts"] = counts;
	obj["skipped"] = summary.skipped;
	obj["hard_stopped"] = summary.hard_stopped;
	obj["all_accepted"] = summary.all_accepted();
	return obj;
}
