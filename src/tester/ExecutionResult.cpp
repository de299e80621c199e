/*
 * ExecutionResult.cpp
 *
 *  Created on: 2019年4月3日
 */

#include "ExecutionResult.hpp"
#include "boost_format_suffix.hpp"

std::string CapturedStream::display() const
{
	if (!this->truncated()) {
		return data;
	}
	return data + "[... truncated, %d of %d bytes shown]"_fmt(data.size(), total_size).str();
}

std::ostream& operator<<(std::ostream& out, const ExecutionResult & src)
{
	if (src.setup_failed()) {
		return out << "setup_error: " << src.setup_error.value();
	}
	out << "elapsed: " << src.elapsed.count() << " ms"
		<< " cpu_time: " << src.cpu_time.count() << " ms"
		<< " memory: " << src.peak_memory.count() << " Byte";
	if (src.exit_code.has_value()) {
		out << " exit_code: " << src.exit_code.value();
	}
	if (src.term_signal.has_value()) {
		out << " signal: " << src.term_signal.value();
	}
	if (src.timed_out) {
		out << " timed_out";
	}
	if (src.memory_exceeded) {
		out << " memory_exceeded";
	}
	if (src.cancelled) {
		out << " cancelled";
	}
	return out << " stdout: " << src.output.total_size << " Byte" << (src.output.truncated() ? " (truncated)" : "")
				<< " stderr: " << src.error_output.total_size << " Byte" << (src.error_output.truncated() ? " (truncated)" : "");
}
