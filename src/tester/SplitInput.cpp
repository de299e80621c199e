/*
 * SplitInput.cpp
 *
 *  Created on: 2019年4月12日
 */

#include "SplitInput.hpp"
#include "CaseStore.hpp"
#include "ProtectedProcess.hpp"
#include "logger.hpp"

#include <cerrno>
#include <algorithm>
#include <fstream>
#include <memory>

#include <poll.h>
#include <unistd.h>

#include <boost/filesystem.hpp>
#include <kerbal/utility/storage.hpp>

extern std::ofstream log_fp;

namespace
{
	using clock = ProtectedChild::clock;

	std::vector<std::string> split_keep_newline(const std::string & text)
	{
		std::vector<std::string> res;
		std::string::size_type begin = 0;
		while (begin < text.size()) {
			std::string::size_type end = text.find('\n', begin);
			end = end == std::string::npos ? text.size() : end + 1;
			res.push_back(text.substr(begin, end - begin));
			begin = end;
		}
		return res;
	}

	/**
	 * @brief 把一行写入非阻塞的 fd, 管道满时等待, 直到 deadline
	 * @return 程序已不再读取输入或超过 deadline 时返回 false
	 */
	bool send_line(AutoClosedFd & fd, const std::string & line, clock::time_point deadline) noexcept
	{
		size_t written = 0;
		while (written < line.size()) {
			ssize_t res = ::write(fd.get(), line.data() + written, line.size() - written);
			if (res >= 0) {
				written += res;
				continue;
			}
			if (errno == EINTR) {
				continue;
			}
			if (errno != EAGAIN && errno != EWOULDBLOCK) {
				return false;
			}
			if (clock::now() >= deadline) {
				return false;
			}
			struct pollfd pfd = { fd.get(), POLLOUT, 0 };
			::poll(&pfd, 1, 20);
		}
		return true;
	}

	/**
	 * @brief 在 wait 时长内收集程序的标准输出与标准错误
	 */
	void collect_for(ProtectedChild & child, std::chrono::milliseconds wait, CapturedStream & out, CapturedStream & err,
						size_t limit, std::vector<char> & buf) noexcept
	{
		using namespace std::chrono;

		const clock::time_point until = clock::now() + wait;
		while (true) {
			drain_pipe(child.out(), out, limit, buf);
			drain_pipe(child.err(), err, limit, buf);
			milliseconds remain = duration_cast<milliseconds>(until - clock::now());
			if (remain <= milliseconds(0)) {
				return;
			}
			struct pollfd fds[2];
			nfds_t nfds = 0;
			if (child.out().is_open()) {
				fds[nfds++] = { child.out().get(), POLLIN, 0 };
			}
			if (child.err().is_open()) {
				fds[nfds++] = { child.err().get(), POLLIN, 0 };
			}
			::poll(fds, nfds, static_cast<int>(std::min(remain, milliseconds(20)).count()));
		}
	}

	void write_case(const boost::filesystem::path & path, const std::string & content)
	{
		boost::system::error_code ec;
		if (path.has_parent_path()) {
			boost::filesystem::create_directories(path.parent_path(), ec);
		}
		std::ofstream fout(path.native(), std::ios::out | std::ios::binary);
		fout.write(content.data(), content.size());
		fout.close();
		if (!fout) {
			throw CaseLoadException("write " + path.string() + " failed");
		}
	}

} /* namespace */

std::string format_case_index(const std::string & format, size_t index)
{
	std::string res;
	for (size_t i = 0; i < format.size(); ++i) {
		if (format[i] == '%' && i + 1 < format.size()) {
			if (format[i + 1] == 'i') {
				res += std::to_string(index);
				++i;
				continue;
			}
			if (format[i + 1] == '%') {
				res += '%';
				++i;
				continue;
			}
		}
		res += format[i];
	}
	return res;
}

SplitInputReport split_input(const SplitInputOptions & options, const ProcessSpec & command, const RunConfig & config)
{
	using namespace std::chrono;
	using namespace kerbal::utility;
	using clock = ProtectedChild::clock;

	if (options.output_format.find("%i") == std::string::npos) {
		throw CaseLoadException("output format " + options.output_format + ": %i is required");
	}

	const std::vector<std::string> lines = split_keep_newline(read_whole_file(options.input));

	std::string header = options.header;
	if (!header.empty() && header.back() != '\n') {
		header += '\n';
	}
	std::string footer;
	if (options.auto_footer && !lines.empty()) {
		footer = lines.back();
	} else if (options.footer) {
		footer = options.footer.value();
	}

	ignore_sigpipe_once();

	// 整个拆分过程的时限: 每行一个等待间隔, 再加上一次运行的时限
	ProtectedProcessConfig process_config = config.process_config(config.limits, nullptr);
	process_config.set_max_cpu_time(ProtectedProcessConfig::max_cpu_time_type());
	const milliseconds budget = options.interval * static_cast<long long>(lines.size() + 1) + config.limits.time_limit;

	std::unique_ptr<ProtectedChild> child;
	try {
		child.reset(new ProtectedChild(command, process_config));
	} catch (const SpawnFailedException & e) {
		EXCEPT_WARNING(RUN_LEVEL_ID, log_fp, "Split input command spawn failed.", e, " step: ", e.get_step(), " command: ", command);
		throw CaseLoadException(std::string(e.what()) + ": " + command.program());
	}
	LOG_DEBUG(RUN_LEVEL_ID, log_fp, "Split input started, pid: ", child->get_pid(), " lines: ", lines.size());

	child->in().set_nonblock();
	child->out().set_nonblock();
	child->err().set_nonblock();

	const clock::time_point deadline = child->get_start_time() + budget;
	const size_t limit = static_cast<size_t>(storage_cast<Byte>(config.output_limit).count());
	std::vector<char> buf(16 * 1024);
	CapturedStream out, err;

	SplitInputReport report;
	std::string acc;
	size_t index = 0;
	size_t ignore = options.ignore;

	for (const std::string & line : lines) {
		if (ignore > 0) {
			--ignore;
		} else {
			acc += line;
		}
		if (!send_line(child->in(), line, deadline)) {
			LOG_WARNING(RUN_LEVEL_ID, log_fp, "Split input command stopped reading input, pid: ", child->get_pid());
			break;
		}
		collect_for(*child, options.interval, out, err, limit, buf);

		if (out.total_size == 0) {
			continue;
		}
		++index;
		const boost::filesystem::path path(format_case_index(options.output_format, index));
		write_case(path, header + acc + footer);
		LOG_INFO(RUN_LEVEL_ID, log_fp, "Case found: ", index, " saved to: ", path);
		report.written.push_back(path);
		acc.clear();
		out = CapturedStream();
	}

	child->in().close();
	child->terminate(config.kill_grace);
	child->kill_leftovers();

	if (!err.data.empty()) {
		LOG_DEBUG(RUN_LEVEL_ID, log_fp, "Split input command stderr: ", err.display());
	}
	if (!acc.empty()) {
		LOG_WARNING(RUN_LEVEL_ID, log_fp, "Lines after the last case were not saved: ", acc.size(), " bytes");
	}
	report.leftover = std::move(acc);
	return report;
}
