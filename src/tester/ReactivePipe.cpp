/*
 * ReactivePipe.cpp
 *
 *  Created on: 2019年4月7日
 */

#include "ReactivePipe.hpp"
#include "ProtectedProcess.hpp"
#include "TemporaryDirectory.hpp"
#include "logger.hpp"
#include "boost_format_suffix.hpp"

#include <deque>
#include <algorithm>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>
#include <cerrno>

#include <poll.h>
#include <signal.h>
#include <unistd.h>

#include <boost/scope_exit.hpp>
#include <boost/algorithm/string/trim.hpp>

extern std::ofstream log_fp;

namespace
{
	bool write_all(AutoClosedFd & fd, const char * buf, size_t len) noexcept
	{
		while (len > 0) {
			ssize_t res = ::write(fd.get(), buf, len);
			if (res == -1 && errno == EINTR) {
				continue;
			}
			if (res <= 0) {
				return false;
			}
			buf += res;
			len -= res;
		}
		return true;
	}

	/**
	 * @brief 把 from 中读到的数据逐块转发到 to, 同时记录在 capture 中
	 * from 读到文件尾时关闭 to, 使对端读到文件尾; to 的对端已关闭 (EPIPE) 时关闭 from,
	 * 使仍在写的一方收到 SIGPIPE, 视为提前结束。
	 */
	void pump(AutoClosedFd & from, AutoClosedFd & to, CapturedStream & capture, size_t limit,
				const std::atomic<bool> & abandon, std::atomic<int> & finished) noexcept
	{
		char buf[16 * 1024];
		from.set_nonblock();
		while (!abandon) {
			struct pollfd pfd = { from.get(), POLLIN, 0 };
			if (::poll(&pfd, 1, 50) == 0) {
				continue;
			}
			ssize_t n = ::read(from.get(), buf, sizeof(buf));
			if (n == -1 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) {
				continue;
			}
			if (n <= 0) {
				break;
			}
			try {
				capture.append(buf, n, limit);
			} catch (const std::bad_alloc & e) {
				capture.total_size += n;
			}
			if (!write_all(to, buf, n)) {
				break;
			}
		}
		from.close();
		to.close();
		++finished;
	}

	void drain_errors(AutoClosedFd & a, CapturedStream & sa, AutoClosedFd & b, CapturedStream & sb, size_t limit,
						std::vector<char> & buf, const std::atomic<bool> & abandon, std::atomic<int> & finished) noexcept
	{
		a.set_nonblock();
		b.set_nonblock();
		while (!abandon && (a.is_open() || b.is_open())) {
			struct pollfd fds[2];
			nfds_t nfds = 0;
			if (a.is_open()) {
				fds[nfds++] = { a.get(), POLLIN, 0 };
			}
			if (b.is_open()) {
				fds[nfds++] = { b.get(), POLLIN, 0 };
			}
			::poll(fds, nfds, 50);
			drain_pipe(a, sa, limit, buf);
			drain_pipe(b, sb, limit, buf);
		}
		++finished;
	}

	bool failed_on_its_own(const ExecutionResult & candidate) noexcept
	{
		if (candidate.exit_code && candidate.exit_code.value() != 0) {
			return true;
		}
		// judge 已经结束后继续写输出而收到 SIGPIPE 不算失败
		return candidate.term_signal && candidate.term_signal.value() != SIGPIPE;
	}

} /* namespace */

ReactivePipe::ReactivePipe(const RunConfig & config) :
		config(config)
{
}

ReactiveOutcome ReactivePipe::run(const TestCase & test_case, const ProcessSpec & candidate_spec, const CancellationToken * token) const
{
	using namespace std::chrono;
	using clock = ProtectedChild::clock;

	ignore_sigpipe_once();

	ReactiveOutcome outcome;
	outcome.candidate.case_id = test_case.id;
	outcome.judge.case_id = test_case.id;

	if (!config.judge) {
		outcome.comment = "no judge configured";
		return outcome;
	}

	std::unique_ptr<TemporaryDirectory> dir;
	ProcessSpec judge_spec;
	try {
		dir.reset(new TemporaryDirectory("ts_tester-judge"));
		std::vector<std::string> files = { dir->write_file("input.txt", test_case.input).string() };
		if (test_case.expected_output) {
			files.push_back(dir->write_file("expected.txt", test_case.expected_output.value()).string());
		}
		judge_spec = config.judge.value().with_extra_args(files);
	} catch (const std::exception & e) {
		EXCEPT_WARNING(test_case.id, log_fp, "Prepare judge files failed.", e);
		outcome.judge.setup_error = std::string("prepare judge files failed: ") + e.what();
		outcome.comment = outcome.judge.setup_error.value();
		return outcome;
	}

	const Limits & limits = config.limits_for(test_case);
	const ProtectedProcessConfig candidate_config = config.process_config(limits, token);
	ProtectedProcessConfig judge_config(limits.time_limit + config.judge_grace);
	judge_config.set_max_output_size(config.output_limit)
				.set_kill_grace(config.kill_grace)
				.set_cancel_token(token);
	const size_t limit = static_cast<size_t>(config.output_limit.count());

	std::unique_ptr<ProtectedChild> judge;
	try {
		judge.reset(new ProtectedChild(judge_spec, judge_config));
	} catch (const SpawnFailedException & e) {
		EXCEPT_WARNING(test_case.id, log_fp, "Judge spawn failed.", e, " step: ", e.get_step(), " judge: ", judge_spec);
		outcome.judge.setup_error = std::string(e.what()) + ": " + judge_spec.program();
		outcome.comment = "judge failed to start: " + outcome.judge.setup_error.value();
		return outcome;
	}

	std::unique_ptr<ProtectedChild> candidate;
	try {
		candidate.reset(new ProtectedChild(candidate_spec, candidate_config));
	} catch (const SpawnFailedException & e) {
		EXCEPT_WARNING(test_case.id, log_fp, "Candidate spawn failed.", e, " step: ", e.get_step(), " command: ", candidate_spec);
		judge->terminate(config.kill_grace);
		judge->kill_leftovers();
		outcome.candidate.setup_error = std::string(e.what()) + ": " + candidate_spec.program();
		outcome.comment = "program failed to start: " + outcome.candidate.setup_error.value();
		return outcome;
	}
	LOG_DEBUG(test_case.id, log_fp, "Reactive pair started, judge pid: ", judge->get_pid(), " candidate pid: ", candidate->get_pid());

	const clock::time_point pair_start = clock::now();
	const clock::time_point deadline = pair_start + limits.time_limit;

	CapturedStream candidate_out, candidate_err, judge_out, judge_err;
	std::vector<char> err_buf(16 * 1024);
	std::atomic<bool> abandon(false);
	std::atomic<int> finished(0);
	std::deque<std::thread> th_group;

	BOOST_SCOPE_EXIT_ALL(&) {
		// 任何路径离开本函数前都要先杀死两个进程, 否则转发线程可能阻塞在写操作上
		candidate->terminate(milliseconds(0));
		judge->terminate(milliseconds(0));
		candidate->kill_leftovers();
		judge->kill_leftovers();
		abandon = true;
		for (std::thread & th : th_group) {
			if (th.joinable()) {
				th.join();
			}
		}
	};

	try {
		th_group.push_back(std::thread([&]() {
			pump(candidate->out(), judge->in(), candidate_out, limit, abandon, finished);
		}));
		th_group.push_back(std::thread([&]() {
			pump(judge->out(), candidate->in(), judge_out, limit, abandon, finished);
		}));
		th_group.push_back(std::thread([&]() {
			drain_errors(candidate->err(), candidate_err, judge->err(), judge_err, limit, err_buf, abandon, finished);
		}));
	} catch (const std::system_error & e) {
		EXCEPT_FATAL(test_case.id, log_fp, "Create forwarding thread failed.", e);
		outcome.judge.setup_error = std::string("create forwarding thread failed: ") + e.what();
		outcome.comment = outcome.judge.setup_error.value();
		return outcome;
	}

	bool timed_out = false;
	bool cancelled = false;
	bool judge_killed = false;
	bool have_candidate_end = false;
	clock::time_point candidate_end;
	clock::time_point pair_end;

	while (true) {
		const bool candidate_done = candidate->poll_exit();
		const bool judge_done = judge->poll_exit();
		pair_end = clock::now();
		if (candidate_done && judge_done) {
			break;
		}
		if (token != nullptr && token->hard_stop_requested()) {
			cancelled = true;
			break;
		}
		if (!candidate_done) {
			if (pair_end >= deadline) {
				timed_out = true;
				break;
			}
		} else {
			if (!have_candidate_end) {
				have_candidate_end = true;
				candidate_end = pair_end;
			}
			if (pair_end - candidate_end >= config.judge_grace) {
				outcome.deadlock = true;
				break;
			}
		}
		std::this_thread::sleep_for(milliseconds(5));
	}

	judge_killed = !judge->has_exited();
	const bool candidate_killed = !candidate->has_exited();
	candidate->terminate(config.kill_grace);
	judge->terminate(config.kill_grace);
	candidate->kill_leftovers();
	judge->kill_leftovers();

	// 两个进程组都已被清理, 转发线程很快会读到文件尾; 超过时限仍未结束的只可能是脱离了进程组的后代
	const clock::time_point drain_deadline = clock::now() + std::max(config.kill_grace, milliseconds(500));
	while (finished < 3 && clock::now() < drain_deadline) {
		std::this_thread::sleep_for(milliseconds(5));
	}
	abandon = true;
	for (std::thread & th : th_group) {
		th.join();
	}

	ExecutionResult & cand = outcome.candidate;
	ExecutionResult & judge_res = outcome.judge;
	candidate->fill_result(cand, !candidate_killed);
	judge->fill_result(judge_res, !judge_killed);
	cand.output = std::move(candidate_out);
	cand.error_output = std::move(candidate_err);
	judge_res.output = std::move(judge_out);
	judge_res.error_output = std::move(judge_err);

	// 时限对两个进程共同计算, 记在被测程序名下; judge 不退出时只计到被测程序结束, 等待 judge 的时间不算在内
	cand.elapsed = duration_cast<milliseconds>((outcome.deadlock ? candidate_end : pair_end) - pair_start);
	if (timed_out || cand.elapsed > limits.time_limit) {
		cand.timed_out = true;
		ExecutionResult::optional<int> none;
		cand.exit_code = none;
	}
	if (limits.memory_limit && cand.peak_memory > limits.memory_limit.value()) {
		cand.memory_exceeded = true;
	}
	cand.cancelled = cancelled;
	judge_res.cancelled = cancelled;
	judge_res.timed_out = judge_killed && !cancelled;

	const std::string judge_message = boost::algorithm::trim_copy(judge_res.error_output.display());

	if (cancelled) {
		outcome.verdict = Verdict::JUDGE_ERROR;
		outcome.comment = "run stopped";
	} else if (outcome.deadlock) {
		outcome.verdict = Verdict::JUDGE_ERROR;
		outcome.comment = "judge did not exit within %d ms after the program ended"_fmt(config.judge_grace.count()).str();
	} else if (cand.timed_out) {
		outcome.verdict = Verdict::TIME_LIMIT_EXCEEDED;
	} else if (cand.memory_exceeded) {
		outcome.verdict = Verdict::MEMORY_LIMIT_EXCEEDED;
	} else if (judge_res.term_signal) {
		outcome.verdict = Verdict::JUDGE_ERROR;
		outcome.comment = "judge killed by signal %d"_fmt(judge_res.term_signal.value()).str();
	} else if (!judge_res.exit_code) {
		outcome.verdict = Verdict::JUDGE_ERROR;
		outcome.comment = "judge exit status unknown";
	} else {
		const Verdict mapped = config.map_exit_code(judge_res.exit_code.value());
		if ((mapped == Verdict::ACCEPTED || mapped == Verdict::WRONG_ANSWER) && failed_on_its_own(cand)) {
			outcome.verdict = Verdict::RUNTIME_ERROR;
		} else {
			outcome.verdict = mapped;
		}
		outcome.comment = judge_message;
	}

	LOG_DEBUG(test_case.id, log_fp, "Reactive verdict: ", outcome.verdict, " candidate: ", cand, " judge: ", judge_res);
	return outcome;
}
