/*
 * ProtectedProcess.cpp
 *
 *  Created on: 2019年4月3日
 */

#include "ProtectedProcess.hpp"

#include "logger.hpp"
#include "boost_format_suffix.hpp"

#include <mutex>
#include <thread>
#include <vector>
#include <cerrno>
#include <cstring>
#include <system_error>

#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/resource.h>

#include <kerbal/compatibility/chrono_suffix.hpp>

extern std::ofstream log_fp;

namespace
{
	/**
	 * @brief 子进程在 exec 之前失败的步骤, 经由状态管道报告给父进程
	 */
	enum SpawnStep
	{
		STEP_SETPGID = 1,
		STEP_RLIMIT,
		STEP_DUP2,
		STEP_CHDIR,
		STEP_EXEC,
	};

	const char * getSpawnStepName(int step) noexcept
	{
		switch (step) {
			case STEP_SETPGID:
				return "setpgid";
			case STEP_RLIMIT:
				return "setrlimit";
			case STEP_DUP2:
				return "dup2";
			case STEP_CHDIR:
				return "chdir";
			case STEP_EXEC:
				return "exec";
		}
		return "unknown step";
	}

	struct rlimit_item
	{
			int resource;
			rlim_t value;
			rlim_t max_value;
	};

	std::vector<rlimit_item> make_rlimits(const ProtectedProcessConfig & config)
	{
		using namespace std::chrono;
		using namespace kerbal::compatibility::chrono_suffix;
		using namespace kerbal::utility;

		std::vector<rlimit_item> res;

		if (config.max_stack) {
			const rlim_t stack = static_cast<rlim_t>(storage_cast<Byte>(config.max_stack.value()).count());
			res.push_back({RLIMIT_STACK, stack, stack});
		}

		// 按地址空间限制时, 只有实际使用量的约一半会体现为常驻内存, 故放宽为两倍
		if (config.max_memory) {
			const rlim_t as = static_cast<rlim_t>(storage_cast<Byte>(config.max_memory.value()).count() * 2);
			res.push_back({RLIMIT_AS, as, as});
		}

		// set cpu time limit (in seconds)
		// 软限制触发 SIGXCPU, 记为超时; 硬限制多留一秒, 仍不结束时由内核发送 SIGKILL
		if (config.max_cpu_time) {
			const rlim_t cpu = static_cast<rlim_t>(duration_cast<seconds>(config.max_cpu_time.value() + 1000_ms).count());
			res.push_back({RLIMIT_CPU, cpu, cpu + 1});
		}

		return res;
	}

	constexpr std::chrono::milliseconds timevalToChrono(const timeval & val) noexcept
	{
		using namespace std::chrono;
		return duration_cast<milliseconds>(seconds(val.tv_sec) + microseconds(val.tv_usec));
	}

	/**
	 * @brief 将 input 中尚未写出的部分尽量写入非阻塞的 fd。写完或对端关闭后关闭 fd
	 */
	void feed(AutoClosedFd & fd, const std::string & input, size_t & written) noexcept
	{
		while (fd.is_open()) {
			if (written >= input.size()) {
				fd.close();
				return;
			}
			ssize_t res = ::write(fd.get(), input.data() + written, input.size() - written);
			if (res >= 0) {
				written += res;
				continue;
			}
			if (errno == EINTR) {
				continue;
			}
			if (errno == EAGAIN || errno == EWOULDBLOCK) {
				return;
			}
			// EPIPE: 程序不再读取输入, 这不是错误
			fd.close();
			return;
		}
	}

} /* namespace */

/**
 * @brief 读空非阻塞的 fd 中当前可读的数据。读到文件尾或出错时关闭 fd
 */
void drain_pipe(AutoClosedFd & fd, CapturedStream & stream, size_t limit, std::vector<char> & buf) noexcept
{
	while (fd.is_open()) {
		ssize_t res = ::read(fd.get(), buf.data(), buf.size());
		if (res > 0) {
			try {
				stream.append(buf.data(), res, limit);
			} catch (const std::bad_alloc & e) {
				stream.total_size += res;
			}
			continue;
		}
		if (res == -1 && errno == EINTR) {
			continue;
		}
		if (res == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
			return;
		}
		fd.close();
		return;
	}
}


ProtectedProcessConfig::ProtectedProcessConfig() :
		ProtectedProcessConfig(std::chrono::milliseconds(2000))
{
}

ProtectedProcessConfig::ProtectedProcessConfig(const max_real_time_type & max_real_time) :
		max_real_time(max_real_time), max_output_size(0), kill_grace(200), cancel_token(nullptr)
{
	using namespace kerbal::utility;
	this->max_output_size = 64_MB;
}


SpawnFailedException::SpawnFailedException(const std::string & step, int error_number) :
		std::runtime_error("%s failed: %s"_fmt(step, std::generic_category().message(error_number)).str()),
		step(step), error_number(error_number)
{
}


ProtectedChild::ProtectedChild(const ProcessSpec & spec, const ProtectedProcessConfig & config) :
		child(), pid(-1), start_time(), end_time(), reaped(false), lost(false), wait_status(0), usage()
{
	if (spec.args.empty()) {
		throw SpawnFailedException("exec", ENOENT);
	}

	// 子进程中 fork 之后只允许调用异步信号安全的函数, 所有需要分配内存的准备工作都在 fork 之前完成
	std::unique_ptr<char*[]> argv = spec.args.getArgs();
	std::unique_ptr<char*[]> envp = spec.env.getArgs();
	const std::string working_dir = spec.working_dir.string();
	const char * wd = working_dir.empty() ? nullptr : working_dir.c_str();
	const bool search_path = spec.search_path;
	const std::vector<rlimit_item> rlimits = make_rlimits(config);

	std::pair<AutoClosedFd, AutoClosedFd> in_pipe, out_pipe, err_pipe, status_pipe;
	try {
		in_pipe = make_cloexec_pipe();
		out_pipe = make_cloexec_pipe();
		err_pipe = make_cloexec_pipe();
		status_pipe = make_cloexec_pipe();
	} catch (const std::system_error & e) {
		throw SpawnFailedException("pipe", e.code().value());
	}

	const int child_in = in_pipe.first.get();
	const int child_out = out_pipe.second.get();
	const int child_err = err_pipe.second.get();
	const int status_fd = status_pipe.second.get();

	try {
		process([&]() noexcept {
			auto report = [status_fd](int step) {
				int record[2] = { step, errno };
				ssize_t ignored = ::write(status_fd, record, sizeof(record));
				(void) ignored;
				_exit(127);
			};

			if (setpgid(0, 0) == -1) {
				report(STEP_SETPGID);
			}

			for (const rlimit_item & item : rlimits) {
				struct rlimit lim = {
					.rlim_cur = item.value,
					.rlim_max = item.max_value,
				};
				if (setrlimit(item.resource, &lim) != 0) {
					report(STEP_RLIMIT);
				}
			}

			// redirect pipes -> stdin, stdout, stderr
			if (dup2(child_in, STDIN_FILENO) == -1 || dup2(child_out, STDOUT_FILENO) == -1 || dup2(child_err, STDERR_FILENO) == -1) {
				report(STEP_DUP2);
			}

			if (wd != nullptr && chdir(wd) == -1) {
				report(STEP_CHDIR);
			}

			signal(SIGPIPE, SIG_DFL);

			if (search_path) {
				execvpe(argv[0], argv.get(), envp.get());
			} else {
				execve(argv[0], argv.get(), envp.get());
			}
			report(STEP_EXEC);
		}).swap(this->child);
	} catch (const std::exception & e) {
		throw SpawnFailedException("fork", errno);
	}

	this->start_time = clock::now();
	this->pid = child.get_child_id();
	// 父进程同样设置一次, 保证随后发出的 kill(-pid) 不会早于子进程的 setpgid
	setpgid(pid, pid);

	// 关闭父进程持有的子进程一端, 否则子进程退出后读端收不到文件尾
	in_pipe.first.close();
	out_pipe.second.close();
	err_pipe.second.close();
	status_pipe.second.close();

	int record[2] = { 0, 0 };
	ssize_t n;
	do {
		n = ::read(status_pipe.first.get(), record, sizeof(record));
	} while (n == -1 && errno == EINTR);

	if (n == static_cast<ssize_t>(sizeof(record))) {
		// exec 成功时状态管道因 close-on-exec 被关闭, 读到的是文件尾
		this->wait();
		throw SpawnFailedException(getSpawnStepName(record[0]), record[1]);
	}

	this->stdin_fd = std::move(in_pipe.second);
	this->stdout_fd = std::move(out_pipe.first);
	this->stderr_fd = std::move(err_pipe.first);
}

ProtectedChild::~ProtectedChild() noexcept
{
	if (!reaped) {
		child.kill_group(SIGKILL);
		child.kill(SIGKILL);
		this->wait();
	}
}

void ProtectedChild::on_reaped() noexcept
{
	this->reaped = true;
	this->end_time = clock::now();
}

bool ProtectedChild::poll_exit() noexcept
{
	if (reaped) {
		return true;
	}
	pid_t res = child.join(&wait_status, WNOHANG, &usage);
	if (res == 0) {
		return false;
	}
	if (res == -1) {
		this->lost = true;
	}
	this->on_reaped();
	return true;
}

void ProtectedChild::wait() noexcept
{
	if (reaped) {
		return;
	}
	if (child.join(&wait_status, 0, &usage) == -1) {
		this->lost = true;
	}
	this->on_reaped();
}

void ProtectedChild::terminate(std::chrono::milliseconds grace) noexcept
{
	if (reaped) {
		return;
	}
	child.kill_group(SIGTERM);
	child.kill(SIGTERM);

	const clock::time_point deadline = clock::now() + grace;
	while (clock::now() < deadline) {
		if (this->poll_exit()) {
			return;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(5));
	}

	child.kill_group(SIGKILL);
	child.kill(SIGKILL);
	this->wait();
}

void ProtectedChild::kill_leftovers() noexcept
{
	if (pid > 0) {
		::kill(-pid, SIGKILL);
	}
}

std::chrono::milliseconds ProtectedChild::elapsed() const noexcept
{
	using namespace std::chrono;
	return duration_cast<milliseconds>((reaped ? end_time : clock::now()) - start_time);
}

void ProtectedChild::fill_result(ExecutionResult & result, bool keep_exit_code) const
{
	result.elapsed = this->elapsed();
	if (!reaped) {
		return;
	}
	if (lost) {
		result.setup_error = std::string("lost track of child process ") + std::to_string(pid);
		return;
	}

	result.cpu_time = timevalToChrono(usage.ru_utime) + timevalToChrono(usage.ru_stime);
	result.peak_memory = kerbal::utility::KB(usage.ru_maxrss);

	if (WIFEXITED(wait_status) && keep_exit_code) {
		result.exit_code = WEXITSTATUS(wait_status);
	}
	if (WIFSIGNALED(wait_status)) {
		result.term_signal = WTERMSIG(wait_status);
	}
}


void ignore_sigpipe_once()
{
	static std::once_flag flag;
	std::call_once(flag, []() {
		signal(SIGPIPE, SIG_IGN);
	});
}

ExecutionResult protected_process(const std::string & case_id, const ProcessSpec & spec, const std::string & input,
									const ProtectedProcessConfig & config)
{
	using namespace std::chrono;
	using namespace kerbal::utility;

	ignore_sigpipe_once();

	ExecutionResult result;
	result.case_id = case_id;

	std::unique_ptr<ProtectedChild> child;
	try {
		child.reset(new ProtectedChild(spec, config));
	} catch (const SpawnFailedException & e) {
		EXCEPT_WARNING(case_id, log_fp, "Spawn failed.", e, " step: ", e.get_step(), " errno: ", e.get_errno(), " program: ", spec);
		result.setup_error = std::string(e.what()) + ": " + spec.program();
		return result;
	}
	LOG_DEBUG(case_id, log_fp, "Spawned: ", spec, " pid: ", child->get_pid());

	child->in().set_nonblock();
	child->out().set_nonblock();
	child->err().set_nonblock();

	const size_t limit = static_cast<size_t>(storage_cast<Byte>(config.max_output_size).count());
	const ProtectedChild::clock::time_point deadline = child->get_start_time() + config.max_real_time;
	std::vector<char> buf(64 * 1024);
	size_t written = 0;
	bool killed_by_deadline = false;
	bool killed_by_cancel = false;

	feed(child->in(), input, written);

	while (true) {
		struct pollfd fds[3];
		AutoClosedFd * owners[3];
		nfds_t nfds = 0;
		if (child->in().is_open()) {
			fds[nfds] = { child->in().get(), POLLOUT, 0 };
			owners[nfds++] = &child->in();
		}
		if (child->out().is_open()) {
			fds[nfds] = { child->out().get(), POLLIN, 0 };
			owners[nfds++] = &child->out();
		}
		if (child->err().is_open()) {
			fds[nfds] = { child->err().get(), POLLIN, 0 };
			owners[nfds++] = &child->err();
		}

		milliseconds remain = duration_cast<milliseconds>(deadline - ProtectedChild::clock::now());
		milliseconds slice = std::max(milliseconds(0), std::min(milliseconds(20), remain));
		int ready = ::poll(fds, nfds, static_cast<int>(slice.count()));

		if (ready > 0) {
			for (nfds_t i = 0; i < nfds; ++i) {
				if (fds[i].revents == 0) {
					continue;
				}
				if (owners[i] == &child->in()) {
					feed(child->in(), input, written);
				} else if (owners[i] == &child->out()) {
					drain_pipe(child->out(), result.output, limit, buf);
				} else {
					drain_pipe(child->err(), result.error_output, limit, buf);
				}
			}
		}

		if (child->poll_exit()) {
			break;
		}
		if (ProtectedChild::clock::now() >= deadline) {
			killed_by_deadline = true;
			LOG_INFO(case_id, log_fp, "Time limit reached, terminating pid: ", child->get_pid());
			child->terminate(config.kill_grace);
			break;
		}
		if (config.hard_stop_requested()) {
			killed_by_cancel = true;
			LOG_INFO(case_id, log_fp, "Hard stop requested, terminating pid: ", child->get_pid());
			child->terminate(config.kill_grace);
			break;
		}
	}

	// 后代进程可能仍持有输出管道, 杀死后读尽剩余的输出
	child->in().close();
	child->kill_leftovers();
	const ProtectedChild::clock::time_point drain_deadline = ProtectedChild::clock::now()
			+ std::max(config.kill_grace, milliseconds(100));
	while ((child->out().is_open() || child->err().is_open()) && ProtectedChild::clock::now() < drain_deadline) {
		struct pollfd fds[2];
		nfds_t nfds = 0;
		if (child->out().is_open()) {
			fds[nfds++] = { child->out().get(), POLLIN, 0 };
		}
		if (child->err().is_open()) {
			fds[nfds++] = { child->err().get(), POLLIN, 0 };
		}
		::poll(fds, nfds, 10);
		drain_pipe(child->out(), result.output, limit, buf);
		drain_pipe(child->err(), result.error_output, limit, buf);
	}

	child->fill_result(result, !killed_by_deadline && !killed_by_cancel);

	if (killed_by_deadline) {
		result.timed_out = true;
	} else if (killed_by_cancel) {
		result.cancelled = true;
	} else {
		// 墙上时间越限总是判为超时, 即便程序恰好以 0 退出。CPU 时间只由 RLIMIT_CPU 兜底
		bool over_time = result.elapsed > config.max_real_time;
		if (result.term_signal && result.term_signal.value() == SIGXCPU) {
			over_time = true;
		}
		if (over_time) {
			result.timed_out = true;
			ExecutionResult::optional<int> none;
			result.exit_code = none;
		}
	}

	if (config.max_memory && result.peak_memory > config.max_memory.value()) {
		result.memory_exceeded = true;
	}

	LOG_DEBUG(case_id, log_fp, "Finished: ", result);
	return result;
}
