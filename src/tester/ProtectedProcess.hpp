/*
 * ProtectedProcess.hpp
 *
 *  Created on: 2019年4月3日
 */

#ifndef SRC_TESTER_PROTECTEDPROCESS_HPP_
#define SRC_TESTER_PROTECTEDPROCESS_HPP_

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <stdexcept>

#include <sys/resource.h>

#include <kerbal/data_struct/optional/optional.hpp>
#include <kerbal/utility/noncopyable.hpp>
#include <kerbal/utility/storage.hpp>

#include "process.hpp"
#include "AutoClosedFd.hpp"
#include "ProcessSpec.hpp"
#include "ExecutionResult.hpp"
#include "CancellationToken.hpp"

class ProtectedProcessConfig
{
	public:

		template <typename Type>
		using optional = kerbal::data_struct::optional<Type>;

		using max_real_time_type = std::chrono::milliseconds;
		max_real_time_type max_real_time; ///< 墙上时间限制, 从进程创建开始计

		using raw_max_cpu_time_type = std::chrono::milliseconds;
		using max_cpu_time_type = optional<raw_max_cpu_time_type>;
		max_cpu_time_type max_cpu_time; ///< 最大 CPU 时间限制

		using raw_max_memory_type = kerbal::utility::Byte;
		using max_memory_type = optional<raw_max_memory_type>;
		max_memory_type max_memory; ///< 储存空间的最大字节长度

		using raw_max_stack_type = kerbal::utility::Byte;
		using max_stack_type = optional<raw_max_stack_type>;
		max_stack_type max_stack; ///< 栈的最大字节长度

		using max_output_size_type = kerbal::utility::Byte;
		max_output_size_type max_output_size; ///< 每一路输出流保留的最大字节数, 超出部分只计数不保留

		std::chrono::milliseconds kill_grace; ///< SIGTERM 之后等待多久再发送 SIGKILL

		const CancellationToken * cancel_token; ///< 为空时不响应强制终止

		ProtectedProcessConfig();

		explicit ProtectedProcessConfig(const max_real_time_type & max_real_time);

		/// set max real time
		ProtectedProcessConfig& set_max_real_time(const max_real_time_type & max_real_time)
		{
			this->max_real_time = max_real_time;
			return *this;
		}

		/// set max cpu time
		ProtectedProcessConfig& set_max_cpu_time(const max_cpu_time_type & max_cpu_time)
		{
			this->max_cpu_time = max_cpu_time;
			return *this;
		}

		ProtectedProcessConfig& set_max_cpu_time(const raw_max_cpu_time_type & max_cpu_time)
		{
			this->max_cpu_time = max_cpu_time;
			return *this;
		}

		/// set max memory
		ProtectedProcessConfig& set_max_memory(const max_memory_type & max_memory)
		{
			this->max_memory = max_memory;
			return *this;
		}

		ProtectedProcessConfig& set_max_memory(const raw_max_memory_type & max_memory)
		{
			this->max_memory = max_memory;
			return *this;
		}

		/// set max stack
		ProtectedProcessConfig& set_max_stack(const raw_max_stack_type & max_stack)
		{
			this->max_stack = max_stack;
			return *this;
		}

		/// set max output size
		ProtectedProcessConfig& set_max_output_size(const max_output_size_type & max_output_size)
		{
			this->max_output_size = max_output_size;
			return *this;
		}

		ProtectedProcessConfig& set_kill_grace(const std::chrono::milliseconds & kill_grace)
		{
			this->kill_grace = kill_grace;
			return *this;
		}

		ProtectedProcessConfig& set_cancel_token(const CancellationToken * cancel_token)
		{
			this->cancel_token = cancel_token;
			return *this;
		}

		bool hard_stop_requested() const noexcept
		{
			return cancel_token != nullptr && cancel_token->hard_stop_requested();
		}
};


/**
 * @brief 子进程未能启动 (fork, pipe, exec 等步骤失败)
 */
class SpawnFailedException : public std::runtime_error
{
	private:
		std::string step;
		int error_number;

	public:
		SpawnFailedException(const std::string & step, int error_number);

		const std::string & get_step() const noexcept
		{
			return step;
		}

		int get_errno() const noexcept
		{
			return error_number;
		}
};


/**
 * @brief 一个受保护的子进程: 独立的进程组, 资源限制, 以及接到其标准输入输出上的三根管道
 * 析构时若子进程尚未被回收, 会杀死整个进程组并回收。
 */
class ProtectedChild : kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	public:
		using clock = std::chrono::steady_clock;

	private:
		process child;
		pid_t pid;
		AutoClosedFd stdin_fd;
		AutoClosedFd stdout_fd;
		AutoClosedFd stderr_fd;
		clock::time_point start_time;
		clock::time_point end_time;
		bool reaped;
		bool lost; ///< wait4 失败, 无法得知子进程的结束状态
		int wait_status;
		struct rusage usage;

		void on_reaped() noexcept;

	public:
		/**
		 * @brief 创建子进程并执行给定的程序
		 * @throws SpawnFailedException 管道创建, fork, 资源限制设置或 exec 失败
		 */
		ProtectedChild(const ProcessSpec & spec, const ProtectedProcessConfig & config);

		~ProtectedChild() noexcept;

		pid_t get_pid() const noexcept
		{
			return pid;
		}

		/// 子进程的标准输入 (写端)
		AutoClosedFd & in() noexcept
		{
			return stdin_fd;
		}

		/// 子进程的标准输出 (读端)
		AutoClosedFd & out() noexcept
		{
			return stdout_fd;
		}

		/// 子进程的标准错误 (读端)
		AutoClosedFd & err() noexcept
		{
			return stderr_fd;
		}

		bool has_exited() const noexcept
		{
			return reaped;
		}

		/**
		 * @brief 非阻塞地检查子进程是否已结束, 已结束则回收
		 * @return 子进程是否已被回收
		 */
		bool poll_exit() noexcept;

		/**
		 * @brief 阻塞等待子进程结束
		 */
		void wait() noexcept;

		/**
		 * @brief 向进程组发送 SIGTERM, 等待 grace 后仍未结束则发送 SIGKILL, 最终回收子进程
		 */
		void terminate(std::chrono::milliseconds grace) noexcept;

		/**
		 * @brief 子进程已回收但其后代可能仍持有管道, 杀死进程组中的残余进程
		 */
		void kill_leftovers() noexcept;

		clock::time_point get_start_time() const noexcept
		{
			return start_time;
		}

		/**
		 * @brief 从创建到回收 (尚未回收时到现在) 经过的墙上时间
		 */
		std::chrono::milliseconds elapsed() const noexcept;

		/**
		 * @brief 将退出码, 信号, 时间与内存写入 result
		 * @param keep_exit_code 为 false 时 (超时或被取消) 不记录退出码
		 */
		void fill_result(ExecutionResult & result, bool keep_exit_code) const;
};

/**
 * @brief 读空非阻塞的 fd 中当前可读的数据, 存入 stream (最多保留 limit 字节)。读到文件尾或出错时关闭 fd
 */
void drain_pipe(AutoClosedFd & fd, CapturedStream & stream, size_t limit, std::vector<char> & buf) noexcept;

/**
 * @brief 忽略 SIGPIPE, 使对已退出子进程的写入以 EPIPE 的形式返回。仅在第一次调用时生效
 */
void ignore_sigpipe_once();

/**
 * @brief 在保护下运行一个程序: 写入 input, 捕获标准输出与标准错误, 在超时或被强制终止时杀死进程组
 * 程序无法启动时不抛出异常, 而在返回值的 setup_error 中给出原因。
 * @param case_id 用于日志的测试用例编号
 */
ExecutionResult protected_process(const std::string & case_id, const ProcessSpec & spec, const std::string & input,
									const ProtectedProcessConfig & config);

#endif /* SRC_TESTER_PROTECTEDPROCESS_HPP_ */
