/*
 * ExecutionResult.hpp
 *
 *  Created on: 2019年4月3日
 */

#ifndef SRC_TESTER_EXECUTIONRESULT_HPP_
#define SRC_TESTER_EXECUTIONRESULT_HPP_

#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>

#include <kerbal/utility/storage.hpp>
#include <kerbal/data_struct/optional/optional.hpp>

/**
 * @brief 捕获的一路输出流。超过上限的部分被丢弃, 但 total_size 始终记录程序实际产生的字节数
 */
struct CapturedStream
{
		std::string data; ///< 保留下来的字节
		size_t total_size; ///< 程序实际写出的字节数

		CapturedStream() : total_size(0)
		{
		}

		bool truncated() const noexcept
		{
			return total_size > data.size();
		}

		/**
		 * @brief 追加数据, 保留的部分不超过 limit 字节
		 */
		void append(const char * buf, size_t len, size_t limit)
		{
			total_size += len;
			if (data.size() < limit) {
				data.append(buf, std::min(len, limit - data.size()));
			}
		}

		/**
		 * @brief 用于展示的文本: 被截断时在末尾附上截断标记
		 */
		std::string display() const;
};

/**
 * @brief 一次程序执行的结果。由 Process Runner 构造后不再修改
 */
struct ExecutionResult
{
		template <typename Type>
		using optional = kerbal::data_struct::optional<Type>;

		std::string case_id;
		CapturedStream output; ///< 标准输出
		CapturedStream error_output; ///< 标准错误
		optional<int> exit_code; ///< 正常退出时的退出码; 超时或被信号终止时为空
		optional<int> term_signal; ///< 被信号终止时的信号编号
		std::chrono::milliseconds elapsed; ///< 墙上时间, 从进程创建开始计
		std::chrono::milliseconds cpu_time;
		kerbal::utility::Byte peak_memory;
		bool timed_out;
		bool memory_exceeded;
		bool cancelled; ///< 因整个运行被强制终止而被杀死
		optional<std::string> setup_error; ///< 程序未能启动 (不存在, 无权限等) 时的原因

		ExecutionResult() :
				elapsed(0), cpu_time(0), peak_memory(0),
				timed_out(false), memory_exceeded(false), cancelled(false)
		{
		}

		bool setup_failed() const noexcept
		{
			return setup_error.has_value();
		}

		/**
		 * @brief 以退出码 0 正常结束, 且没有任何资源越限
		 */
		bool exited_normally() const noexcept
		{
			return !setup_failed() && !timed_out && !memory_exceeded && !cancelled
					&& exit_code.has_value() && exit_code.value() == 0;
		}

		friend std::ostream& operator<<(std::ostream& out, const ExecutionResult & src);
};

#endif /* SRC_TESTER_EXECUTIONRESULT_HPP_ */
