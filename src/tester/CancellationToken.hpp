/*
 * CancellationToken.hpp
 *
 *  Created on: 2019年4月5日
 */

#ifndef SRC_TESTER_CANCELLATIONTOKEN_HPP_
#define SRC_TESTER_CANCELLATIONTOKEN_HPP_

#include <atomic>

#include <kerbal/utility/noncopyable.hpp>

/**
 * @brief 整个运行共享的取消标志
 * stop: 不再派发新的测试用例, 已派发的用例继续运行至结束
 * hard_stop: 另外要求正在运行的用例立即终止其子进程
 */
class CancellationToken : kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	private:
		std::atomic<bool> stop_flag;
		std::atomic<bool> hard_stop_flag;

	public:
		CancellationToken() noexcept :
				stop_flag(false), hard_stop_flag(false)
		{
		}

		void request_stop() noexcept
		{
			stop_flag = true;
		}

		void request_hard_stop() noexcept
		{
			stop_flag = true;
			hard_stop_flag = true;
		}

		/// 开始新的一次运行前清除两个标志
		void reset() noexcept
		{
			stop_flag = false;
			hard_stop_flag = false;
		}

		bool stop_requested() const noexcept
		{
			return stop_flag;
		}

		bool hard_stop_requested() const noexcept
		{
			return hard_stop_flag;
		}
};

#endif /* SRC_TESTER_CANCELLATIONTOKEN_HPP_ */
