/*
 * ReactivePipe.hpp
 *
 *  Created on: 2019年4月7日
 */

#ifndef SRC_TESTER_REACTIVEPIPE_HPP_
#define SRC_TESTER_REACTIVEPIPE_HPP_

#include <string>

#include "united_resource.hpp"
#include "ExecutionResult.hpp"
#include "RunConfig.hpp"
#include "TestCase.hpp"

/**
 * @brief 一次交互评测的结果
 */
struct ReactiveOutcome
{
		ExecutionResult candidate; ///< elapsed 为两个进程共同运行的时间
		ExecutionResult judge;
		bool deadlock; ///< 被测程序结束后 judge 在 judge_grace 内没有结束
		Verdict verdict;
		std::string comment;

		ReactiveOutcome() : deadlock(false), verdict(Verdict::JUDGE_ERROR)
		{
		}
};

/**
 * @brief 交互评测: 被测程序的标准输出接到 judge 的标准输入, judge 的标准输出接到被测程序的标准输入。
 * 两个方向各由一个线程逐块转发, 不等待整个流结束。judge 以
 * judge_args... <input> [<expected>] 的形式调用, 它的退出码经 judge_exit_codes 映射为结果。
 *
 * 结果的判定顺序:
 * 1. 任一进程无法启动, 或整个运行被强制终止: JUDGE_ERROR
 * 2. 被测程序运行至时限仍未结束, 或两者共同运行的时间超过时限: TIME_LIMIT_EXCEEDED
 * 3. 被测程序内存越限: MEMORY_LIMIT_EXCEEDED
 * 4. 被测程序结束后 judge 在 judge_grace 内没有结束 (死锁), 或 judge 被信号终止: JUDGE_ERROR
 * 5. judge 的退出码映射为 ACCEPTED 或 WRONG_ANSWER, 而被测程序自身以非零退出或被 SIGPIPE 之外的信号终止: RUNTIME_ERROR
 * 6. 否则为 judge 退出码的映射结果
 */
class ReactivePipe
{
	private:
		const RunConfig & config;

	public:
		/**
		 * @warning config 须比本对象活得更久, 且 config.judge 不为空
		 */
		explicit ReactivePipe(const RunConfig & config);

		ReactiveOutcome run(const TestCase & test_case, const ProcessSpec & candidate, const CancellationToken * token) const;
};

#endif /* SRC_TESTER_REACTIVEPIPE_HPP_ */
