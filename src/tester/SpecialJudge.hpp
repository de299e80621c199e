/*
 * SpecialJudge.hpp
 *
 *  Created on: 2019年4月6日
 */

#ifndef SRC_TESTER_SPECIALJUDGE_HPP_
#define SRC_TESTER_SPECIALJUDGE_HPP_

#include <string>

#include "united_resource.hpp"
#include "ExecutionResult.hpp"
#include "RunConfig.hpp"
#include "TestCase.hpp"

/**
 * @brief special judge 的判定结果
 */
struct CheckResult
{
		Verdict verdict; ///< 只会是 ACCEPTED, WRONG_ANSWER 或 JUDGE_ERROR
		std::string comment; ///< checker 的输出, 或出错原因
		ExecutionResult checker_result;
};

/**
 * @brief 外部 checker。以 checker_args... <input> <output> [<expected>] 的形式调用,
 * 三个文件写在一个私有的临时目录中, 退出码经 judge_exit_codes 映射为结果。
 * checker 超时, 被信号终止或无法启动均为 JUDGE_ERROR。
 */
class SpecialJudge
{
	private:
		const RunConfig & config;

	public:
		/**
		 * @warning config 须比本对象活得更久, 且 config.checker 不为空
		 */
		explicit SpecialJudge(const RunConfig & config);

		CheckResult check(const TestCase & test_case, const std::string & produced, const CancellationToken * token) const;
};

#endif /* SRC_TESTER_SPECIALJUDGE_HPP_ */
