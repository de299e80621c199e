/*
 * TestOrchestrator.hpp
 *
 *  Created on: 2019年4月8日
 */

#ifndef SRC_TESTER_TESTORCHESTRATOR_HPP_
#define SRC_TESTER_TESTORCHESTRATOR_HPP_

#include <array>
#include <string>
#include <vector>
#include <functional>

#include <kerbal/data_struct/optional/optional.hpp>
#include <kerbal/utility/noncopyable.hpp>

#include "united_resource.hpp"
#include "ExecutionResult.hpp"
#include "CancellationToken.hpp"
#include "ProcessSpec.hpp"
#include "RunConfig.hpp"
#include "TestCase.hpp"

/**
 * @brief 单个测试用例的评测报告
 */
struct CaseReport
{
		template <typename Type>
		using optional = kerbal::data_struct::optional<Type>;

		size_t index; ///< 在测试用例序列中的下标
		std::string case_id;
		Verdict verdict;
		ExecutionResult result; ///< 被测程序的执行结果
		std::string comment; ///< 答案错误时的差异描述, checker 或 judge 的输出等
		optional<ExecutionResult> judge_result; ///< 交互模式下 judge 的执行结果

		CaseReport() : index(0), verdict(Verdict::JUDGE_ERROR)
		{
		}
};

/**
 * @brief 一次运行的汇总。reports 的顺序与测试用例的原始顺序一致, 与完成顺序无关
 */
struct RunSummary
{
		std::vector<CaseReport> reports;
		std::array<size_t, VERDICT_KIND_NUM> counts; ///< 以 Verdict 的值为下标
		std::vector<std::string> skipped; ///< 因 fail_fast 未被派发的测试用例
		bool hard_stopped;

		RunSummary() : counts(), hard_stopped(false)
		{
		}

		size_t count(Verdict verdict) const
		{
			return counts[static_cast<size_t>(verdict)];
		}

		/**
		 * @brief 所有测试用例都已运行且都通过
		 */
		bool all_accepted() const noexcept;
};

/**
 * @brief 由执行结果与比对结果推导出结果, 资源越限优先于答案比对
 * @param matched 答案比对 (或 checker) 是否认可输出, 仅在程序正常退出时被使用
 */
Verdict derive_verdict(const ExecutionResult & result, bool matched) noexcept;

/**
 * @brief 驱动整个运行: 以至多 concurrency 个并发的 worker 依次取出测试用例,
 * 交给 Process Runner (或交互模式下的 Reactive Pipe) 运行, 比对并推导结果。
 */
class TestOrchestrator : kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	public:
		/**
		 * @brief 每个测试用例完成时被调用一次, 调用顺序为完成顺序。调用被串行化
		 */
		using observer_type = std::function<void(const CaseReport &)>;

	private:
		RunConfig config;
		CancellationToken token;

	public:
		explicit TestOrchestrator(const RunConfig & config);

		/**
		 * @brief 运行全部测试用例。同一个对象可以多次调用, 每次开始时清除上一次留下的停止请求
		 * @throws InvalidConfigException 配置不合法, 此时没有任何测试用例被运行
		 */
		RunSummary run(const std::vector<TestCase> & cases, const ProcessSpec & candidate, const observer_type & observer = nullptr);

		/**
		 * @brief 运行单个测试用例。除配置错误外不抛出异常, 所有失败都体现为结果
		 */
		CaseReport run_case(size_t index, const TestCase & test_case, const ProcessSpec & candidate);

		/// 不再派发新的测试用例, 并杀死正在运行的测试用例
		void request_hard_stop() noexcept
		{
			token.request_hard_stop();
		}
};

#endif /* SRC_TESTER_TESTORCHESTRATOR_HPP_ */
