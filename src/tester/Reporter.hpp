/*
 * Reporter.hpp
 *
 *  Created on: 2019年4月10日
 */

#ifndef SRC_TESTER_REPORTER_HPP_
#define SRC_TESTER_REPORTER_HPP_

#include <vector>
#include <iostream>

#include <nlohmann/json.hpp>
#include <kerbal/utility/costream.hpp>

#include "TestCase.hpp"
#include "TestOrchestrator.hpp"

/**
 * @brief 在终端上逐个打印测试用例的结果 (完成顺序), 运行结束后打印各结果的计数
 */
class ConsoleReporter
{
	private:
		const std::vector<TestCase> & cases;
		bool silent; ///< 不打印错误用例的输出与答案
		size_t finished;

		kerbal::utility::costream::costream<std::cout> accepted_stream;
		kerbal::utility::costream::costream<std::cout> wrong_answer_stream;
		kerbal::utility::costream::costream<std::cout> time_limit_stream;
		kerbal::utility::costream::costream<std::cout> memory_limit_stream;
		kerbal::utility::costream::costream<std::cout> runtime_error_stream;
		kerbal::utility::costream::costream<std::cout> judge_error_stream;

		const kerbal::utility::costream::costream<std::cout> & stream_of(Verdict verdict) const noexcept;

		void print_diagnostics(const CaseReport & report) const;

	public:
		ConsoleReporter(const std::vector<TestCase> & cases, bool silent);

		/**
		 * @brief 作为 TestOrchestrator 的 observer 使用
		 */
		void on_case(const CaseReport & report);

		void on_summary(const RunSummary & summary) const;
};

nlohmann::json to_json(const ExecutionResult & result);

nlohmann::json to_json(const CaseReport & report);

/**
 * @brief 按测试用例顺序输出的完整汇总
 */
nlohmann::json to_json(const RunSummary & summary);

#endif /* SRC_TESTER_REPORTER_HPP_ */
