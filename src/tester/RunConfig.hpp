/*
 * RunConfig.hpp
 *
 *  Created on: 2019年4月5日
 */

#ifndef SRC_TESTER_RUNCONFIG_HPP_
#define SRC_TESTER_RUNCONFIG_HPP_

#include <map>
#include <chrono>
#include <vector>
#include <stdexcept>

#include <kerbal/data_struct/optional/optional.hpp>
#include <kerbal/utility/storage.hpp>

#include "united_resource.hpp"
#include "ProcessSpec.hpp"
#include "TestCase.hpp"
#include "ProtectedProcess.hpp"

/**
 * @brief 配置不合法, 在派发任何测试用例之前抛出
 */
class InvalidConfigException : public std::runtime_error
{
	public:
		using std::runtime_error::runtime_error;
};

/**
 * @brief 一次运行的全部配置
 */
class RunConfig
{
	public:
		template <typename Type>
		using optional = kerbal::data_struct::optional<Type>;

		Limits limits; ///< 默认 2 秒, 不限内存
		ComparePolicy policy; ///< 默认忽略空白符
		double epsilon; ///< 浮点比较的误差
		bool rstrip; ///< 文本比对前去掉两边末尾的空白符
		optional<ProcessSpec> checker; ///< special judge
		optional<ProcessSpec> judge; ///< 交互 judge, 设置后进入交互模式
		int concurrency; ///< 同时运行的测试用例数
		bool fail_fast; ///< 出现第一个非 AC 结果后不再派发新用例
		bool hard_stop; ///< fail_fast 时同时杀死正在运行的用例
		kerbal::utility::Byte output_limit; ///< 每一路输出流保留的最大字节数
		std::chrono::milliseconds kill_grace;
		std::chrono::milliseconds judge_grace; ///< 被测程序结束后等待交互 judge 结束的时长
		std::chrono::milliseconds checker_time_limit;
		std::map<int, Verdict> judge_exit_codes; ///< checker 与交互 judge 退出码到结果的映射
		Verdict unmapped_exit_code_verdict; ///< 映射表中未列出的非零退出码

		RunConfig();

		bool reactive() const noexcept
		{
			return judge.has_value();
		}

		/**
		 * @brief 按 judge_exit_codes 解释 checker 或交互 judge 的退出码
		 */
		Verdict map_exit_code(int exit_code) const;

		/**
		 * @brief 检查配置本身是否合法
		 * @throws InvalidConfigException
		 */
		void validate() const;

		/**
		 * @brief 检查配置以及配置与测试用例的搭配是否合法
		 * @throws InvalidConfigException
		 */
		void validate(const std::vector<TestCase> & cases) const;

		/**
		 * @brief 某个测试用例实际生效的资源限制
		 */
		const Limits & limits_for(const TestCase & test_case) const
		{
			return test_case.limits ? test_case.limits.value() : limits;
		}

		ProtectedProcessConfig process_config(const Limits & limits, const CancellationToken * token) const;
};

std::ostream& operator<<(std::ostream & out, const RunConfig & config);

#endif /* SRC_TESTER_RUNCONFIG_HPP_ */
