/*
 * united_resource.hpp
 *
 *  Created on: 2019年4月2日
 */

#ifndef SRC_SHARED_SRC_UNITED_RESOURCE_HPP_
#define SRC_SHARED_SRC_UNITED_RESOURCE_HPP_

#include <iostream>
#include <string>

/**
 * @brief 枚举类，标识单个测试用例的评测结果
 */
enum class Verdict
{
	ACCEPTED = 0, ///< 通过
	WRONG_ANSWER = 1, ///< 答案错误
	TIME_LIMIT_EXCEEDED = 2, ///< 墙上时间超时
	MEMORY_LIMIT_EXCEEDED = 3, ///< 超内存
	RUNTIME_ERROR = 4, ///< 运行时错误, 即非零退出或被信号终止
	JUDGE_ERROR = 5, ///< 评测系统自身出错, 如程序无法启动, checker 或 judge 崩溃
};

constexpr int VERDICT_KIND_NUM = 6;

/*
 * 对于枚举中未定义的量不在 switch 语句的 default 分支处理, 而在函数末尾处理
 * 如果未来加了新定义的枚举值而忘了加上描述, 编译器便会给出警告
 */
const char * getVerdictName(Verdict verdict) noexcept;

/**
 * @brief 简短的两到三个字母的缩写, 如 AC, WA, TLE
 */
const char * getVerdictAbbr(Verdict verdict) noexcept;

/**
 * @brief 根据名称 (如 "WRONG_ANSWER" 或缩写 "WA", 不区分大小写) 取得对应的 Verdict
 * @throws std::invalid_argument 名称无法识别
 */
Verdict parse_verdict(const std::string & name);

std::ostream& operator<<(std::ostream& out, Verdict verdict);


/**
 * @brief 枚举类，标识输出比对策略
 */
enum class ComparePolicy
{
	EXACT = 0, ///< 逐字节比较
	WHITESPACE_INSENSITIVE = 1, ///< 按空白符切分后逐 token 比较
	FLOAT_TOLERANT = 2, ///< 逐 token 比较, 浮点数允许误差
	EXTERNAL_CHECKER = 3, ///< 交由外部 special judge 决定
	LINE = 4, ///< 逐行比较, 行内逐字节, 末尾是否有换行不影响结果
};

const char * getComparePolicyName(ComparePolicy policy) noexcept;

/**
 * @brief 根据命令行使用的名称 (exact, whitespace, float, checker, line) 取得比对策略
 * @throws std::invalid_argument 名称无法识别
 */
ComparePolicy parse_compare_policy(const std::string & name);

std::ostream& operator<<(std::ostream& out, ComparePolicy policy);

#endif /* SRC_SHARED_SRC_UNITED_RESOURCE_HPP_ */
