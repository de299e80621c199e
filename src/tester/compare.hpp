/*
 * compare.hpp
 *
 *  Created on: 2019年4月4日
 */

#ifndef SRC_TESTER_COMPARE_HPP_
#define SRC_TESTER_COMPARE_HPP_

#include <string>

#include "united_resource.hpp"

constexpr double DEFAULT_EPSILON = 1e-6;

/**
 * @brief 按给定策略比对程序输出与标准答案
 * @param produced 程序输出
 * @param expected 标准答案
 * @param policy EXACT, WHITESPACE_INSENSITIVE, FLOAT_TOLERANT 或 LINE
 * @param epsilon FLOAT_TOLERANT 下允许的绝对或相对误差
 * @return 是否匹配
 * @throws std::invalid_argument policy 为 EXTERNAL_CHECKER, 该策略由 SpecialJudge 处理
 */
bool compare(const std::string & produced, const std::string & expected, ComparePolicy policy, double epsilon = DEFAULT_EPSILON);

/**
 * @brief 给出第一处差异的简短描述 (行号与 token), 用于答案错误的报告
 * @return 匹配时返回空串
 */
std::string describe_mismatch(const std::string & produced, const std::string & expected, ComparePolicy policy, double epsilon = DEFAULT_EPSILON);

/**
 * @brief 两个 token 在误差 epsilon 内是否相等。都能完整解析为有限浮点数时比较数值, 否则比较文本
 */
bool float_token_equal(const std::string & produced, const std::string & expected, double epsilon);

/**
 * @brief 去掉末尾的空白符 (包括换行), 用于 --rstrip
 */
std::string rstrip_copy(const std::string & text);

#endif /* SRC_TESTER_COMPARE_HPP_ */
