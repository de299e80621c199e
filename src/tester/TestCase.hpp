/*
 * TestCase.hpp
 *
 *  Created on: 2019年4月5日
 */

#ifndef SRC_TESTER_TESTCASE_HPP_
#define SRC_TESTER_TESTCASE_HPP_

#include <chrono>
#include <string>
#include <iostream>

#include <kerbal/data_struct/optional/optional.hpp>
#include <kerbal/utility/storage.hpp>

/**
 * @brief 资源限制。整个运行共用一份, 单个测试用例可以覆盖
 */
struct Limits
{
		template <typename Type>
		using optional = kerbal::data_struct::optional<Type>;

		std::chrono::milliseconds time_limit; ///< 墙上时间限制
		optional<kerbal::utility::Byte> memory_limit; ///< 为空表示不限制内存

		Limits() : time_limit(2000)
		{
		}

		explicit Limits(std::chrono::milliseconds time_limit) : time_limit(time_limit)
		{
		}
};

std::ostream& operator<<(std::ostream & out, const Limits & limits);

/**
 * @brief 一个测试用例。载入后不再修改
 */
struct TestCase
{
		template <typename Type>
		using optional = kerbal::data_struct::optional<Type>;

		std::string id; ///< 在一次运行中唯一
		std::string input;
		optional<std::string> expected_output; ///< 为空时只能由 checker 或交互 judge 判定
		optional<Limits> limits; ///< 覆盖整个运行的资源限制

		TestCase() = default;

		TestCase(const std::string & id, const std::string & input) :
				id(id), input(input)
		{
		}

		TestCase(const std::string & id, const std::string & input, const std::string & expected_output) :
				id(id), input(input), expected_output(expected_output)
		{
		}
};

#endif /* SRC_TESTER_TESTCASE_HPP_ */
