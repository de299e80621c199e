/*
 * SplitInput.hpp
 *
 *  Created on: 2019年4月12日
 */

#ifndef SRC_TESTER_SPLITINPUT_HPP_
#define SRC_TESTER_SPLITINPUT_HPP_

#include <chrono>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>
#include <kerbal/data_struct/optional/optional.hpp>

#include "ProcessSpec.hpp"
#include "RunConfig.hpp"

/**
 * @brief split-input 的参数
 */
struct SplitInputOptions
{
		template <typename Type>
		using optional = kerbal::data_struct::optional<Type>;

		boost::filesystem::path input; ///< 含有多个测试用例的输入文件
		std::string output_format; ///< 输出路径的格式串, %i 为从 1 开始的编号, %% 为字面的 %
		std::chrono::milliseconds interval; ///< 每送出一行后等待程序输出的时长
		size_t ignore; ///< 开头这么多行照常送给程序, 但不计入任何测试用例
		std::string header; ///< 写在每个测试用例之前, 不以换行结尾时补上换行
		optional<std::string> footer; ///< 写在每个测试用例之后
		bool auto_footer; ///< 以输入文件的最后一行作为 footer

		SplitInputOptions() : interval(100), ignore(0), auto_footer(false)
		{
		}
};

struct SplitInputReport
{
		std::vector<boost::filesystem::path> written;
		std::string leftover; ///< 最后一次输出之后送出的行, 没有构成测试用例
};

/**
 * @brief 以 %i 为编号填充输出路径的格式串
 */
std::string format_case_index(const std::string & format, size_t index);

/**
 * @brief 把一个含有多个测试用例的输入文件拆分为单独的输入文件
 *
 * 输入文件逐行送给 command。每送出一行后等待 interval, 期间 command 有任何输出,
 * 就认为自上一个测试用例以来送出的行构成一个完整的测试用例, 写入 output_format 指定的文件。
 * command 通常由题解改写而来: 每读完一个测试用例输出一行。
 * @throws CaseLoadException 输入文件无法读取, command 无法启动或输出文件无法写入
 */
SplitInputReport split_input(const SplitInputOptions & options, const ProcessSpec & command, const RunConfig & config);

#endif /* SRC_TESTER_SPLITINPUT_HPP_ */
