/*
 * ProcessSpec.hpp
 *
 *  Created on: 2019年4月2日
 */

#ifndef SRC_TESTER_PROCESSSPEC_HPP_
#define SRC_TESTER_PROCESSSPEC_HPP_

#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>

#include "ExecuteArgs.hpp"

/**
 * @brief 描述一次外部程序调用: 参数表, 环境变量表与工作目录
 */
struct ProcessSpec
{
		ExecuteArgs args; ///< args[0] 为要执行的程序
		ExecuteArgs env; ///< 环境变量表, 形如 KEY=VALUE
		boost::filesystem::path working_dir; ///< 为空时继承当前工作目录
		bool search_path = true; ///< args[0] 不含 '/' 时是否在 PATH 中查找

		ProcessSpec();

		ProcessSpec(const ExecuteArgs & args);

		/**
		 * @brief 由命令字符串构造
		 * @param command 命令字符串
		 * @param shell 为 true 时以 /bin/sh -c command sh 执行, 之后追加的参数依次成为 $1, $2 ...;
		 *        否则按空白符切分为离散参数, 不做任何 shell 解释
		 * @throws std::invalid_argument command 为空
		 */
		static ProcessSpec from_command(const std::string & command, bool shell);

		/**
		 * @brief 返回在参数表末尾追加若干参数后的副本
		 */
		ProcessSpec with_extra_args(const std::vector<std::string> & extra) const;

		const std::string & program() const
		{
			return args[0];
		}
};

std::ostream& operator<<(std::ostream & out, const ProcessSpec & spec);

#endif /* SRC_TESTER_PROCESSSPEC_HPP_ */
