/*
 * ExecuteArgs.hpp
 *
 *  Created on: 2019年4月2日
 */

#ifndef SRC_TESTER_EXECUTEARGS_HPP_
#define SRC_TESTER_EXECUTEARGS_HPP_

#include <vector>
#include <string>
#include <memory>
#include <iostream>

/**
 * @brief 执行 exec 族的命令行参数或环境变量表。exec 族函数要求参数表以一个空指针结尾,
 * 本类将其封装起来, 参数始终以离散序列的形式保存, 不经过 shell 的字符串拼接。
 */
class ExecuteArgs
{
	private:
		std::vector<std::string> args;

	public:
		ExecuteArgs();

		template<typename ForwardIterator>
		ExecuteArgs(ForwardIterator begin, ForwardIterator end) :
				args(begin, end)
		{
		}

		ExecuteArgs(std::initializer_list<std::string> list);

		ExecuteArgs& operator=(std::initializer_list<std::string> list);

		void push_back(const std::string & arg);

		bool empty() const noexcept
		{
			return args.empty();
		}

		size_t size() const noexcept
		{
			return args.size();
		}

		const std::string & operator[](size_t i) const
		{
			return args[i];
		}

		const std::vector<std::string> & get_vector() const noexcept
		{
			return args;
		}

		/**
		 * @brief 返回命令行参数列表
		 * @return 指向 char * 数组的指针，符合 Unix 的 exec 族函数的参数规范
		 * @warning 返回的指针指向本对象内部的字符串, 本对象须比返回值活得更久
		 */
		std::unique_ptr<char*[]> getArgs() const;

		/**
		 * @brief 以当前进程的环境变量构造
		 */
		static ExecuteArgs current_environment();

		friend std::ostream& operator<<(std::ostream & out, const ExecuteArgs & src);
};

#endif /* SRC_TESTER_EXECUTEARGS_HPP_ */
