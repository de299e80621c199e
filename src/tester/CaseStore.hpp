/*
 * CaseStore.hpp
 *
 *  Created on: 2019年4月9日
 */

#ifndef SRC_TESTER_CASESTORE_HPP_
#define SRC_TESTER_CASESTORE_HPP_

#include <string>
#include <vector>
#include <stdexcept>

#include <boost/filesystem/path.hpp>
#include <kerbal/data_struct/optional/optional.hpp>

#include "TestCase.hpp"
#include "ProcessSpec.hpp"
#include "RunConfig.hpp"

/**
 * @brief 测试用例文件无法读取, 格式串不合法或测试用例编号重复
 */
class CaseLoadException : public std::runtime_error
{
	public:
		using std::runtime_error::runtime_error;
};

/**
 * @brief 按格式串找到的一组测试用例文件
 */
struct CasePaths
{
		std::string name; ///< %s 匹配到的部分, 用作测试用例编号
		boost::filesystem::path input;
		boost::filesystem::path output; ///< 按格式串推出的答案路径, 不一定存在
		bool output_exists;
};

/**
 * @brief 形如 test/%s.%e 的格式串。%s 为名称, %e 为扩展名 in 或 out, %% 为字面的 %
 * %s 与 %e 都必须出现, 且只能出现在最后一级文件名中。
 */
class CaseFormat
{
	private:
		std::string format;
		boost::filesystem::path directory;
		std::string file_pattern;

	public:
		/**
		 * @throws CaseLoadException 格式串不合法
		 */
		explicit CaseFormat(const std::string & format);

		/**
		 * @brief 以名称和扩展名填充格式串
		 */
		boost::filesystem::path make_path(const std::string & name, const std::string & ext) const;

		/**
		 * @brief 路径是否符合格式串, 符合时取出名称与扩展名
		 */
		bool match(const boost::filesystem::path & path, std::string & name, std::string & ext) const;

		/**
		 * @brief 在格式串所在目录中找到所有输入文件, 按名称的自然顺序排列
		 * @param paths 非空时不扫描目录, 只使用给出的文件 (输入或答案文件均可)
		 * @throws CaseLoadException 给出的路径不符合格式串
		 */
		std::vector<CasePaths> discover(const std::vector<std::string> & paths) const;

		const std::string & str() const noexcept
		{
			return format;
		}
};

/**
 * @brief 自然顺序: 名称中的连续数字按数值比较, 使 2 排在 10 之前
 */
bool natural_less(const std::string & a, const std::string & b);

/**
 * @brief 以二进制方式读入整个文件
 * @throws CaseLoadException 文件无法读取
 */
std::string read_whole_file(const boost::filesystem::path & path);

/**
 * @brief 有序的测试用例集合。编号在集合中唯一, 顺序即报告顺序
 */
class CaseStore
{
	private:
		std::vector<TestCase> cases;

	public:
		/**
		 * @throws CaseLoadException 编号重复
		 */
		void add(const TestCase & test_case);

		const std::vector<TestCase> & get_cases() const noexcept
		{
			return cases;
		}

		size_t size() const noexcept
		{
			return cases.size();
		}

		bool empty() const noexcept
		{
			return cases.empty();
		}

		/**
		 * @brief 按格式串从磁盘载入测试用例。没有答案文件的输入产生无标准答案的测试用例
		 * @throws CaseLoadException
		 */
		static CaseStore load_from_format(const std::string & format, const std::vector<std::string> & paths);
};

/**
 * @brief generate-output 的结果
 */
struct GenerateOutputReport
{
		std::vector<std::string> generated;
		std::vector<std::string> kept; ///< 答案文件已存在, 未被覆盖
		std::vector<std::string> failed; ///< 参考程序运行失败
};

/**
 * @brief 用参考程序在每个输入上运行, 为缺少答案文件的输入写出答案
 * @throws CaseLoadException
 */
GenerateOutputReport generate_output(const std::string & format, const std::vector<std::string> & paths,
										const ProcessSpec & reference, const RunConfig & config);

#endif /* SRC_TESTER_CASESTORE_HPP_ */
