/*
 * TemporaryDirectory.hpp
 *
 *  Created on: 2019年4月8日
 */

#ifndef SRC_SHARED_SRC_TEMPORARYDIRECTORY_HPP_
#define SRC_SHARED_SRC_TEMPORARYDIRECTORY_HPP_

#include <fstream>
#include <string>
#include <stdexcept>

#include <boost/filesystem.hpp>
#include <kerbal/utility/noncopyable.hpp>

/**
 * @brief 一个私有的临时工作目录, 析构时连同其中文件一起删除
 */
class TemporaryDirectory : kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	private:
		boost::filesystem::path dir;

	public:
		/**
		 * @throws boost::filesystem::filesystem_error 目录创建失败
		 */
		explicit TemporaryDirectory(const std::string & prefix = "ts_tester") :
				dir(boost::filesystem::temp_directory_path() / boost::filesystem::unique_path(prefix + "-%%%%-%%%%-%%%%"))
		{
			boost::filesystem::create_directories(dir);
		}

		~TemporaryDirectory() noexcept
		{
			boost::system::error_code ec;
			boost::filesystem::remove_all(dir, ec);
		}

		const boost::filesystem::path & path() const noexcept
		{
			return dir;
		}

		/**
		 * @brief 在目录中写入一个文件并返回其路径
		 * @throws std::runtime_error 写入失败
		 */
		boost::filesystem::path write_file(const std::string & file_name, const std::string & content) const
		{
			boost::filesystem::path file_path = dir / file_name;
			std::ofstream fout(file_path.native(), std::ios::out | std::ios::binary);
			fout.write(content.data(), content.size());
			fout.close();
			if (!fout) {
				throw std::runtime_error("write temporary file failed: " + file_path.string());
			}
			return file_path;
		}
};

#endif /* SRC_SHARED_SRC_TEMPORARYDIRECTORY_HPP_ */
