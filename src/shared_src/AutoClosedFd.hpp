/*
 * AutoClosedFd.hpp
 *
 *  Created on: 2019年4月3日
 */

#ifndef SRC_SHARED_SRC_AUTOCLOSEDFD_HPP_
#define SRC_SHARED_SRC_AUTOCLOSEDFD_HPP_

#include <utility>

#include <fcntl.h>
#include <unistd.h>

#include <kerbal/utility/noncopyable.hpp>

/**
 * @brief 文件描述符的 RAII 包装, 离开作用域时自动关闭
 */
class AutoClosedFd : kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	private:
		int fd;

	public:
		AutoClosedFd() noexcept : fd(-1)
		{
		}

		explicit AutoClosedFd(int fd) noexcept : fd(fd)
		{
		}

		AutoClosedFd(AutoClosedFd && src) noexcept : fd(src.fd)
		{
			src.fd = -1;
		}

		AutoClosedFd& operator=(AutoClosedFd && src) noexcept
		{
			if (this != &src) {
				this->close();
				this->fd = src.fd;
				src.fd = -1;
			}
			return *this;
		}

		~AutoClosedFd() noexcept
		{
			this->close();
		}

		int get() const noexcept
		{
			return fd;
		}

		bool is_open() const noexcept
		{
			return fd >= 0;
		}

		int release() noexcept
		{
			int res = fd;
			fd = -1;
			return res;
		}

		/**
		 * @return 0 on success or if already closed, -1 on error (errno is set)
		 */
		int close() noexcept
		{
			if (fd < 0) {
				return 0;
			}
			int res = ::close(fd);
			fd = -1;
			return res;
		}

		int set_nonblock() const noexcept
		{
			int flags = fcntl(fd, F_GETFL);
			if (flags == -1) {
				return -1;
			}
			return fcntl(fd, F_SETFL, flags | O_NONBLOCK);
		}
};

/**
 * @brief 创建一对 close-on-exec 的管道
 * @return {读端, 写端}
 * @throws std::system_error pipe2 失败
 */
std::pair<AutoClosedFd, AutoClosedFd> make_cloexec_pipe();

#endif /* SRC_SHARED_SRC_AUTOCLOSEDFD_HPP_ */
