/*
 * AutoClosedFd.cpp
 *
 *  Created on: 2019年4月3日
 */

#include "AutoClosedFd.hpp"

#include <cerrno>
#include <system_error>

std::pair<AutoClosedFd, AutoClosedFd> make_cloexec_pipe()
{
	int fds[2];
	if (pipe2(fds, O_CLOEXEC) == -1) {
		throw std::system_error(errno, std::system_category(), "pipe2 failed");
	}
	return std::make_pair(AutoClosedFd(fds[0]), AutoClosedFd(fds[1]));
}
