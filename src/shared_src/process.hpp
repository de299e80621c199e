/*
 * process.hpp
 *
 *  Created on: 2019年4月2日
 */

#ifndef SRC_SHARED_SRC_PROCESS_HPP_
#define SRC_SHARED_SRC_PROCESS_HPP_

#include <utility>
#include <exception>
#include <cstdlib>
#include <cerrno>

#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <sys/resource.h>

#include <kerbal/utility/noncopyable.hpp>

/**
 * @brief fork 出的子进程的句柄
 * 子进程中执行 func 后以 _exit 结束, 不会执行父进程注册的 atexit 回调与静态对象析构。
 * 若句柄析构时子进程仍未被回收, 会向其进程组发送 SIGKILL 并回收, 避免僵死进程。
 */
class process : virtual kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	public:
		typedef pid_t pid_type;

	protected:
		pid_type father_id;
		pid_type child_id;

		enum
		{
			none, running, detached
		} status;

	public:
		process() noexcept :
				father_id(0), child_id(0), status(none)
		{
		}

		/**
		 * @throws std::exception fork 失败
		 */
		template <typename Callable, typename ... Args>
		explicit process(Callable && func, Args && ... args) :
				father_id(getpid()), child_id(-1), status(running)
		{
			child_id = fork();
			if (child_id == -1) {
				status = none;
				throw std::exception();
			} else if (child_id == 0) {
				{
					func(std::forward<Args>(args)...);
				}
				_exit(0);
			}
		}

		~process() noexcept
		{
			if (getpid() == father_id) {
				switch (status) {
					case none:
						break;
					case running:
						this->kill_group(SIGKILL);
						this->kill(SIGKILL);
						this->join();
						break;
					case detached:
						break;
				}
			}
		}

		pid_type get_father_id() const noexcept
		{
			return this->father_id;
		}

		pid_type get_child_id() const noexcept
		{
			return this->child_id;
		}

		process(process && src) noexcept :
				father_id(src.father_id), child_id(src.child_id), status(src.status)
		{
			src.father_id = 0;
			src.child_id = 0;
			src.status = none;
		}

		void swap(process & with) noexcept
		{
			std::swap(this->father_id, with.father_id);
			std::swap(this->child_id, with.child_id);
			std::swap(this->status, with.status);
		}

		bool joinable() const noexcept
		{
			return status == running;
		}

		pid_type join() noexcept
		{
			return this->join(nullptr, 0, nullptr);
		}

		/**
		 * @brief Wait for the process to exit. Put the status in *status_loc
		 * @param status_loc The location where the process status will be put.
		 * @param options WNOHANG makes the call return 0 at once if the child is still running.
		 * @param usage If not nil, store information about the child's resource usage there.
		 * @return For errors return (pid_type) (-1); 0 if WNOHANG was given and the child is alive;
		 * 			otherwise return the process ID, and the handle becomes empty.
		 */
		pid_type join(int * status_loc, int options, struct rusage * usage) noexcept
		{
			if (status == none) {
				return 0;
			}
			pid_type res;
			do {
				res = ::wait4(child_id, status_loc, options, usage);
			} while (res == -1 && errno == EINTR);
			if (res > 0) {
				this->status = none;
			}
			return res;
		}

		void detach() noexcept
		{
			status = detached;
		}

		/**
		 * @brief Send signal SIG to the process.
		 * @return If success return 0, For errors, return other value.
		 */
		int kill(int sig) noexcept
		{
			if (status != running) {
				return 0;
			}
			return ::kill(child_id, sig);
		}

		/**
		 * @brief Send signal SIG to the whole process group led by the child.
		 * @warning only meaningful when the child called setpgid(0, 0)
		 */
		int kill_group(int sig) noexcept
		{
			if (status != running) {
				return 0;
			}
			return ::kill(-child_id, sig);
		}

};

#endif /* SRC_SHARED_SRC_PROCESS_HPP_ */
