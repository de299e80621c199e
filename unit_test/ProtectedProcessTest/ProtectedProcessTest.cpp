/*
 * ProtectedProcessTest.cpp
 *
 *  Created on: 2019年4月11日
 */

#define BOOST_TEST_MODULE ProtectedProcessTest

#include <chrono>
#include <fstream>
#include <string>

#include <cerrno>

#include <signal.h>

#include <boost/test/included/unit_test.hpp>
#include <kerbal/utility/storage.hpp>

#include "ProtectedProcess.hpp"
#include "CancellationToken.hpp"

std::ofstream log_fp("/dev/null");

using namespace std::chrono;

namespace
{
	ExecutionResult run_shell(const std::string & script, const std::string & input = "",
								milliseconds time_limit = milliseconds(2000))
	{
		return protected_process("t", ProcessSpec::from_command(script, true), input, ProtectedProcessConfig(time_limit));
	}
}

BOOST_AUTO_TEST_CASE(echo_input)
{
	ExecutionResult res = run_shell("cat", "hello\nworld\n");
	BOOST_REQUIRE(!res.setup_failed());
	BOOST_CHECK(res.exited_normally());
	BOOST_CHECK_EQUAL(res.output.data, "hello\nworld\n");
	BOOST_CHECK(!res.output.truncated());
	BOOST_CHECK_EQUAL(res.error_output.data, "");
	BOOST_CHECK_EQUAL(res.case_id, "t");
}

BOOST_AUTO_TEST_CASE(argv_without_shell)
{
	ExecutionResult res = protected_process("t", ProcessSpec::from_command("echo a  'b c'", false), "",
											ProtectedProcessConfig(milliseconds(2000)));
	BOOST_CHECK(res.exited_normally());
	// 不经 shell 解释, 引号原样传给程序
	BOOST_CHECK_EQUAL(res.output.data, "a 'b c'\n");
}

BOOST_AUTO_TEST_CASE(stderr_and_exit_code)
{
	ExecutionResult res = run_shell("echo out; echo oops >&2; exit 3");
	BOOST_CHECK(!res.exited_normally());
	BOOST_REQUIRE(res.exit_code.has_value());
	BOOST_CHECK_EQUAL(res.exit_code.value(), 3);
	BOOST_CHECK(!res.term_signal.has_value());
	BOOST_CHECK_EQUAL(res.output.data, "out\n");
	BOOST_CHECK_EQUAL(res.error_output.data, "oops\n");
	BOOST_CHECK(!res.timed_out);
}

BOOST_AUTO_TEST_CASE(killed_by_signal)
{
	ExecutionResult res = run_shell("kill -9 $$");
	BOOST_REQUIRE(res.term_signal.has_value());
	BOOST_CHECK_EQUAL(res.term_signal.value(), SIGKILL);
	BOOST_CHECK(!res.exit_code.has_value());
	BOOST_CHECK(!res.timed_out);
}

BOOST_AUTO_TEST_CASE(time_limit)
{
	const steady_clock::time_point start = steady_clock::now();
	ExecutionResult res = run_shell("echo started; sleep 5", "", milliseconds(300));
	const milliseconds took = duration_cast<milliseconds>(steady_clock::now() - start);

	BOOST_CHECK(res.timed_out);
	BOOST_CHECK(!res.exit_code.has_value());
	BOOST_CHECK(res.elapsed >= milliseconds(300));
	BOOST_CHECK(took < milliseconds(3000));
	// 超时前的输出保留下来
	BOOST_CHECK_EQUAL(res.output.data, "started\n");
}

BOOST_AUTO_TEST_CASE(missing_executable)
{
	ExecutionResult res = protected_process("t", ProcessSpec::from_command("/nonexistent/ts_tester_prog", false), "",
											ProtectedProcessConfig(milliseconds(1000)));
	BOOST_REQUIRE(res.setup_failed());
	BOOST_CHECK(res.setup_error.value().find("/nonexistent/ts_tester_prog") != std::string::npos);
	BOOST_CHECK(!res.exited_normally());
	BOOST_CHECK(!res.timed_out);
}

BOOST_AUTO_TEST_CASE(output_truncated)
{
	using namespace kerbal::utility;

	ProtectedProcessConfig config(milliseconds(2000));
	config.set_max_output_size(Byte(1024));
	ExecutionResult res = protected_process("t", ProcessSpec::from_command("head -c 10000 /dev/zero", true), "", config);
	BOOST_CHECK(res.exited_normally());
	BOOST_CHECK(res.output.truncated());
	BOOST_CHECK_EQUAL(res.output.data.size(), 1024u);
	BOOST_CHECK_EQUAL(res.output.total_size, 10000u);
	BOOST_CHECK(res.output.display().find("truncated") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(unread_input_does_not_block)
{
	// 程序不读标准输入就退出, 剩余的输入被丢弃
	const std::string input(4 * 1024 * 1024, 'x');
	ExecutionResult res = run_shell("exit 0", input);
	BOOST_CHECK(res.exited_normally());
}

BOOST_AUTO_TEST_CASE(large_output_and_input)
{
	const std::string input(1024 * 1024, 'y');
	ExecutionResult res = run_shell("cat", input);
	BOOST_CHECK(res.exited_normally());
	BOOST_CHECK(res.output.data == input);
}

BOOST_AUTO_TEST_CASE(background_descendant_is_killed)
{
	const steady_clock::time_point start = steady_clock::now();
	ExecutionResult res = run_shell("sleep 30 & echo done");
	const milliseconds took = duration_cast<milliseconds>(steady_clock::now() - start);

	BOOST_CHECK(res.exited_normally());
	BOOST_CHECK_EQUAL(res.output.data, "done\n");
	BOOST_CHECK(took < milliseconds(5000));
}

BOOST_AUTO_TEST_CASE(hard_stop)
{
	CancellationToken token;
	token.request_hard_stop();

	ProtectedProcessConfig config(milliseconds(5000));
	config.set_cancel_token(&token);
	ExecutionResult res = protected_process("t", ProcessSpec::from_command("sleep 5", true), "", config);
	BOOST_CHECK(res.cancelled);
	BOOST_CHECK(!res.timed_out);
	BOOST_CHECK(!res.exit_code.has_value());
	BOOST_CHECK(res.elapsed < milliseconds(3000));
}

BOOST_AUTO_TEST_CASE(working_dir_and_env)
{
	ProcessSpec spec = ProcessSpec::from_command("pwd; echo $TS_TESTER_VALUE", true);
	spec.working_dir = "/";
	spec.env.push_back("TS_TESTER_VALUE=42");
	ExecutionResult res = protected_process("t", spec, "", ProtectedProcessConfig(milliseconds(2000)));
	BOOST_CHECK(res.exited_normally());
	BOOST_CHECK_EQUAL(res.output.data, "/\n42\n");
}

BOOST_AUTO_TEST_CASE(spawn_failure_reports_step)
{
	try {
		ProtectedChild child(ProcessSpec::from_command("/nonexistent/ts_tester_prog", false), ProtectedProcessConfig());
		BOOST_ERROR("spawning a missing program should throw");
	} catch (const SpawnFailedException & e) {
		BOOST_CHECK_EQUAL(e.get_step(), "exec");
		BOOST_CHECK_EQUAL(e.get_errno(), ENOENT);
	}
}

BOOST_AUTO_TEST_CASE(shell_command_takes_appended_args)
{
	const ProcessSpec spec = ProcessSpec::from_command("echo $# \"$1\" \"$2\"", true).with_extra_args({"in.txt", "out file.txt"});
	ExecutionResult res = protected_process("t", spec, "", ProtectedProcessConfig(milliseconds(2000)));
	BOOST_CHECK(res.exited_normally());
	BOOST_CHECK_EQUAL(res.output.data, "2 in.txt out file.txt\n");
}

BOOST_AUTO_TEST_CASE(sigterm_ignored_escalates_to_sigkill)
{
	ProtectedProcessConfig config(milliseconds(300));
	config.set_kill_grace(milliseconds(300));
	ExecutionResult res = protected_process("t", ProcessSpec::from_command("trap '' TERM; echo armed; sleep 5", true), "", config);
	BOOST_CHECK(res.timed_out);
	BOOST_CHECK(!res.exit_code.has_value());
	BOOST_REQUIRE(res.term_signal.has_value());
	BOOST_CHECK_EQUAL(res.term_signal.value(), SIGKILL);
	BOOST_CHECK_EQUAL(res.output.data, "armed\n");
	// SIGTERM 被忽略, 必须等满 grace 才会发出 SIGKILL
	BOOST_CHECK(res.elapsed >= milliseconds(550));
	BOOST_CHECK(res.elapsed < milliseconds(2000));
}

BOOST_AUTO_TEST_CASE(memory_limit_exceeded)
{
	using namespace kerbal::utility;

	// dd 申请一块 96 MB 的缓冲区并用 /dev/zero 填满, 常驻内存超过 64 MB 的限制, 但仍在两倍的地址空间限制之内
	ProtectedProcessConfig config(milliseconds(5000));
	config.set_max_memory(Byte(64LL * 1024 * 1024));
	ExecutionResult res = protected_process("t", ProcessSpec::from_command("dd if=/dev/zero of=/dev/null bs=96M count=1", false), "", config);
	BOOST_REQUIRE(!res.setup_failed());
	BOOST_CHECK(!res.timed_out);
	BOOST_CHECK(res.memory_exceeded);
	BOOST_CHECK(res.peak_memory > Byte(64LL * 1024 * 1024));

	config.set_max_memory(Byte(256LL * 1024 * 1024));
	res = protected_process("t", ProcessSpec::from_command("dd if=/dev/zero of=/dev/null bs=1M count=1", false), "", config);
	BOOST_CHECK(res.exited_normally());
	BOOST_CHECK(!res.memory_exceeded);
}

BOOST_AUTO_TEST_CASE(cpu_time_alone_is_not_a_timeout)
{
	// 子进程忙等约 400 ms, CPU 时间远超 100 ms, 但墙上时间在限制之内
	ProtectedProcessConfig config(milliseconds(5000));
	config.set_max_cpu_time(milliseconds(100));
	const char * script = "start=$(date +%s%N); while [ $(( $(date +%s%N) - start )) -lt 400000000 ]; do :; done; echo done";
	ExecutionResult res = protected_process("t", ProcessSpec::from_command(script, true), "", config);
	BOOST_CHECK(res.exited_normally());
	BOOST_CHECK(!res.timed_out);
	BOOST_CHECK_EQUAL(res.output.data, "done\n");
}

BOOST_AUTO_TEST_CASE(cpu_rlimit_is_a_safety_net)
{
	// RLIMIT_CPU 为 100 ms + 1 s 取整到秒, 死循环在墙上时限之前被 SIGXCPU 结束
	ProtectedProcessConfig config(milliseconds(10000));
	config.set_max_cpu_time(milliseconds(100));
	ExecutionResult res = protected_process("t", ProcessSpec::from_command("while :; do :; done", true), "", config);
	BOOST_CHECK(res.timed_out);
	BOOST_CHECK(!res.exit_code.has_value());
	BOOST_CHECK(res.elapsed < milliseconds(5000));
}
