/*
 * tester.cpp
 *
 *  Created on: 2019年4月10日
 */

#include "logger.hpp"
#include "tester_settings.hpp"
#include "RunConfig.hpp"
#include "CaseStore.hpp"
#include "TestOrchestrator.hpp"
#include "Reporter.hpp"
#include "SplitInput.hpp"

#include <iostream>
#include <fstream>
#include <atomic>
#include <csignal>

#include <cmdline.h>

#include <boost/filesystem.hpp>
#include <kerbal/utility/costream.hpp>
#include <kerbal/utility/storage.hpp>

using std::cout;
using std::cerr;
using std::endl;


std::ofstream log_fp;

namespace
{
	enum ExitStatus
	{
		EXIT_ALL_ACCEPTED = 0,
		EXIT_NOT_ALL_ACCEPTED = 1,
		EXIT_CONFIG_ERROR = 2,
	};

	std::atomic<TestOrchestrator *> running_orchestrator(nullptr);

	/**
	 * @brief 收到 SIGINT 或 SIGTERM 时强制终止正在进行的运行, 已得到的结果保留
	 * @throw 该函数保证不抛出任何异常
	 */
	void regist_stop_handler(int signum) noexcept
	{
		if (signum == SIGINT || signum == SIGTERM) {
			TestOrchestrator * orchestrator = running_orchestrator.load();
			if (orchestrator != nullptr) {
				orchestrator->request_hard_stop();
			}
		}
	}

	enum class Subcommand
	{
		TEST,
		GENERATE_OUTPUT,
		SPLIT_INPUT,
	};

	void print_usage()
	{
		cerr << "usage: ts_tester test [options] [case-files...]" << endl
			 << "       ts_tester generate-output [options] [input-files...]" << endl
			 << "       ts_tester split-input -i <input> -o <output-format> [options]" << endl
			 << "run 'ts_tester <subcommand> --help' for the options" << endl;
	}

	void add_options(cmdline::parser & parser, Subcommand subcommand)
	{
		parser.add<std::string>("command", 'c', "your solution to be tested.", false, "./a.out");
		parser.add("shell", '\0', "use the --command as a shellscript instead of a path.");
		parser.add<std::string>("conf", '\0', "Specify configure description file path.", false, "");
		parser.add<std::string>("log", 'l', "Specify log file path.", false, "");
		parser.add("verbose", 'v', "echo debug logs to the console.");
		parser.add("help", '?', "print this message.");

		if (subcommand == Subcommand::SPLIT_INPUT) {
			parser.add<std::string>("input", 'i', "input file which contains many cases. (required)", false, "");
			parser.add<std::string>("output", 'o', "output path. (%i: index, required)", false, "");
			parser.add<double>("time", 't', "the interval between two cases in seconds. (default: 0.1)", false, 0.1);
			parser.add<int>("ignore", '\0', "ignore initial N lines of input.", false, 0);
			parser.add<std::string>("header", '\0', "put a header string to the output.", false, "");
			parser.add<std::string>("footer", '\0', "put a footer string to the output.", false, "");
			parser.add("auto-footer", '\0', "use the original last line as a footer.");
			return;
		}

		parser.add<std::string>("format", 'f', "a format string to recognize the relationship of test cases. (%s: name, %e: in or out)", false, "test/%s.%e");
		parser.add<double>("tle", 't', "time limit in seconds. (default: 2)", false, 2.0);
		parser.add<double>("mle", '\0', "memory limit in MiB. (default: unlimited)", false, 0);
		if (subcommand != Subcommand::TEST) {
			return;
		}
		parser.add<std::string>("mode", 'm', "compare mode: exact, whitespace, float, line or checker. (default: whitespace)", false, "whitespace");
		parser.add("line", '1', "equivalent to --mode line.");
		parser.add("rstrip", '\0', "rstrip output and correct answer before comparison.");
		parser.add<double>("epsilon", 'e', "error tolerance for --mode float. (default: 1e-6)", false, 1e-6);
		parser.add<std::string>("checker", '\0', "special judge command, called as: checker <input> <output> [<expected>]", false, "");
		parser.add<std::string>("judge", '\0', "reactive judge command, called as: judge <input> [<expected>]", false, "");
		parser.add<int>("jobs", 'j', "number of cases run at the same time. (default: 1)", false, 1);
		parser.add("fail-fast", '\0', "stop dispatching cases after the first failure.");
		parser.add("hard-stop", '\0', "with --fail-fast, also kill the cases still running.");
		parser.add("silent", 's', "don't report output and correct answer even if not AC.");
		parser.add<std::string>("json", '\0', "write the summary as JSON to the file ('-' for stdout).", false, "");
	}

	/**
	 * @brief 命令行参数覆盖配置文件中的值
	 */
	void apply_options(const cmdline::parser & parser, RunConfig & config, Subcommand subcommand)
	{
		using namespace kerbal::utility;

		if (subcommand == Subcommand::SPLIT_INPUT) {
			return;
		}
		if (parser.exist("tle")) {
			config.limits.time_limit = std::chrono::milliseconds(static_cast<long long>(parser.get<double>("tle") * 1000));
		}
		if (parser.exist("mle")) {
			config.limits.memory_limit = Byte(static_cast<long long>(parser.get<double>("mle") * 1024 * 1024));
		}
		if (subcommand != Subcommand::TEST) {
			return;
		}
		if (parser.exist("mode")) {
			config.policy = parse_compare_policy(parser.get<std::string>("mode"));
		}
		if (parser.exist("line")) {
			config.policy = ComparePolicy::LINE;
		}
		if (parser.exist("rstrip")) {
			config.rstrip = true;
		}
		if (parser.exist("epsilon")) {
			config.epsilon = parser.get<double>("epsilon");
		}
		if (parser.exist("checker")) {
			// --shell 只作用于 --command, checker 与 judge 总是按离散参数执行
			config.checker = ProcessSpec::from_command(parser.get<std::string>("checker"), false);
		}
		if (parser.exist("judge")) {
			config.judge = ProcessSpec::from_command(parser.get<std::string>("judge"), false);
		}
		if (parser.exist("jobs")) {
			config.concurrency = parser.get<int>("jobs");
		}
		if (parser.exist("fail-fast")) {
			config.fail_fast = true;
		}
		if (parser.exist("hard-stop")) {
			config.hard_stop = true;
		}
	}

	int run_test(const cmdline::parser & parser, const RunConfig & config, const ProcessSpec & candidate)
	{
		const CaseStore store = CaseStore::load_from_format(parser.get<std::string>("format"), parser.rest());
		if (store.empty()) {
			cerr << "no cases found for format: " << parser.get<std::string>("format") << endl;
			return EXIT_CONFIG_ERROR;
		}
		const std::vector<TestCase> & cases = store.get_cases();

		TestOrchestrator orchestrator(config);
		ConsoleReporter reporter(cases, parser.exist("silent"));

		running_orchestrator = &orchestrator;
		signal(SIGINT, regist_stop_handler);
		signal(SIGTERM, regist_stop_handler);

		RunSummary summary;
		try {
			summary = orchestrator.run(cases, candidate, [&reporter](const CaseReport & report) {
				reporter.on_case(report);
			});
		} catch (...) {
			running_orchestrator = nullptr;
			throw;
		}
		running_orchestrator = nullptr;

		reporter.on_summary(summary);

		const std::string json_path = parser.get<std::string>("json");
		if (!json_path.empty()) {
			const std::string dumped = to_json(summary).dump(4);
			if (json_path == "-") {
				cout << dumped << endl;
			} else {
				std::ofstream fout(json_path);
				fout << dumped << endl;
				if (!fout) {
					LOG_WARNING(RUN_LEVEL_ID, log_fp, "Write json summary failed: ", json_path);
				}
			}
		}

		return summary.all_accepted() ? EXIT_ALL_ACCEPTED : EXIT_NOT_ALL_ACCEPTED;
	}

	int run_split_input(const cmdline::parser & parser, const RunConfig & config, const ProcessSpec & command)
	{
		if (parser.get<std::string>("input").empty() || parser.get<std::string>("output").empty()) {
			throw std::invalid_argument("split-input requires both --input and --output");
		}

		SplitInputOptions options;
		options.input = parser.get<std::string>("input");
		options.output_format = parser.get<std::string>("output");
		options.interval = std::chrono::milliseconds(static_cast<long long>(parser.get<double>("time") * 1000));
		if (parser.get<int>("ignore") < 0) {
			throw std::invalid_argument("--ignore must not be negative");
		}
		options.ignore = static_cast<size_t>(parser.get<int>("ignore"));
		options.header = parser.get<std::string>("header");
		if (parser.exist("footer")) {
			options.footer = parser.get<std::string>("footer");
		}
		options.auto_footer = parser.exist("auto-footer");

		const SplitInputReport report = split_input(options, command, config);
		for (const boost::filesystem::path & path : report.written) {
			cout << "case saved to: " << path.string() << endl;
		}
		if (!report.leftover.empty()) {
			cerr << "lines after the last case were not saved:" << endl << report.leftover;
		}
		return report.written.empty() ? EXIT_NOT_ALL_ACCEPTED : EXIT_ALL_ACCEPTED;
	}

	int run_generate_output(const cmdline::parser & parser, const RunConfig & config, const ProcessSpec & reference)
	{
		const GenerateOutputReport report = generate_output(parser.get<std::string>("format"), parser.rest(), reference, config);
		for (const std::string & name : report.generated) {
			cout << "generated: " << name << endl;
		}
		for (const std::string & name : report.kept) {
			cout << "output already exists, skipped: " << name << endl;
		}
		for (const std::string & name : report.failed) {
			cerr << "reference program failed: " << name << endl;
		}
		return report.failed.empty() ? EXIT_ALL_ACCEPTED : EXIT_NOT_ALL_ACCEPTED;
	}

} /* namespace */

int main(int argc, char * argv[]) try
{
	using namespace kerbal::utility::costream;
	const auto & ccerr = costream<std::cerr>(LIGHT_RED);

	if (argc < 2) {
		print_usage();
		return EXIT_CONFIG_ERROR;
	}

	const std::string subcommand_name = argv[1];
	Subcommand subcommand;
	if (subcommand_name == "test" || subcommand_name == "t") {
		subcommand = Subcommand::TEST;
	} else if (subcommand_name == "generate-output" || subcommand_name == "g/o") {
		subcommand = Subcommand::GENERATE_OUTPUT;
	} else if (subcommand_name == "split-input" || subcommand_name == "s/i") {
		subcommand = Subcommand::SPLIT_INPUT;
	} else if (subcommand_name == "--help" || subcommand_name == "-h") {
		print_usage();
		return EXIT_ALL_ACCEPTED;
	} else {
		ccerr << "unknown subcommand: " << subcommand_name << endl;
		print_usage();
		return EXIT_CONFIG_ERROR;
	}

	cmdline::parser parser;
	parser.set_program_name("ts_tester " + subcommand_name);
	add_options(parser, subcommand);

	if (!parser.parse(argc - 1, argv + 1)) {
		ccerr << parser.error_full();
		cerr << parser.usage();
		return EXIT_CONFIG_ERROR;
	}
	if (parser.exist("help")) {
		cout << parser.usage();
		return EXIT_ALL_ACCEPTED;
	}

	if (parser.exist("verbose")) {
		ts_tester::log::console_level = LogLevel::LEVEL_DEBUG;
	}

	Settings settings;
	RunConfig config;
	ProcessSpec candidate;
	try {
		const std::string conf = parser.get<std::string>("conf");
		if (!conf.empty()) {
			settings.parse(conf);
		}
		config = settings.test;
		apply_options(parser, config, subcommand);
		candidate = ProcessSpec::from_command(parser.get<std::string>("command"), parser.exist("shell"));
	} catch (const SettingsParseException & e) {
		ccerr << e.what() << endl;
		return EXIT_CONFIG_ERROR;
	} catch (const std::invalid_argument & e) {
		ccerr << "invalid argument: " << e.what() << endl;
		return EXIT_CONFIG_ERROR;
	}

	// 提醒: log_fp 打开之前 log 系列宏只回显到控制台
	std::string log_path = parser.get<std::string>("log");
	if (log_path.empty()) {
		log_path = settings.runtime.log_file_path.string();
	}
	if (log_path.empty()) {
		log_path = "/dev/null";
	}
	log_fp.open(log_path, std::ios::app);
	if (!log_fp) {
		ccerr << "cannot open log file: " << log_path << endl;
		return EXIT_CONFIG_ERROR;
	}
	LOG_INFO(RUN_LEVEL_ID, log_fp, "ts_tester ", subcommand_name, " starting. config: ", config);

	try {
		switch (subcommand) {
			case Subcommand::TEST:
				return run_test(parser, config, candidate);
			case Subcommand::GENERATE_OUTPUT:
				return run_generate_output(parser, config, candidate);
			case Subcommand::SPLIT_INPUT:
				return run_split_input(parser, config, candidate);
		}
		return EXIT_CONFIG_ERROR;
	} catch (const InvalidConfigException & e) {
		ccerr << "invalid configuration: " << e.what() << endl;
		return EXIT_CONFIG_ERROR;
	} catch (const CaseLoadException & e) {
		ccerr << "load cases failed: " << e.what() << endl;
		return EXIT_CONFIG_ERROR;
	} catch (const std::invalid_argument & e) {
		ccerr << "invalid argument: " << e.what() << endl;
		return EXIT_CONFIG_ERROR;
	}

} catch (const std::exception & e) {
	EXCEPT_FATAL(RUN_LEVEL_ID, log_fp, "An uncaught exception caught by main.", e);
	throw;
} catch (...) {
	UNKNOWN_EXCEPT_FATAL(RUN_LEVEL_ID, log_fp, "An uncaught exception caught by main.");
	throw;
}
