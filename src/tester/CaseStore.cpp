/*
 * CaseStore.cpp
 *
 *  Created on: 2019年4月9日
 */

#include "CaseStore.hpp"
#include "ProtectedProcess.hpp"
#include "logger.hpp"

#include <set>
#include <cctype>
#include <fstream>
#include <sstream>
#include <algorithm>

#include <boost/regex.hpp>
#include <boost/filesystem.hpp>

extern std::ofstream log_fp;

namespace
{
	std::string substitute(const std::string & pattern, const std::string & name, const std::string & ext)
	{
		std::string res;
		for (size_t i = 0; i < pattern.size(); ++i) {
			if (pattern[i] == '%' && i + 1 < pattern.size()) {
				switch (pattern[i + 1]) {
					case 's':
						res += name;
						++i;
						continue;
					case 'e':
						res += ext;
						++i;
						continue;
					case '%':
						res += '%';
						++i;
						continue;
				}
			}
			res += pattern[i];
		}
		return res;
	}

	/**
	 * @brief 把文件名格式转为正则表达式, 同时记录 %s 与 %e 对应的捕获组序号
	 */
	std::string to_regex(const std::string & pattern, int & name_group, int & ext_group)
	{
		static const std::string special = ".[]{}()\\*+?^$|";
		std::string res;
		int group = 0;
		name_group = 0;
		ext_group = 0;
		for (size_t i = 0; i < pattern.size(); ++i) {
			if (pattern[i] == '%' && i + 1 < pattern.size()) {
				char c = pattern[++i];
				if (c == 's') {
					res += "(.+)";
					name_group = ++group;
					continue;
				} else if (c == 'e') {
					res += "(in|out)";
					ext_group = ++group;
					continue;
				} else if (c != '%') {
					--i;
				}
			}
			if (special.find(pattern[i]) != std::string::npos) {
				res += '\\';
			}
			res += pattern[i];
		}
		return res;
	}

	bool is_hidden_or_backup(const std::string & file_name)
	{
		return file_name.empty() || file_name.front() == '.' || file_name.back() == '~';
	}

} /* namespace */

CaseFormat::CaseFormat(const std::string & format) :
		format(format)
{
	std::string::size_type slash = format.rfind('/');
	if (slash == std::string::npos) {
		directory = ".";
		file_pattern = format;
	} else {
		directory = slash == 0 ? std::string("/") : format.substr(0, slash);
		file_pattern = format.substr(slash + 1);
	}

	if (directory.string().find('%') != std::string::npos) {
		throw CaseLoadException("format " + format + ": %s and %e may only appear in the file name");
	}

	size_t count_s = 0, count_e = 0;
	for (size_t i = 0; i + 1 < file_pattern.size(); ++i) {
		if (file_pattern[i] == '%') {
			count_s += file_pattern[i + 1] == 's';
			count_e += file_pattern[i + 1] == 'e';
			++i;
		}
	}
	if (count_s != 1 || count_e != 1) {
		throw CaseLoadException("format " + format + ": %s and %e are required, each exactly once");
	}
}

boost::filesystem::path CaseFormat::make_path(const std::string & name, const std::string & ext) const
{
	return directory / substitute(file_pattern, name, ext);
}

bool CaseFormat::match(const boost::filesystem::path & path, std::string & name, std::string & ext) const
{
	int name_group, ext_group;
	const boost::regex re(to_regex(file_pattern, name_group, ext_group));
	boost::smatch what;
	const std::string file_name = path.filename().string();
	if (!boost::regex_match(file_name, what, re)) {
		return false;
	}
	name = what[name_group].str();
	ext = what[ext_group].str();
	return true;
}

std::vector<CasePaths> CaseFormat::discover(const std::vector<std::string> & paths) const
{
	namespace fs = boost::filesystem;

	std::vector<CasePaths> res;
	std::string name, ext;

	if (!paths.empty()) {
		std::set<fs::path> seen;
		for (const std::string & given : paths) {
			const fs::path p(given);
			if (!this->match(p, name, ext)) {
				throw CaseLoadException("path " + given + " does not match format " + format);
			}
			const fs::path parent = p.parent_path();
			const fs::path input = parent / substitute(file_pattern, name, "in");
			if (!seen.insert(input).second) {
				continue;
			}
			const fs::path output = parent / substitute(file_pattern, name, "out");
			boost::system::error_code ec;
			res.push_back(CasePaths{name, input, output, fs::is_regular_file(output, ec)});
		}
		return res;
	}

	boost::system::error_code ec;
	if (!fs::is_directory(directory, ec)) {
		LOG_WARNING(RUN_LEVEL_ID, log_fp, "Case directory does not exist: ", directory);
		return res;
	}

	for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
		const fs::path & p = it->path();
		boost::system::error_code stat_ec;
		if (!fs::is_regular_file(p, stat_ec) || is_hidden_or_backup(p.filename().string())) {
			continue;
		}
		if (!this->match(p, name, ext) || ext != "in") {
			continue;
		}
		const fs::path output = this->make_path(name, "out");
		res.push_back(CasePaths{name, p, output, fs::is_regular_file(output, stat_ec)});
	}
	if (ec) {
		throw CaseLoadException("read directory " + directory.string() + " failed: " + ec.message());
	}

	std::sort(res.begin(), res.end(), [](const CasePaths & a, const CasePaths & b) {
		return natural_less(a.name, b.name);
	});
	return res;
}

bool natural_less(const std::string & a, const std::string & b)
{
	size_t i = 0, j = 0;
	while (i < a.size() && j < b.size()) {
		if (std::isdigit(static_cast<unsigned char>(a[i])) && std::isdigit(static_cast<unsigned char>(b[j]))) {
			size_t ei = i, ej = j;
			while (ei < a.size() && std::isdigit(static_cast<unsigned char>(a[ei]))) {
				++ei;
			}
			while (ej < b.size() && std::isdigit(static_cast<unsigned char>(b[ej]))) {
				++ej;
			}
			// 去掉前导零后先比较位数, 再逐位比较
			size_t zi = i, zj = j;
			while (zi + 1 < ei && a[zi] == '0') {
				++zi;
			}
			while (zj + 1 < ej && b[zj] == '0') {
				++zj;
			}
			if (ei - zi != ej - zj) {
				return ei - zi < ej - zj;
			}
			int cmp = a.compare(zi, ei - zi, b, zj, ej - zj);
			if (cmp != 0) {
				return cmp < 0;
			}
			i = ei;
			j = ej;
			continue;
		}
		if (a[i] != b[j]) {
			return a[i] < b[j];
		}
		++i;
		++j;
	}
	if ((a.size() - i) != (b.size() - j)) {
		return a.size() - i < b.size() - j;
	}
	return a < b;
}

std::string read_whole_file(const boost::filesystem::path & path)
{
	std::ifstream fin(path.native(), std::ios::in | std::ios::binary);
	if (!fin) {
		throw CaseLoadException("cannot open " + path.string());
	}
	std::ostringstream buf;
	buf << fin.rdbuf();
	if (fin.bad()) {
		throw CaseLoadException("read " + path.string() + " failed");
	}
	return buf.str();
}

void CaseStore::add(const TestCase & test_case)
{
	for (const TestCase & ele : cases) {
		if (ele.id == test_case.id) {
			throw CaseLoadException("duplicate case id: " + test_case.id);
		}
	}
	cases.push_back(test_case);
}

CaseStore CaseStore::load_from_format(const std::string & format, const std::vector<std::string> & paths)
{
	const CaseFormat case_format(format);
	CaseStore store;
	for (const CasePaths & ele : case_format.discover(paths)) {
		TestCase test_case(ele.name, read_whole_file(ele.input));
		if (ele.output_exists) {
			test_case.expected_output = read_whole_file(ele.output);
		}
		LOG_DEBUG(ele.name, log_fp, "Loaded case. input: ", ele.input, " output: ", (ele.output_exists ? ele.output.string() : "(none)"));
		store.add(test_case);
	}
	return store;
}

GenerateOutputReport generate_output(const std::string & format, const std::vector<std::string> & paths,
										const ProcessSpec & reference, const RunConfig & config)
{
	const CaseFormat case_format(format);
	GenerateOutputReport report;

	for (const CasePaths & ele : case_format.discover(paths)) {
		if (ele.output_exists) {
			LOG_WARNING(ele.name, log_fp, "Output file already exists, skipped: ", ele.output);
			report.kept.push_back(ele.name);
			continue;
		}

		const std::string input = read_whole_file(ele.input);
		const ExecutionResult result = protected_process(ele.name, reference, input, config.process_config(config.limits, nullptr));
		if (!result.exited_normally() || result.output.truncated()) {
			LOG_WARNING(ele.name, log_fp, "Reference program failed: ", result);
			report.failed.push_back(ele.name);
			continue;
		}

		std::ofstream fout(ele.output.native(), std::ios::out | std::ios::binary);
		fout.write(result.output.data.data(), result.output.data.size());
		fout.close();
		if (!fout) {
			throw CaseLoadException("write " + ele.output.string() + " failed");
		}
		LOG_INFO(ele.name, log_fp, "Output generated: ", ele.output);
		report.generated.push_back(ele.name);
	}
	return report;
}
