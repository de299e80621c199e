/*
 * ProcessSpec.cpp
 *
 *  Created on: 2019年4月2日
 */

#include "ProcessSpec.hpp"

#include <vector>
#include <stdexcept>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/trim.hpp>

ProcessSpec::ProcessSpec() :
		env(ExecuteArgs::current_environment())
{
}

ProcessSpec::ProcessSpec(const ExecuteArgs & args) :
		args(args), env(ExecuteArgs::current_environment())
{
}

ProcessSpec ProcessSpec::from_command(const std::string & command, bool shell)
{
	const std::string trimmed = boost::algorithm::trim_copy(command);
	if (trimmed.empty()) {
		throw std::invalid_argument("empty command");
	}

	if (shell) {
		// "sh" 占据 $0, 使追加的参数从 $1 开始
		return ProcessSpec({"/bin/sh", "-c", command, "sh"});
	}

	std::vector<std::string> words;
	boost::algorithm::split(words, trimmed, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
	return ProcessSpec(ExecuteArgs(words.begin(), words.end()));
}

ProcessSpec ProcessSpec::with_extra_args(const std::vector<std::string> & extra) const
{
	ProcessSpec res(*this);
	for (const std::string & arg : extra) {
		res.args.push_back(arg);
	}
	return res;
}

std::ostream& operator<<(std::ostream & out, const ProcessSpec & spec)
{
	out << spec.args;
	if (!spec.working_dir.empty()) {
		out << " in " << spec.working_dir;
	}
	return out;
}
