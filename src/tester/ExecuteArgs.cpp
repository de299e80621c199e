/*
 * ExecuteArgs.cpp
 *
 *  Created on: 2019年4月2日
 */

#include "ExecuteArgs.hpp"

#include <boost/algorithm/string/join.hpp>

extern char ** environ;

ExecuteArgs::ExecuteArgs()
{
}

ExecuteArgs::ExecuteArgs(std::initializer_list<std::string> list) :
		args(list.begin(), list.end())
{
}

ExecuteArgs& ExecuteArgs::operator=(std::initializer_list<std::string> list)
{
	args.assign(list.begin(), list.end());
	return *this;
}

void ExecuteArgs::push_back(const std::string & arg)
{
	args.push_back(arg);
}

std::unique_ptr<char*[]> ExecuteArgs::getArgs() const
{
	typedef char * pointer_to_char;
	std::unique_ptr<pointer_to_char[]> res(new char*[args.size() + 1]);
	size_t i = 0;
	for (i = 0; i < args.size(); ++i) {
		res.get()[i] = const_cast<char*>(args[i].c_str());
	}
	res.get()[i] = NULL;
	return res;
}

ExecuteArgs ExecuteArgs::current_environment()
{
	ExecuteArgs env;
	for (char ** p = environ; p != nullptr && *p != nullptr; ++p) {
		env.args.emplace_back(*p);
	}
	return env;
}

std::ostream& operator<<(std::ostream & out, const ExecuteArgs & src)
{
	return out << "[" << boost::algorithm::join(src.args, ", ") << "]";
}
