/*
 * boost_format_suffix.hpp
 *
 *  Created on: 2019年4月2日
 */

#ifndef SRC_SHARED_SRC_BOOST_FORMAT_SUFFIX_HPP_
#define SRC_SHARED_SRC_BOOST_FORMAT_SUFFIX_HPP_

#include <string>
#include <initializer_list>
#include <boost/format.hpp>

/**
 * @brief "%s:%d"_fmt(a, b).str() 形式的格式化字面量
 */
struct format_helper
{
		boost::format templ;

		explicit format_helper(const char * s) : templ(s)
		{
		}

		template <typename ... Args>
		boost::format& operator()(Args && ... args)
		{
			(void) std::initializer_list<int> {((void) (templ % args), 0)...};
			return templ;
		}
};


inline format_helper operator""_fmt(const char * s, size_t)
{
	return format_helper(s);
}

#endif /* SRC_SHARED_SRC_BOOST_FORMAT_SUFFIX_HPP_ */
