/*!
 * @file
 * @brief Helper function that throws an exception if some
 * system call returns an error.
 */

#pragma once

#include <cerrno>
#include <string>
#include <system_error>

namespace stepgate::utils
{

//! Throws std::system_error with the current errno if @a ret_code is -1.
inline void
ensure_successful_syscall( int ret_code, const char * what )
{
	if( -1 == ret_code )
	{
		throw std::system_error{
				errno, std::system_category(), std::string{ what } };
	}
}

} /* namespace stepgate::utils */
