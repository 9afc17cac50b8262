/*!
 * @file
 * @brief Helper function for loading the whole file content into memory.
 */

#pragma once

#include <stepgate/exception.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace stepgate::utils
{

// An exception is thrown in the case of the absence of the file or
// if there is some reading error.
[[nodiscard]]
inline std::string
load_file_into_memory(
	const std::filesystem::path & file_name )
{
	std::ifstream file{ file_name, std::ios_base::in | std::ios_base::binary };
	if( !file )
		throw exception_t{
				fmt::format( "unable to open file '{}'", file_name.string() )
			};

	std::string content{
			std::istreambuf_iterator< char >{ file },
			std::istreambuf_iterator< char >{} };

	if( file.bad() )
		throw exception_t{
				fmt::format( "error reading file '{}'", file_name.string() )
			};

	return content;
}

} /* namespace stepgate::utils */
