/*!
 * @file
 * @brief Helper for splitting an absolute URL into parts.
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace stepgate::utils
{

//
// url_parts_t
//
//! Parts of an absolute http(s) URL.
struct url_parts_t
{
	//! The scheme: "http" or "https".
	std::string m_scheme;
	//! The scheme with the authority, like "https://example.com:8443".
	std::string m_origin;
	//! The path with the query string. It's "/" if the URL has no path.
	std::string m_target;
};

/*!
 * @brief Split an absolute http(s) URL.
 *
 * @return empty optional if @a url isn't an absolute http(s) URL.
 */
[[nodiscard]]
inline std::optional< url_parts_t >
split_url( std::string_view url )
{
	std::string_view scheme;
	if( url.substr( 0u, 8u ) == "https://" )
		scheme = "https";
	else if( url.substr( 0u, 7u ) == "http://" )
		scheme = "http";
	else
		return std::nullopt;

	const auto authority_start = scheme.size() + 3u;
	const auto target_start = url.find_first_of( "/?#", authority_start );
	const auto authority = url.substr( authority_start,
			std::string_view::npos == target_start ?
					std::string_view::npos : target_start - authority_start );

	// There should be a host and no userinfo.
	if( authority.empty() || '@' == authority.front() ||
			std::string_view::npos != authority.find( '@' ) ||
			std::string_view::npos != authority.find_first_of( " \t\r\n" ) )
		return std::nullopt;

	url_parts_t result;
	result.m_scheme = std::string{ scheme };
	result.m_origin = std::string{ url.substr( 0u, authority_start ) } +
			std::string{ authority };

	if( std::string_view::npos == target_start )
		result.m_target = "/";
	else
	{
		auto target = url.substr( target_start );
		// Fragments aren't sent to servers.
		target = target.substr( 0u, target.find( '#' ) );
		if( target.empty() )
			result.m_target = "/";
		else if( '/' == target.front() )
			result.m_target = std::string{ target };
		else
			result.m_target = "/" + std::string{ target };
	}

	return result;
}

} /* namespace stepgate::utils */
