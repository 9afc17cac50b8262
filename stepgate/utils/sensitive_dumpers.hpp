/*!
 * @file
 * @brief Helpers for printing sensitive values into logs.
 */

#pragma once

#include <fmt/ostream.h>

#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace stepgate::sensitive_dumpers
{

/*!
 * @brief A special wrapper for printing a token, a ticket or a secret.
 *
 * The value itself is never printed, only its presence and length.
 *
 * Usage example:
 *
 * @code
 * using namespace stepgate::sensitive_dumpers;
 *
 * fmt::format( "session={}, challenge={}",
 * 	secret_dumper_t{ session_token },
 * 	opt_secret_dumper_t{ challenge_id } );
 * @endcode
 */
struct secret_dumper_t
{
	std::string_view m_value;
};

inline std::ostream &
operator<<( std::ostream & to, const secret_dumper_t & d )
{
	return (to << "<redacted:" << d.m_value.size() << '>');
}

/*!
 * @brief A special wrapper for printing an optional token.
 */
struct opt_secret_dumper_t
{
	const std::optional< std::string > & m_value;
};

inline std::ostream &
operator<<( std::ostream & to, const opt_secret_dumper_t & d )
{
	if( d.m_value )
		to << secret_dumper_t{ *(d.m_value) };
	else
		to << "<none>";

	return to;
}

/*!
 * @brief A special wrapper for printing a phone number.
 *
 * Only the last four digits are shown.
 */
struct phone_dumper_t
{
	std::string_view m_phone;
};

inline std::ostream &
operator<<( std::ostream & to, const phone_dumper_t & d )
{
	constexpr std::size_t visible = 4u;
	if( d.m_phone.size() <= visible )
		return (to << "***");

	return (to << "***" << d.m_phone.substr( d.m_phone.size() - visible ));
}

} /* namespace stepgate::sensitive_dumpers */

template<> struct fmt::formatter<
		stepgate::sensitive_dumpers::secret_dumper_t >
	:	public fmt::ostream_formatter
{};

template<> struct fmt::formatter<
		stepgate::sensitive_dumpers::opt_secret_dumper_t >
	:	public fmt::ostream_formatter
{};

template<> struct fmt::formatter<
		stepgate::sensitive_dumpers::phone_dumper_t >
	:	public fmt::ostream_formatter
{};
