/*!
 * @file
 * @brief Normalization of phone numbers into E.164 form.
 */

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace stepgate::phone_number
{

//
// e164_phone_t
//
/*!
 * @brief A phone number in E.164 form (`+` followed by digits).
 *
 * An instance can be obtained only via normalize_phone(). It means that
 * any function that accepts e164_phone_t gets an already validated value.
 */
class e164_phone_t
{
	friend std::optional< e164_phone_t >
	normalize_phone( std::string_view raw );

	std::string m_value;

	explicit e164_phone_t( std::string value )
		:	m_value{ std::move(value) }
	{}

public:
	[[nodiscard]]
	const std::string &
	value() const noexcept { return m_value; }

	[[nodiscard]]
	bool
	operator==( const e164_phone_t & o ) const noexcept
	{
		return m_value == o.m_value;
	}
};

/*!
 * @brief Transform a phone number entered by a user into E.164 form.
 *
 * All symbols except digits and a leading '+' are removed. Then:
 *
 * - a number with explicit leading '+' is accepted as is if it has
 *   from 8 to 15 digits;
 * - a 10-digit number is treated as US number and gets "+1" prefix;
 * - a 11-digit number started with '1' gets "+" prefix.
 *
 * Everything else is rejected.
 *
 * @return empty optional if @a raw can't be normalized.
 */
[[nodiscard]]
std::optional< e164_phone_t >
normalize_phone( std::string_view raw );

// For debugging purposes only.
std::ostream &
operator<<( std::ostream & to, const e164_phone_t & phone );

} /* namespace stepgate::phone_number */
