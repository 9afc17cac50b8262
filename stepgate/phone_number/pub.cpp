/*!
 * @file
 * @brief Normalization of phone numbers into E.164 form.
 */

#include <stepgate/phone_number/pub.hpp>

#include <algorithm>
#include <cctype>

namespace stepgate::phone_number
{

namespace
{

constexpr std::size_t min_international_digits = 8u;
constexpr std::size_t max_international_digits = 15u;

[[nodiscard]]
bool
is_digit( char ch ) noexcept
{
	return std::isdigit( static_cast< unsigned char >(ch) ) != 0;
}

} /* anonymous namespace */

[[nodiscard]]
std::optional< e164_phone_t >
normalize_phone( std::string_view raw )
{
	// The leading '+' is significant only if it is the first
	// non-space symbol of the input.
	const auto first = raw.find_first_not_of( " \t" );
	const bool explicit_plus =
			std::string_view::npos != first && '+' == raw[ first ];

	std::string digits;
	digits.reserve( raw.size() );
	std::copy_if( raw.begin(), raw.end(), std::back_inserter(digits),
			is_digit );

	if( explicit_plus )
	{
		if( digits.size() < min_international_digits ||
				digits.size() > max_international_digits )
			return std::nullopt;

		return e164_phone_t{ "+" + digits };
	}

	if( 10u == digits.size() )
		return e164_phone_t{ "+1" + digits };

	if( 11u == digits.size() && '1' == digits.front() )
		return e164_phone_t{ "+" + digits };

	return std::nullopt;
}

std::ostream &
operator<<( std::ostream & to, const e164_phone_t & phone )
{
	return (to << phone.value());
}

} /* namespace stepgate::phone_number */
