/*!
 * @file
 * @brief A helper class for line-by-line processing of a config content.
 */

#pragma once

#include <cstdint>
#include <string_view>

namespace stepgate::utils
{

//
// line_reader_t
//
/*!
 * @brief A helper class for line-by-line processing of a char array.
 *
 * Empty lines and lines started with '#' (after optional leading spaces)
 * are skipped. Leading and trailing spaces are removed from all
 * other lines. Both LF and CRLF line endings are accepted.
 *
 * Usage example:
 * @code
 * line_reader_t reader{ content };
 * reader.for_each_line( [&]( const line_reader_t::line_t & line ) {
 * 	handle( line.number(), line.content() );
 * } );
 * @endcode
 */
class line_reader_t
{
public:
	//! Type for holding line numbers.
	using line_number_t = std::uint_fast32_t;

	class line_t
	{
		friend class line_reader_t;

		std::string_view m_content;
		line_number_t m_number;

		line_t(
			std::string_view content,
			line_number_t number )
			:	m_content{ content }
			,	m_number{ number }
		{}

	public:
		[[nodiscard]]
		std::string_view
		content() const noexcept { return m_content; }

		[[nodiscard]]
		line_number_t
		number() const noexcept { return m_number; }
	};

	line_reader_t( std::string_view content ) noexcept
		:	m_content{ content }
	{}

	[[nodiscard]]
	static constexpr std::string_view
	spaces() noexcept { return { " \t\x0b\r" }; }

	template< typename Handler >
	void
	for_each_line( Handler && handler ) const
	{
		std::string_view rest = m_content;
		line_number_t number{ 0u };

		while( !rest.empty() )
		{
			++number;

			const auto eol = rest.find( '\n' );
			std::string_view line = rest.substr( 0u, eol );
			rest.remove_prefix(
					std::string_view::npos == eol ? rest.size() : eol + 1u );

			const auto first = line.find_first_not_of( spaces() );
			if( std::string_view::npos == first || '#' == line[ first ] )
				continue;

			const auto last = line.find_last_not_of( spaces() );
			handler( line_t{ line.substr( first, last - first + 1u ), number } );
		}
	}

private:
	const std::string_view m_content;
};

} /* namespace stepgate::utils */
