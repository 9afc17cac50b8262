/*!
 * @file
 * @brief The public interface of route gate.
 */

#include <stepgate/route_gate/pub.hpp>

#include <stepgate/cookie_store/pub.hpp>

#include <stepgate/logging/wrap_logging.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace stepgate::route_gate
{

namespace
{

[[nodiscard]]
std::optional< unsigned >
hex_digit_value( char ch ) noexcept
{
	if( ch >= '0' && ch <= '9' )
		return static_cast< unsigned >( ch - '0' );
	if( ch >= 'a' && ch <= 'f' )
		return static_cast< unsigned >( ch - 'a' + 10 );
	if( ch >= 'A' && ch <= 'F' )
		return static_cast< unsigned >( ch - 'A' + 10 );

	return std::nullopt;
}

[[nodiscard]]
std::optional< std::string >
percent_decode( std::string_view what )
{
	std::string result;
	result.reserve( what.size() );

	for( std::size_t i = 0u; i < what.size(); ++i )
	{
		char ch = what[ i ];
		if( '%' == ch )
		{
			if( i + 2u >= what.size() )
				return std::nullopt;

			const auto hi = hex_digit_value( what[ i + 1u ] );
			const auto lo = hex_digit_value( what[ i + 2u ] );
			if( !hi || !lo )
				return std::nullopt;

			ch = static_cast< char >( (*hi << 4u) | *lo );
			i += 2u;
		}

		if( '\0' == ch || '\\' == ch )
			return std::nullopt;

		result += ch;
	}

	return result;
}

} /* anonymous namespace */

[[nodiscard]]
std::optional< std::string >
normalize_path( std::string_view raw_path )
{
	auto decoded = percent_decode( raw_path );
	if( !decoded || decoded->empty() || '/' != decoded->front() )
		return std::nullopt;

	std::vector< std::string_view > segments;
	std::string_view rest{ *decoded };
	while( !rest.empty() )
	{
		const auto slash = rest.find( '/' );
		const auto segment = rest.substr( 0u, slash );
		rest.remove_prefix(
				std::string_view::npos == slash ? rest.size() : slash + 1u );

		if( segment.empty() || "." == segment )
			continue;

		if( ".." == segment )
		{
			if( segments.empty() )
				return std::nullopt;
			segments.pop_back();
			continue;
		}

		segments.push_back( segment );
	}

	std::string result;
	for( const auto & s : segments )
	{
		result += '/';
		result.append( s.data(), s.size() );
	}

	// The trailing slash is significant for static content.
	if( result.empty() || '/' == decoded->back() )
		result += '/';

	return result;
}

[[nodiscard]]
std::optional< std::string >
normalize_protected_prefix( std::string_view raw_prefix )
{
	auto result = normalize_path( raw_prefix );
	if( !result )
		return std::nullopt;

	while( !result->empty() && '/' == result->back() )
		result->pop_back();

	if( result->empty() )
		return std::nullopt;

	return result;
}

namespace
{

[[nodiscard]]
std::vector< std::string >
normalize_protected_prefixes( std::vector< std::string > prefixes )
{
	for( auto & p : prefixes )
	{
		auto normalized = normalize_protected_prefix( p );
		if( !normalized )
			throw exception_t{
					fmt::format( "invalid protected prefix: '{}'", p )
				};

		p = std::move(*normalized);
	}

	return prefixes;
}

} /* anonymous namespace */

//
// route_gate_t
//
route_gate_t::route_gate_t(
	std::vector< std::string > protected_prefixes,
	std::string entry_point,
	const credential_signer::credential_signer_t & signer )
	:	m_protected_prefixes{
			normalize_protected_prefixes( std::move(protected_prefixes) ) }
	,	m_entry_point{ std::move(entry_point) }
	,	m_signer{ signer }
{}

[[nodiscard]]
bool
route_gate_t::is_protected( std::string_view raw_path ) const
{
	const auto path = normalize_path( raw_path );
	if( !path )
		return true;

	return std::any_of(
			m_protected_prefixes.begin(), m_protected_prefixes.end(),
			[&path]( const std::string & prefix ) {
				return 0 == path->compare( 0u, prefix.size(), prefix );
			} );
}

[[nodiscard]]
decision_t
route_gate_t::check(
	std::string_view raw_path,
	std::string_view cookie_header,
	credential_signer::clock_type::time_point now ) const
{
	if( !is_protected( raw_path ) )
		return pass_t{};

	const auto reject = [&]( std::string_view reason ) -> decision_t {
		::stepgate::logging::direct_mode::debug(
				[&]( auto & logger, auto level )
				{
					logger.log( level, "route_gate: access to '{}' denied: {}",
							raw_path, reason );
				} );

		return redirect_t{ m_entry_point };
	};

	const cookie_store::cookie_store_t cookies{ cookie_header, {} };
	const auto credential = cookies.read(
			cookie_store::cookie_kind_t::step_up_credential );
	if( !credential )
		return reject( "no step-up credential" );

	const auto verification = m_signer.verify( *credential, now );
	const auto * claims = std::get_if< credential_signer::claims_t >(
			&verification );
	if( !claims )
		return reject( "invalid step-up credential" );

	if( !claims->m_second_factor_satisfied )
		return reject( "second factor isn't satisfied" );

	return pass_t{};
}

} /* namespace stepgate::route_gate */
