/*!
 * @file
 * @brief Access to cookies of the current request/response pair.
 */

#include <stepgate/cookie_store/pub.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace stepgate::cookie_store
{

namespace
{

constexpr std::string_view cookie_spaces{ " \t" };

const cookie_policy_t primary_session_policy{
	"session", "/", std::chrono::minutes{ 60 }
};

const cookie_policy_t phone_challenge_policy{
	"otp_challenge", "/", std::chrono::minutes{ 15 }
};

const cookie_policy_t step_up_credential_policy{
	"mfa_token", "/", std::chrono::minutes{ 60 }
};

[[nodiscard]]
std::string_view
trim( std::string_view v ) noexcept
{
	const auto first = v.find_first_not_of( cookie_spaces );
	if( std::string_view::npos == first )
		return {};

	const auto last = v.find_last_not_of( cookie_spaces );
	return v.substr( first, last - first + 1u );
}

// See cookie-octet in RFC 6265, section 4.1.1.
[[nodiscard]]
bool
is_cookie_octet( char ch ) noexcept
{
	const auto c = static_cast< unsigned char >( ch );
	return 0x21u == c ||
			(0x23u <= c && c <= 0x2Bu) ||
			(0x2Du <= c && c <= 0x3Au) ||
			(0x3Cu <= c && c <= 0x5Bu) ||
			(0x5Du <= c && c <= 0x7Eu);
}

} /* anonymous namespace */

[[nodiscard]]
std::string_view
to_string_view( cookie_kind_t kind ) noexcept
{
	switch( kind )
	{
		case cookie_kind_t::primary_session: return "primary_session";
		case cookie_kind_t::phone_challenge: return "phone_challenge";
		case cookie_kind_t::step_up_credential: return "step_up_credential";
	}

	return "unknown";
}

[[nodiscard]]
std::string_view
to_string_view( same_site_t v ) noexcept
{
	switch( v )
	{
		case same_site_t::strict: return "Strict";
		case same_site_t::lax: return "Lax";
		case same_site_t::none: return "None";
	}

	return "Lax";
}

[[nodiscard]]
const cookie_policy_t &
policy_for( cookie_kind_t kind ) noexcept
{
	switch( kind )
	{
		case cookie_kind_t::primary_session: return primary_session_policy;
		case cookie_kind_t::phone_challenge: return phone_challenge_policy;
		case cookie_kind_t::step_up_credential: break;
	}

	return step_up_credential_policy;
}

//
// set_cookie_t
//
[[nodiscard]]
std::string
set_cookie_t::to_header_value() const
{
	std::string result = fmt::format( "{}={}; Path={}; Max-Age={}",
			m_name, m_value, m_path, m_max_age.count() );

	// Old browsers don't know Max-Age, so removal is duplicated by Expires.
	if( std::chrono::seconds::zero() == m_max_age )
		result += "; Expires=Thu, 01 Jan 1970 00:00:00 GMT";

	if( m_domain )
		result += fmt::format( "; Domain={}", *m_domain );
	if( m_secure )
		result += "; Secure";
	if( m_http_only )
		result += "; HttpOnly";

	result += fmt::format( "; SameSite={}", to_string_view( m_same_site ) );

	return result;
}

std::ostream &
operator<<( std::ostream & to, const set_cookie_t & cookie )
{
	return (to << "(" << cookie.m_name
			<< ", value_len=" << cookie.m_value.size()
			<< ", max_age=" << cookie.m_max_age.count()
			<< (cookie.m_http_only ? ", http_only" : "")
			<< (cookie.m_secure ? ", secure" : "")
			<< ", same_site=" << to_string_view( cookie.m_same_site )
			<< ")");
}

[[nodiscard]]
bool
is_valid_cookie_value( std::string_view value ) noexcept
{
	return !value.empty() &&
			std::all_of( value.begin(), value.end(), is_cookie_octet );
}

//
// parse_cookie_header
//
[[nodiscard]]
std::map< std::string, std::string, std::less<> >
parse_cookie_header( std::string_view header_value )
{
	std::map< std::string, std::string, std::less<> > result;

	while( !header_value.empty() )
	{
		const auto semicolon = header_value.find( ';' );
		const auto pair = trim( header_value.substr( 0u, semicolon ) );
		header_value.remove_prefix(
				std::string_view::npos == semicolon ?
						header_value.size() : semicolon + 1u );

		const auto eq = pair.find( '=' );
		if( std::string_view::npos == eq )
			continue;

		const auto name = trim( pair.substr( 0u, eq ) );
		auto value = trim( pair.substr( eq + 1u ) );
		if( name.empty() )
			continue;

		// A value can be enclosed in double quotes.
		if( value.size() >= 2u && '"' == value.front() && '"' == value.back() )
			value = value.substr( 1u, value.size() - 2u );

		// emplace doesn't replace an existing item, so the first wins.
		result.emplace( std::string{ name }, std::string{ value } );
	}

	return result;
}

//
// cookie_store_t
//
cookie_store_t::cookie_store_t(
	std::string_view cookie_header,
	transport_attributes_t attributes )
	:	m_incoming{ parse_cookie_header( cookie_header ) }
	,	m_attributes{ std::move(attributes) }
{}

[[nodiscard]]
std::optional< std::string >
cookie_store_t::read( cookie_kind_t kind ) const
{
	const auto it = m_incoming.find( policy_for( kind ).m_name );
	if( it == m_incoming.end() || it->second.empty() )
		return std::nullopt;

	return it->second;
}

void
cookie_store_t::write( cookie_kind_t kind, std::string value )
{
	if( value.empty() )
		throw invalid_cookie_value_t{
				fmt::format( "empty value for cookie {}",
						to_string_view( kind ) )
			};

	if( !std::all_of( value.begin(), value.end(), is_cookie_octet ) )
		throw invalid_cookie_value_t{
				fmt::format( "illegal symbol in value for cookie {}",
						to_string_view( kind ) )
			};

	const auto max_age = policy_for( kind ).m_max_age;
	store_outgoing( kind, std::move(value), max_age );
}

void
cookie_store_t::clear( cookie_kind_t kind )
{
	store_outgoing( kind, std::string{}, std::chrono::seconds::zero() );
}

[[nodiscard]]
const set_cookie_t *
cookie_store_t::find_outgoing( cookie_kind_t kind ) const noexcept
{
	const auto it = std::find_if( m_outgoing.begin(), m_outgoing.end(),
			[kind]( const auto & c ) { return kind == c.m_kind; } );

	return it != m_outgoing.end() ? &(*it) : nullptr;
}

void
cookie_store_t::store_outgoing(
	cookie_kind_t kind,
	std::string value,
	std::chrono::seconds max_age )
{
	const auto & policy = policy_for( kind );

	set_cookie_t cookie{
			kind,
			std::string{ policy.m_name },
			std::move(value),
			std::string{ policy.m_path },
			max_age,
			true,
			m_attributes.m_secure,
			m_attributes.m_same_site,
			m_attributes.m_domain
		};

	// Only the last action for a cookie goes to the response.
	const auto it = std::find_if( m_outgoing.begin(), m_outgoing.end(),
			[kind]( const auto & c ) { return kind == c.m_kind; } );
	if( it != m_outgoing.end() )
		*it = std::move(cookie);
	else
		m_outgoing.push_back( std::move(cookie) );
}

} /* namespace stepgate::cookie_store */
