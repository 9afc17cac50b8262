/*!
 * @file
 * @brief Normalization of responses from identity provider.
 */

#include <stepgate/identity_provider/response_parsers.hpp>

#include <algorithm>
#include <optional>

namespace stepgate::identity_provider::response_parsers
{

namespace
{

constexpr std::size_t max_user_safe_message_length = 200u;

const std::string generic_rejected_message{
		"Request rejected by identity provider"
	};

const std::string generic_unavailable_message{
		"Identity provider is unavailable"
	};

const std::string unexpected_response_message{
		"Unexpected response from identity provider"
	};

[[nodiscard]]
std::optional< std::string >
non_empty_string_field(
	const nlohmann::json & object,
	const char * name )
{
	if( !object.is_object() )
		return std::nullopt;

	const auto it = object.find( name );
	if( it == object.end() || !it->is_string() )
		return std::nullopt;

	auto value = it->get< std::string >();
	if( value.empty() )
		return std::nullopt;

	return value;
}

[[nodiscard]]
std::string
mandatory_string_field(
	const nlohmann::json & object,
	const char * name )
{
	auto value = non_empty_string_field( object, name );
	if( !value )
		throw provider_failure_t{
				failure_kind_t::unavailable,
				unexpected_response_message
			};

	return std::move(*value);
}

[[nodiscard]]
bool
looks_user_safe( const std::string & message ) noexcept
{
	return !message.empty() &&
			message.size() <= max_user_safe_message_length &&
			std::all_of( message.begin(), message.end(),
					[]( char ch ) {
						return ch >= 0x20 && ch < 0x7f;
					} );
}

// Picks the value of `field` from the first item of `array_name`
// that has it.
[[nodiscard]]
std::optional< std::string >
first_item_with(
	const nlohmann::json & user,
	const char * array_name,
	const char * field )
{
	const auto it = user.find( array_name );
	if( it == user.end() || !it->is_array() )
		return std::nullopt;

	for( const auto & item : *it )
	{
		if( auto v = non_empty_string_field( item, field ); v )
			return v;
	}

	return std::nullopt;
}

} /* anonymous namespace */

void
ensure_successful_status(
	int status_code,
	std::string_view body )
{
	if( status_code >= 200 && status_code < 300 )
		return;

	const auto kind = (status_code >= 400 && status_code < 500) ?
			failure_kind_t::rejected : failure_kind_t::unavailable;

	std::string message = failure_kind_t::rejected == kind ?
			generic_rejected_message : generic_unavailable_message;

	const auto parsed = nlohmann::json::parse( body, nullptr, false );
	if( auto m = non_empty_string_field( parsed, "error_message" );
			m && looks_user_safe( *m ) )
	{
		message = std::move(*m);
	}

	throw provider_failure_t{ kind, message };
}

[[nodiscard]]
nlohmann::json
parse_body( std::string_view body )
{
	auto parsed = nlohmann::json::parse( body, nullptr, false );
	if( parsed.is_discarded() || !parsed.is_object() )
		throw provider_failure_t{
				failure_kind_t::unavailable,
				unexpected_response_message
			};

	return parsed;
}

[[nodiscard]]
magic_link_sent_t
to_magic_link_sent( const nlohmann::json & response )
{
	return { mandatory_string_field( response, "request_id" ) };
}

[[nodiscard]]
session_issued_t
to_session_issued( const nlohmann::json & response )
{
	auto token = non_empty_string_field( response, "session_token" );
	if( !token )
		token = non_empty_string_field( response, "session_jwt" );
	if( !token )
		throw provider_failure_t{
				failure_kind_t::no_session_issued,
				"No session was issued by identity provider"
			};

	auto subject = non_empty_string_field( response, "user_id" );
	if( !subject )
	{
		if( const auto it = response.find( "session" ); it != response.end() )
			subject = non_empty_string_field( *it, "user_id" );
	}
	if( !subject )
		throw provider_failure_t{
				failure_kind_t::unavailable,
				unexpected_response_message
			};

	return { std::move(*token), std::move(*subject) };
}

[[nodiscard]]
otp_sent_t
to_otp_sent( const nlohmann::json & response )
{
	return { mandatory_string_field( response, "phone_id" ) };
}

[[nodiscard]]
session_description_t
to_session_description( const nlohmann::json & response )
{
	const auto user_it = response.find( "user" );
	const nlohmann::json & user =
			(user_it != response.end() && user_it->is_object()) ?
					*user_it : response;

	auto subject = non_empty_string_field( user, "user_id" );
	if( !subject )
	{
		if( const auto it = response.find( "session" ); it != response.end() )
			subject = non_empty_string_field( *it, "user_id" );
	}
	if( !subject )
		throw provider_failure_t{
				failure_kind_t::unavailable,
				unexpected_response_message
			};

	return {
			std::move(*subject),
			first_item_with( user, "emails", "email" ),
			first_item_with( user, "phone_numbers", "phone_number" )
		};
}

} /* namespace stepgate::identity_provider::response_parsers */
