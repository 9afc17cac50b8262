/*!
 * @file
 * @brief The public interface of authentication orchestrator.
 */

#include <stepgate/auth_orchestrator/pub.hpp>

#include <stepgate/logging/wrap_logging.hpp>

#include <stepgate/utils/sensitive_dumpers.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <algorithm>

namespace stepgate::auth_orchestrator
{

namespace
{

using namespace stepgate::sensitive_dumpers;

namespace cs = ::stepgate::cookie_store;
namespace ip = ::stepgate::identity_provider;

constexpr std::size_t max_email_length = 254u;

const std::string message_invalid_email{ "Invalid email" };
const std::string message_invalid_phone{ "Invalid phone" };
const std::string message_missing_code{ "Missing code" };
const std::string message_invalid_code_format{ "Invalid code format" };
const std::string message_challenge_expired{ "Session expired, resend code." };
const std::string message_invalid_code{ "Invalid code" };
const std::string message_unexpected_response{
		"Unexpected response from identity provider"
	};

void
log_transition(
	client_state_t from,
	client_state_t to,
	std::string_view step )
{
	::stepgate::logging::direct_mode::info(
			[&]( auto & logger, auto level )
			{
				logger.log( level, "auth: {}: {} -> {}", step, from, to );
			} );
}

void
log_failure(
	std::string_view step,
	const ip::provider_failure_t & x )
{
	::stepgate::logging::direct_mode::warn(
			[&]( auto & logger, auto level )
			{
				logger.log( level, "auth: {}: provider failure ({}): {}",
						step, x.kind(), x.what() );
			} );
}

[[nodiscard]]
failure_t
make_provider_failure( const ip::provider_failure_t & x )
{
	return failure_t{
			ip::failure_kind_t::no_session_issued == x.kind() ?
					failure_reason_t::no_session_issued :
					failure_reason_t::provider_error,
			x.what()
		};
}

[[nodiscard]]
bool
is_digit( char ch ) noexcept
{
	return ch >= '0' && ch <= '9';
}

} /* anonymous namespace */

[[nodiscard]]
std::string_view
to_string_view( failure_reason_t reason ) noexcept
{
	switch( reason )
	{
		case failure_reason_t::invalid_input: return "invalid_input";
		case failure_reason_t::invalid_phone: return "invalid_phone";
		case failure_reason_t::challenge_expired: return "challenge_expired";
		case failure_reason_t::invalid_code: return "invalid_code";
		case failure_reason_t::provider_error: return "provider_error";
		case failure_reason_t::no_session_issued: return "no_session_issued";
	}

	return "unknown";
}

[[nodiscard]]
std::uint16_t
http_status_code( failure_reason_t reason ) noexcept
{
	switch( reason )
	{
		case failure_reason_t::invalid_input:
		case failure_reason_t::invalid_phone:
		case failure_reason_t::challenge_expired:
		case failure_reason_t::invalid_code:
			return 400u;

		case failure_reason_t::provider_error:
		case failure_reason_t::no_session_issued:
			break;
	}

	return 500u;
}

std::ostream &
operator<<( std::ostream & to, const failure_t & f )
{
	return (to << to_string_view( f.m_reason ) << ": " << f.m_message);
}

[[nodiscard]]
std::string_view
to_string_view( client_state_t state ) noexcept
{
	switch( state )
	{
		case client_state_t::anonymous: return "anonymous";
		case client_state_t::link_sent: return "link_sent";
		case client_state_t::primary_authenticated:
			return "primary_authenticated";
		case client_state_t::otp_sent: return "otp_sent";
		case client_state_t::step_up_complete: return "step_up_complete";
	}

	return "unknown";
}

std::ostream &
operator<<( std::ostream & to, client_state_t state )
{
	return (to << to_string_view( state ));
}

[[nodiscard]]
client_state_t
detect_client_state(
	const cookie_store::cookie_store_t & cookies,
	const credential_signer::credential_signer_t & signer,
	credential_signer::clock_type::time_point now )
{
	if( const auto credential = cookies.read(
			cs::cookie_kind_t::step_up_credential ); credential )
	{
		const auto verification = signer.verify( *credential, now );
		const auto * claims = std::get_if< credential_signer::claims_t >(
				&verification );
		if( claims && claims->m_second_factor_satisfied )
			return client_state_t::step_up_complete;
	}

	if( cookies.read( cs::cookie_kind_t::phone_challenge ) )
		return client_state_t::otp_sent;

	if( cookies.read( cs::cookie_kind_t::primary_session ) )
		return client_state_t::primary_authenticated;

	return client_state_t::anonymous;
}

[[nodiscard]]
bool
is_valid_email( std::string_view email ) noexcept
{
	if( email.empty() || email.size() > max_email_length )
		return false;

	const bool has_bad_symbols = std::any_of( email.begin(), email.end(),
			[]( char ch ) {
				const auto c = static_cast< unsigned char >( ch );
				return c <= 0x20u || 0x7Fu == c;
			} );
	if( has_bad_symbols )
		return false;

	const auto at = email.find( '@' );
	if( std::string_view::npos == at || 0u == at ||
			std::string_view::npos != email.find( '@', at + 1u ) )
		return false;

	// The domain part should have a dot that isn't the first or the last
	// symbol of the domain.
	const auto domain = email.substr( at + 1u );
	const auto dot = domain.rfind( '.' );
	return std::string_view::npos != dot &&
			0u != dot &&
			dot + 1u < domain.size() &&
			'.' != domain.front();
}

//
// orchestrator_t
//
orchestrator_t::orchestrator_t(
	orchestrator_params_t params,
	identity_provider::identity_provider_shptr_t provider,
	const credential_signer::credential_signer_t & signer,
	access_log::sink_shptr_t access_log )
	:	m_params{ std::move(params) }
	,	m_provider{ std::move(provider) }
	,	m_signer{ signer }
	,	m_access_log{ std::move(access_log) }
	,	m_link_consume_url{
			m_params.m_public_base_url + std::string{ link_consume_path } }
{}

[[nodiscard]]
result_t< link_requested_t >
orchestrator_t::request_magic_link(
	std::string_view email,
	const std::optional< std::string > & phone )
{
	if( !is_valid_email( email ) )
		return failure_t{ failure_reason_t::invalid_input, message_invalid_email };

	// The request is recorded even if the provider fails.
	access_log::fields_t fields{ { "email", std::string{ email } } };
	if( phone && !phone->empty() )
		fields.emplace( "phone", *phone );
	m_access_log->record(
			access_log::event_kind_t::access_requested,
			std::move(fields) );

	try
	{
		auto sent = m_provider->send_magic_link(
				email, m_link_consume_url, m_link_consume_url );

		log_transition(
				client_state_t::anonymous,
				client_state_t::link_sent,
				"request_magic_link" );

		return link_requested_t{ std::move(sent.m_request_id) };
	}
	catch( const ip::provider_failure_t & x )
	{
		log_failure( "request_magic_link", x );
		return make_provider_failure( x );
	}
}

[[nodiscard]]
redirect_t
orchestrator_t::consume_magic_link(
	const std::optional< std::string > & token,
	cookie_store::cookie_store_t & cookies )
{
	if( !token || token->empty() )
		return redirect_to_entry_point( "missing-token" );

	ip::session_issued_t session;
	try
	{
		session = m_provider->authenticate_magic_link(
				*token, provider_session_ttl );
	}
	catch( const ip::provider_failure_t & x )
	{
		log_failure( "consume_magic_link", x );
		log_transition(
				client_state_t::link_sent,
				client_state_t::anonymous,
				"consume_magic_link" );

		return redirect_to_entry_point( "auth-failed" );
	}

	if( !cs::is_valid_cookie_value( session.m_session_token ) )
	{
		::stepgate::logging::direct_mode::warn(
				[&]( auto & logger, auto level )
				{
					logger.log( level, "auth: consume_magic_link: session "
							"token can't be stored in cookie: {}",
							secret_dumper_t{ session.m_session_token } );
				} );

		return redirect_to_entry_point( "auth-failed" );
	}

	cookies.write( cs::cookie_kind_t::primary_session,
			std::move(session.m_session_token) );
	// Leftovers from a previous identity are no more valid.
	cookies.clear( cs::cookie_kind_t::phone_challenge );
	cookies.clear( cs::cookie_kind_t::step_up_credential );

	m_access_log->record(
			access_log::event_kind_t::primary_factor_completed,
			access_log::fields_t{ { "subject_id", session.m_subject_id } } );

	log_transition(
			client_state_t::link_sent,
			client_state_t::primary_authenticated,
			"consume_magic_link" );

	return redirect_t{ m_params.m_second_factor_entry };
}

[[nodiscard]]
result_t< otp_requested_t >
orchestrator_t::request_otp(
	const std::optional< phone_number::e164_phone_t > & phone,
	cookie_store::cookie_store_t & cookies )
{
	if( !phone )
		return failure_t{ failure_reason_t::invalid_phone, message_invalid_phone };

	std::optional< std::string > session;
	if( m_params.m_bind_primary_session )
	{
		session = cookies.read( cs::cookie_kind_t::primary_session );
		if( !session )
			::stepgate::logging::direct_mode::warn(
					[&]( auto & logger, auto level )
					{
						logger.log( level, "auth: request_otp: no primary "
								"session, challenge for {} won't be bound",
								phone_dumper_t{ phone->value() } );
					} );
	}

	ip::otp_sent_t sent;
	try
	{
		sent = m_provider->send_otp( *phone, session );
	}
	catch( const ip::provider_failure_t & x )
	{
		log_failure( "request_otp", x );
		return make_provider_failure( x );
	}

	if( !cs::is_valid_cookie_value( sent.m_challenge_id ) )
		return failure_t{
				failure_reason_t::provider_error,
				message_unexpected_response
			};

	// A previous challenge (if any) is replaced by the new one.
	cookies.write( cs::cookie_kind_t::phone_challenge,
			std::move(sent.m_challenge_id) );

	m_access_log->record(
			access_log::event_kind_t::second_factor_requested,
			access_log::fields_t{
				{ "phone", fmt::format( "{}", phone_dumper_t{ phone->value() } ) },
				{ "bound_to_session", session ? "yes" : "no" }
			} );

	log_transition(
			session ? client_state_t::primary_authenticated :
					client_state_t::anonymous,
			client_state_t::otp_sent,
			"request_otp" );

	return otp_requested_t{};
}

[[nodiscard]]
result_t< step_up_completed_t >
orchestrator_t::consume_otp(
	std::string_view code,
	cookie_store::cookie_store_t & cookies,
	credential_signer::clock_type::time_point now )
{
	if( code.empty() )
		return failure_t{ failure_reason_t::invalid_input, message_missing_code };

	if( !std::all_of( code.begin(), code.end(), is_digit ) )
		return failure_t{
				failure_reason_t::invalid_input,
				message_invalid_code_format
			};

	const auto challenge = cookies.read( cs::cookie_kind_t::phone_challenge );
	if( !challenge )
		return failure_t{
				failure_reason_t::challenge_expired,
				message_challenge_expired
			};

	const auto session = m_params.m_bind_primary_session ?
			cookies.read( cs::cookie_kind_t::primary_session ) :
			std::optional< std::string >{};

	ip::session_issued_t issued;
	try
	{
		issued = m_provider->authenticate_otp(
				*challenge, code, session, provider_session_ttl );
	}
	catch( const ip::provider_failure_t & x )
	{
		log_failure( "consume_otp", x );

		// The challenge cookie is kept, so the user can try another code.
		if( ip::failure_kind_t::rejected == x.kind() )
			return failure_t{
					failure_reason_t::invalid_code,
					message_invalid_code
				};

		return make_provider_failure( x );
	}

	if( !cs::is_valid_cookie_value( issued.m_session_token ) )
		return failure_t{
				failure_reason_t::provider_error,
				message_unexpected_response
			};

	auto credential = m_signer.issue(
			issued.m_subject_id,
			true,
			step_up_credential_ttl,
			now );

	cookies.write( cs::cookie_kind_t::primary_session,
			std::move(issued.m_session_token) );
	cookies.write( cs::cookie_kind_t::step_up_credential,
			std::move(credential) );
	cookies.clear( cs::cookie_kind_t::phone_challenge );

	m_access_log->record(
			access_log::event_kind_t::second_factor_completed,
			access_log::fields_t{ { "subject_id", issued.m_subject_id } } );

	log_transition(
			client_state_t::otp_sent,
			client_state_t::step_up_complete,
			"consume_otp" );

	return step_up_completed_t{};
}

[[nodiscard]]
identity_view_t
orchestrator_t::describe_identity(
	const cookie_store::cookie_store_t & cookies,
	credential_signer::clock_type::time_point now )
{
	identity_view_t result{
			std::nullopt,
			std::nullopt,
			detect_client_state( cookies, m_signer, now )
		};

	const auto session = cookies.read( cs::cookie_kind_t::primary_session );
	if( !session )
		return result;

	try
	{
		auto description = m_provider->describe_session( *session );
		result.m_email = std::move(description.m_email);
		result.m_phone = std::move(description.m_phone);
	}
	catch( const std::exception & x )
	{
		::stepgate::logging::direct_mode::warn(
				[&]( auto & logger, auto level )
				{
					logger.log( level, "auth: describe_identity failed: {}",
							x.what() );
				} );
	}

	return result;
}

[[nodiscard]]
redirect_t
orchestrator_t::redirect_to_entry_point( std::string_view error_code ) const
{
	return redirect_t{
			fmt::format( "{}?err={}", m_params.m_entry_point, error_code )
		};
}

} /* namespace stepgate::auth_orchestrator */
