/*!
 * @file
 * @brief Identity provider that works via HTTP API.
 */

#include <stepgate/identity_provider/http_provider.hpp>
#include <stepgate/identity_provider/response_parsers.hpp>

#include <stepgate/logging/wrap_logging.hpp>

#include <stepgate/utils/sensitive_dumpers.hpp>

#include <httplib.h>

#include <nlohmann/json.hpp>

namespace stepgate::identity_provider
{

[[nodiscard]]
std::string_view
default_base_url( provider_environment_t env ) noexcept
{
	switch( env )
	{
		case provider_environment_t::test: break;
		case provider_environment_t::live: return "https://api.stytch.com";
	}

	return "https://test.stytch.com";
}

namespace impl
{

// API paths.
constexpr const char * path_magic_link_send =
		"/v1/magic_links/email/login_or_create";
constexpr const char * path_magic_link_authenticate =
		"/v1/magic_links/authenticate";
constexpr const char * path_otp_send_for_session = "/v1/otps/sms/send";
constexpr const char * path_otp_login_or_create =
		"/v1/otps/sms/login_or_create";
constexpr const char * path_otp_authenticate = "/v1/otps/authenticate";
constexpr const char * path_session_authenticate =
		"/v1/sessions/authenticate";
constexpr std::string_view path_users_prefix = "/v1/users/";

//
// http_provider_t
//
/*!
 * @brief Actual implementation of identity_provider interface.
 *
 * A new httplib::Client is created for every call. It allows to use
 * the same provider object from several worker threads without
 * any synchronization.
 */
class http_provider_t final : public identity_provider_t
{
public:
	explicit http_provider_t( http_provider_params_t params )
		:	m_params{ std::move(params) }
	{}

	[[nodiscard]]
	magic_link_sent_t
	send_magic_link(
		std::string_view email,
		std::string_view login_redirect_url,
		std::string_view signup_redirect_url ) override
	{
		const nlohmann::json request{
				{ "email", std::string{ email } },
				{ "login_magic_link_url", std::string{ login_redirect_url } },
				{ "signup_magic_link_url", std::string{ signup_redirect_url } }
			};

		return response_parsers::to_magic_link_sent(
				post( path_magic_link_send, request ) );
	}

	[[nodiscard]]
	session_issued_t
	authenticate_magic_link(
		std::string_view token,
		std::chrono::minutes session_ttl ) override
	{
		const nlohmann::json request{
				{ "token", std::string{ token } },
				{ "session_duration_minutes", session_ttl.count() }
			};

		return response_parsers::to_session_issued(
				post( path_magic_link_authenticate, request ) );
	}

	[[nodiscard]]
	otp_sent_t
	send_otp(
		const phone_number::e164_phone_t & phone,
		const std::optional< std::string > & existing_session ) override
	{
		nlohmann::json request{ { "phone_number", phone.value() } };

		// The phone can be attached to an existing user only via
		// the "send" method, "login_or_create" makes a new user.
		const char * path = path_otp_login_or_create;
		if( existing_session )
		{
			request[ "session_token" ] = *existing_session;
			path = path_otp_send_for_session;
		}

		return response_parsers::to_otp_sent( post( path, request ) );
	}

	[[nodiscard]]
	session_issued_t
	authenticate_otp(
		std::string_view challenge_id,
		std::string_view code,
		const std::optional< std::string > & existing_session,
		std::chrono::minutes session_ttl ) override
	{
		nlohmann::json request{
				{ "method_id", std::string{ challenge_id } },
				{ "code", std::string{ code } },
				{ "session_duration_minutes", session_ttl.count() }
			};
		if( existing_session )
			request[ "session_token" ] = *existing_session;

		return response_parsers::to_session_issued(
				post( path_otp_authenticate, request ) );
	}

	[[nodiscard]]
	session_description_t
	describe_session(
		std::string_view session_token ) override
	{
		const nlohmann::json request{
				{ "session_token", std::string{ session_token } }
			};

		auto description = response_parsers::to_session_description(
				post( path_session_authenticate, request ) );

		// Some replies have no user object. Contacts of the user
		// have to be requested separately in that case.
		if( !description.m_email && !description.m_phone )
			description = response_parsers::to_session_description(
					get( std::string{ path_users_prefix } +
							description.m_subject_id ) );

		return description;
	}

private:
	const http_provider_params_t m_params;

	void
	tune_client( httplib::Client & client ) const
	{
		client.set_basic_auth( m_params.m_project_id, m_params.m_secret );
		client.set_connection_timeout( m_params.m_timeout );
		client.set_read_timeout( m_params.m_timeout );
		client.set_write_timeout( m_params.m_timeout );
	}

	[[nodiscard]]
	nlohmann::json
	post( const char * path, const nlohmann::json & request ) const
	{
		httplib::Client client{ m_params.m_base_url };
		tune_client( client );
		return handle_result( path,
				client.Post( path, request.dump(), "application/json" ) );
	}

	[[nodiscard]]
	nlohmann::json
	get( const std::string & path ) const
	{
		httplib::Client client{ m_params.m_base_url };
		tune_client( client );
		return handle_result( path, client.Get( path ) );
	}

	[[nodiscard]]
	static nlohmann::json
	handle_result(
		std::string_view path,
		const httplib::Result & result )
	{
		if( !result )
		{
			const auto error = httplib::to_string( result.error() );
			::stepgate::logging::direct_mode::warn(
					[&]( auto & logger, auto level ) {
						logger.log( level, "identity provider: {} failed: {}",
								path, error );
					} );

			throw provider_failure_t{
					failure_kind_t::unavailable,
					"Identity provider is unavailable"
				};
		}

		::stepgate::logging::direct_mode::debug(
				[&]( auto & logger, auto level ) {
					logger.log( level, "identity provider: {} -> {}",
							path, result->status );
				} );

		response_parsers::ensure_successful_status(
				result->status, result->body );

		return response_parsers::parse_body( result->body );
	}
};

} /* namespace impl */

[[nodiscard]]
identity_provider_shptr_t
make_http_provider( http_provider_params_t params )
{
	::stepgate::logging::direct_mode::info(
			[&]( auto & logger, auto level ) {
				logger.log( level, "identity provider: base_url={}, "
						"project_id={}, secret={}, timeout={}ms",
						params.m_base_url,
						params.m_project_id,
						sensitive_dumpers::secret_dumper_t{ params.m_secret },
						params.m_timeout.count() );
			} );

	return std::make_shared< impl::http_provider_t >( std::move(params) );
}

} /* namespace stepgate::identity_provider */
