/*!
 * @file
 * @brief The public interface of authentication orchestrator.
 */

#pragma once

#include <stepgate/access_log/pub.hpp>
#include <stepgate/cookie_store/pub.hpp>
#include <stepgate/credential_signer/pub.hpp>
#include <stepgate/identity_provider/pub.hpp>
#include <stepgate/phone_number/pub.hpp>

#include <fmt/ostream.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

namespace stepgate::auth_orchestrator
{

//
// failure_reason_t
//
//! Reasons of failed authentication steps.
enum class failure_reason_t
{
	//! Malformed email or code.
	invalid_input,
	//! Phone number can't be normalized.
	invalid_phone,
	//! There is no pending OTP challenge.
	challenge_expired,
	//! The provider has rejected the code.
	invalid_code,
	//! The provider failed or can't be reached.
	provider_error,
	//! The provider accepted the request but issued no session.
	no_session_issued
};

[[nodiscard]]
std::string_view
to_string_view( failure_reason_t reason ) noexcept;

//! Get HTTP status code to be used for a failure.
[[nodiscard]]
std::uint16_t
http_status_code( failure_reason_t reason ) noexcept;

//
// failure_t
//
//! Description of a failed step.
struct failure_t
{
	failure_reason_t m_reason;
	//! A message that can be shown to a user.
	std::string m_message;
};

std::ostream &
operator<<( std::ostream & to, const failure_t & f );

//
// client_state_t
//
//! States of a client in the authentication flow.
enum class client_state_t
{
	anonymous,
	link_sent,
	primary_authenticated,
	otp_sent,
	step_up_complete
};

[[nodiscard]]
std::string_view
to_string_view( client_state_t state ) noexcept;

std::ostream &
operator<<( std::ostream & to, client_state_t state );

/*!
 * @brief Detect the state of a client by cookies of a request.
 *
 * link_sent can't be detected this way, it's reported as anonymous.
 */
[[nodiscard]]
client_state_t
detect_client_state(
	const cookie_store::cookie_store_t & cookies,
	const credential_signer::credential_signer_t & signer,
	credential_signer::clock_type::time_point now );

//! Check the syntax of an email address.
[[nodiscard]]
bool
is_valid_email( std::string_view email ) noexcept;

//
// Results of successful steps.
//

//! A magic link has been sent.
struct link_requested_t
{
	//! ID of the request assigned by the provider.
	std::string m_request_id;
};

//! The client has to be redirected.
struct redirect_t
{
	//! The value for Location header.
	std::string m_location;
};

//! A one-time code has been sent.
struct otp_requested_t {};

//! The second factor has been passed.
struct step_up_completed_t {};

//! The identity behind the primary session.
struct identity_view_t
{
	std::optional< std::string > m_email;
	std::optional< std::string > m_phone;
	client_state_t m_state;
};

//
// result_t
//
template< typename T >
using result_t = std::variant< failure_t, T >;

//
// orchestrator_params_t
//
//! Parameters for orchestrator.
struct orchestrator_params_t
{
	//! The base URL of the site (without the trailing slash).
	std::string m_public_base_url;

	//! The path of the page for requesting access.
	std::string m_entry_point{ "/request-access" };

	//! The path of the page for entering a one-time code.
	std::string m_second_factor_entry{ "/mfa" };

	//! Should an OTP challenge be bound to the primary session?
	bool m_bind_primary_session{ true };
};

//! The path of magic link consumption.
inline constexpr std::string_view link_consume_path{
		"/api/auth/link/consume"
	};

//! Lifetime of sessions requested from the provider.
inline constexpr std::chrono::minutes provider_session_ttl{ 60 };

//! Lifetime of step-up credentials.
inline constexpr std::chrono::seconds step_up_credential_ttl{ 3600 };

//
// orchestrator_t
//
/*!
 * @brief Implementation of the authentication flow.
 *
 * The flow is:
 * @verbatim
 * anonymous -> link_sent -> primary_authenticated -> otp_sent -> step_up_complete
 * @endverbatim
 *
 * There is no server-side state. Everything is stored in cookies
 * or in the identity provider. Because of that an instance can be
 * used from several threads at the same time.
 *
 * Cookies are modified only after a successful call to the provider.
 */
class orchestrator_t
{
public:
	orchestrator_t(
		//! Parameters for the orchestrator.
		orchestrator_params_t params,
		//! The identity provider to be used.
		identity_provider::identity_provider_shptr_t provider,
		//! Signer for step-up credentials.
		//! This reference is guaranteed to be valid for the whole lifetime
		//! of the orchestrator.
		const credential_signer::credential_signer_t & signer,
		//! Receiver of access events.
		access_log::sink_shptr_t access_log );

	/*!
	 * @brief Send a magic link to the email.
	 *
	 * Cookies aren't touched.
	 */
	[[nodiscard]]
	result_t< link_requested_t >
	request_magic_link(
		std::string_view email,
		const std::optional< std::string > & phone );

	/*!
	 * @brief Exchange a token from a magic link to a primary session.
	 *
	 * Always produces a redirect. On failure the redirect points to
	 * the entry point with `err` parameter in the query string.
	 */
	[[nodiscard]]
	redirect_t
	consume_magic_link(
		const std::optional< std::string > & token,
		cookie_store::cookie_store_t & cookies );

	/*!
	 * @brief Send a one-time code to the phone.
	 *
	 * @a phone is empty if the phone number entered by a user
	 * can't be normalized.
	 */
	[[nodiscard]]
	result_t< otp_requested_t >
	request_otp(
		const std::optional< phone_number::e164_phone_t > & phone,
		cookie_store::cookie_store_t & cookies );

	//! Check a one-time code and issue a step-up credential.
	[[nodiscard]]
	result_t< step_up_completed_t >
	consume_otp(
		std::string_view code,
		cookie_store::cookie_store_t & cookies,
		credential_signer::clock_type::time_point now =
				credential_signer::clock_type::now() );

	/*!
	 * @brief Get the description of the current identity.
	 *
	 * Failures are not reported, empty values are returned instead.
	 */
	[[nodiscard]]
	identity_view_t
	describe_identity(
		const cookie_store::cookie_store_t & cookies,
		credential_signer::clock_type::time_point now =
				credential_signer::clock_type::now() );

	[[nodiscard]]
	const orchestrator_params_t &
	params() const noexcept { return m_params; }

private:
	const orchestrator_params_t m_params;

	const identity_provider::identity_provider_shptr_t m_provider;

	const credential_signer::credential_signer_t & m_signer;

	const access_log::sink_shptr_t m_access_log;

	//! Full URL for magic link consumption.
	const std::string m_link_consume_url;

	[[nodiscard]]
	redirect_t
	redirect_to_entry_point( std::string_view error_code ) const;
};

} /* namespace stepgate::auth_orchestrator */

template<> struct fmt::formatter< stepgate::auth_orchestrator::client_state_t >
	:	public fmt::ostream_formatter
{};

template<> struct fmt::formatter< stepgate::auth_orchestrator::failure_t >
	:	public fmt::ostream_formatter
{};
