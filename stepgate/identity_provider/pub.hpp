/*!
 * @file
 * @brief The public interface of identity provider.
 */

#pragma once

#include <stepgate/phone_number/pub.hpp>

#include <stepgate/exception.hpp>

#include <fmt/ostream.h>

#include <chrono>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace stepgate::identity_provider
{

//
// failure_kind_t
//
//! Kinds of failures reported by an identity provider.
enum class failure_kind_t
{
	//! The provider has rejected the request (wrong token or code,
	//! replayed token, unknown challenge and so on).
	rejected,
	//! The provider can't be reached or has failed by itself.
	unavailable,
	//! The provider has accepted the request but no session was issued.
	no_session_issued
};

[[nodiscard]]
std::string_view
to_string_view( failure_kind_t kind ) noexcept;

std::ostream &
operator<<( std::ostream & to, failure_kind_t kind );

//
// provider_failure_t
//
/*!
 * @brief Exception to be thrown by an identity provider.
 *
 * The value returned by what() is safe to be shown to a user.
 * Raw responses from the provider are never stored here.
 */
class provider_failure_t : public exception_t
{
public:
	provider_failure_t(
		failure_kind_t kind,
		const std::string & user_safe_message );

	[[nodiscard]]
	failure_kind_t
	kind() const noexcept { return m_kind; }

private:
	failure_kind_t m_kind;
};

//
// magic_link_sent_t
//
//! Result of successful sending of a magic link.
struct magic_link_sent_t
{
	//! ID of the request assigned by the provider.
	std::string m_request_id;
};

//
// session_issued_t
//
//! Result of a successful authentication.
struct session_issued_t
{
	//! Opaque token of the new session.
	std::string m_session_token;
	//! ID of the authenticated user.
	std::string m_subject_id;
};

//
// otp_sent_t
//
//! Result of successful sending of a one-time code.
struct otp_sent_t
{
	//! Opaque ID of the challenge to be used for code verification.
	std::string m_challenge_id;
};

//
// session_description_t
//
//! Description of the identity behind a session.
struct session_description_t
{
	std::string m_subject_id;
	std::optional< std::string > m_email;
	std::optional< std::string > m_phone;
};

//
// identity_provider_t
//
/*!
 * @brief Interface of an external identity provider.
 *
 * All methods are blocking and throw provider_failure_t on failures.
 *
 * An implementation should allow calls from several threads at the
 * same time.
 */
class identity_provider_t
{
public:
	virtual ~identity_provider_t();

	//! Send a magic link to the email.
	[[nodiscard]]
	virtual magic_link_sent_t
	send_magic_link(
		std::string_view email,
		std::string_view login_redirect_url,
		std::string_view signup_redirect_url ) = 0;

	//! Exchange a token from a magic link to a session.
	[[nodiscard]]
	virtual session_issued_t
	authenticate_magic_link(
		std::string_view token,
		std::chrono::minutes session_ttl ) = 0;

	//! Send a one-time code to the phone.
	/*!
	 * If @a existing_session is specified then the phone is attached
	 * to the identity of that session.
	 */
	[[nodiscard]]
	virtual otp_sent_t
	send_otp(
		const phone_number::e164_phone_t & phone,
		const std::optional< std::string > & existing_session ) = 0;

	//! Check a one-time code.
	[[nodiscard]]
	virtual session_issued_t
	authenticate_otp(
		std::string_view challenge_id,
		std::string_view code,
		const std::optional< std::string > & existing_session,
		std::chrono::minutes session_ttl ) = 0;

	//! Get a description of the identity behind a session.
	[[nodiscard]]
	virtual session_description_t
	describe_session(
		std::string_view session_token ) = 0;
};

//
// identity_provider_shptr_t
//
using identity_provider_shptr_t = std::shared_ptr< identity_provider_t >;

} /* namespace stepgate::identity_provider */

template<> struct fmt::formatter< stepgate::identity_provider::failure_kind_t >
	:	public fmt::ostream_formatter
{};
