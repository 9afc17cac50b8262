/*!
 * @file
 * @brief The public interface of step-up credential signer.
 */

#pragma once

#include <stepgate/exception.hpp>

#include <chrono>
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

namespace stepgate::credential_signer
{

//! Clock used for issued-at and expiry of credentials.
using clock_type = std::chrono::system_clock;

//
// signing_secret_t
//
/*!
 * @brief A symmetric secret for signing step-up credentials.
 *
 * The secret should have at least min_length bytes. An attempt to
 * create a shorter secret leads to exception.
 */
class signing_secret_t
{
	std::string m_bytes;

public:
	//! The minimal allowed length of the secret.
	static constexpr std::size_t min_length = 32u;

	//! Initializing constructor.
	/*!
	 * @throw exception_t if @a bytes is too short.
	 */
	explicit signing_secret_t( std::string bytes );

	[[nodiscard]]
	const std::string &
	bytes() const noexcept { return m_bytes; }
};

//
// claims_t
//
//! The content of a successfully verified credential.
struct claims_t
{
	//! ID of the subject (the user ID assigned by identity provider).
	std::string m_subject_id;

	//! Was the second factor satisfied?
	bool m_second_factor_satisfied;

	//! The time of credential issuance (with precision to seconds).
	clock_type::time_point m_issued_at;

	//! The time since that credential is no more valid.
	clock_type::time_point m_expires_at;
};

//
// invalid_credential_t
//
/*!
 * @brief Indicator of invalid credential.
 *
 * There is no description of the reason intentionally: a tampered
 * credential and an expired one look the same for a caller.
 */
struct invalid_credential_t {};

//
// verification_result_t
//
using verification_result_t = std::variant< invalid_credential_t, claims_t >;

// For debugging purposes only.
std::ostream &
operator<<( std::ostream & to, const verification_result_t & v );

//
// credential_signer_t
//
/*!
 * @brief Issuer and verifier of step-up credentials.
 *
 * A credential is a JWT signed by HMAC-SHA256 (HS256).
 * Claims are `sub`, `mfa`, `iat` and `exp` (unix time in seconds).
 *
 * An instance is immutable after the construction and can be used from
 * several threads at the same time.
 */
class credential_signer_t
{
public:
	explicit credential_signer_t( signing_secret_t secret );

	/*!
	 * @brief Make a new credential.
	 *
	 * The credential is valid while the current time is less than
	 * `now + ttl` (`now` is truncated to seconds).
	 */
	[[nodiscard]]
	std::string
	issue(
		std::string_view subject_id,
		bool second_factor_satisfied,
		std::chrono::seconds ttl,
		clock_type::time_point now = clock_type::now() ) const;

	/*!
	 * @brief Check the credential.
	 *
	 * The signature, the structure of claims and the expiration time
	 * are checked together. Any failure is reported as
	 * invalid_credential_t.
	 */
	[[nodiscard]]
	verification_result_t
	verify(
		std::string_view credential,
		clock_type::time_point now = clock_type::now() ) const;

private:
	const signing_secret_t m_secret;
};

} /* namespace stepgate::credential_signer */
