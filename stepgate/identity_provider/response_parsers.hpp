/*!
 * @file
 * @brief Normalization of responses from identity provider.
 */

#pragma once

#include <stepgate/identity_provider/pub.hpp>

#include <nlohmann/json.hpp>

#include <string_view>

namespace stepgate::identity_provider::response_parsers
{

/*!
 * @brief Check the status code of a response.
 *
 * Does nothing for 2xx. For 4xx throws provider_failure_t with
 * failure_kind_t::rejected, for all other codes throws
 * provider_failure_t with failure_kind_t::unavailable.
 *
 * If the body contains `error_message` and it looks safe for showing
 * to a user it is used as the message of the exception.
 */
void
ensure_successful_status(
	int status_code,
	std::string_view body );

/*!
 * @brief Parse the body of a successful response.
 *
 * @throw provider_failure_t with failure_kind_t::unavailable if
 * the body isn't a valid JSON object.
 */
[[nodiscard]]
nlohmann::json
parse_body( std::string_view body );

//! Extract the result of magic link sending.
[[nodiscard]]
magic_link_sent_t
to_magic_link_sent( const nlohmann::json & response );

/*!
 * @brief Extract the new session from an authentication response.
 *
 * `session_token` is taken if present, `session_jwt` otherwise.
 * If there is none of them provider_failure_t with
 * failure_kind_t::no_session_issued is thrown.
 */
[[nodiscard]]
session_issued_t
to_session_issued( const nlohmann::json & response );

//! Extract the ID of OTP challenge.
[[nodiscard]]
otp_sent_t
to_otp_sent( const nlohmann::json & response );

/*!
 * @brief Extract the description of the identity.
 *
 * The user object can be at the top level of @a response (a reply for
 * users request) or in `user` field (a reply for session
 * authentication). The first email and the first phone number are
 * taken.
 */
[[nodiscard]]
session_description_t
to_session_description( const nlohmann::json & response );

} /* namespace stepgate::identity_provider::response_parsers */
