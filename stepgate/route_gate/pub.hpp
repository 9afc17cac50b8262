/*!
 * @file
 * @brief The public interface of route gate.
 */

#pragma once

#include <stepgate/credential_signer/pub.hpp>

#include <stepgate/exception.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace stepgate::route_gate
{

/*!
 * @brief Normalize the path of a request.
 *
 * Percent-encoded octets are decoded, duplicate slashes are collapsed,
 * `.` and `..` segments are resolved.
 *
 * @return empty optional if @a raw_path isn't an absolute path, contains
 * an invalid percent-encoded octet, a NUL or a backslash, or goes above
 * the root.
 */
[[nodiscard]]
std::optional< std::string >
normalize_path( std::string_view raw_path );

/*!
 * @brief Bring a protected prefix to the form used for matching.
 *
 * The prefix is normalized by normalize_path() and a trailing slash is
 * removed, so `/app/`, `//app` and `/x/../app` all become `/app`.
 *
 * @return empty optional if the prefix can't be normalized or
 * denotes the root.
 */
[[nodiscard]]
std::optional< std::string >
normalize_protected_prefix( std::string_view raw_prefix );

//
// pass_t
//
//! The request can go further.
struct pass_t {};

//
// redirect_t
//
//! The request has to be redirected.
struct redirect_t
{
	//! The value for Location header.
	std::string m_location;
};

//
// decision_t
//
using decision_t = std::variant< pass_t, redirect_t >;

//
// route_gate_t
//
/*!
 * @brief The guard for protected paths.
 *
 * A request to a protected path passes only if it has a valid step-up
 * credential with satisfied second factor. All other requests are
 * redirected to the entry point.
 *
 * A path is protected if its normalized form starts with one of
 * protected prefixes. A path that can't be normalized is protected.
 *
 * The gate doesn't modify anything and can be used from several
 * threads at the same time.
 */
class route_gate_t
{
public:
	/*!
	 * @throw exception_t if some of @a protected_prefixes can't be
	 * normalized by normalize_protected_prefix().
	 */
	route_gate_t(
		//! Protected prefixes (like "/app" or "/result").
		std::vector< std::string > protected_prefixes,
		//! The location for redirects.
		std::string entry_point,
		//! Verifier for credentials.
		//! This reference is guaranteed to be valid for the whole lifetime
		//! of the gate.
		const credential_signer::credential_signer_t & signer );

	[[nodiscard]]
	bool
	is_protected( std::string_view raw_path ) const;

	//! Make a decision for a request.
	[[nodiscard]]
	decision_t
	check(
		//! The path from the request (without query string).
		std::string_view raw_path,
		//! The value of Cookie header. Empty if there is no such header.
		std::string_view cookie_header,
		credential_signer::clock_type::time_point now =
				credential_signer::clock_type::now() ) const;

private:
	const std::vector< std::string > m_protected_prefixes;

	const std::string m_entry_point;

	const credential_signer::credential_signer_t & m_signer;
};

} /* namespace stepgate::route_gate */
