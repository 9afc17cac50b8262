/*!
 * @file
 * @brief Access to cookies of the current request/response pair.
 */

#pragma once

#include <stepgate/exception.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace stepgate::cookie_store
{

//
// cookie_kind_t
//
//! Kinds of cookies used by stepgate.
enum class cookie_kind_t
{
	//! Opaque session token from identity provider.
	primary_session,
	//! Opaque ID of pending OTP challenge.
	phone_challenge,
	//! Signed step-up credential.
	step_up_credential
};

[[nodiscard]]
std::string_view
to_string_view( cookie_kind_t kind ) noexcept;

//
// same_site_t
//
//! Values for SameSite attribute.
enum class same_site_t
{
	strict,
	lax,
	none
};

[[nodiscard]]
std::string_view
to_string_view( same_site_t v ) noexcept;

//
// cookie_policy_t
//
/*!
 * @brief Fixed attributes of a cookie kind.
 *
 * Those values can't be changed by the configuration.
 */
struct cookie_policy_t
{
	//! Name of the cookie.
	std::string_view m_name;
	//! Value for Path attribute.
	std::string_view m_path;
	//! Value for Max-Age attribute.
	std::chrono::seconds m_max_age;
};

//! Get the fixed policy for a cookie kind.
[[nodiscard]]
const cookie_policy_t &
policy_for( cookie_kind_t kind ) noexcept;

//
// transport_attributes_t
//
/*!
 * @brief Attributes that depend on the deployment.
 *
 * Defaults are suitable for production. Only non-production deployments
 * are expected to weaken them (for example, to work via plain HTTP).
 */
struct transport_attributes_t
{
	//! Should Secure attribute be set?
	bool m_secure{ true };
	//! Value of SameSite attribute.
	same_site_t m_same_site{ same_site_t::lax };
	//! Value for Domain attribute (the attribute isn't set if empty).
	std::optional< std::string > m_domain;
};

//
// set_cookie_t
//
//! Description of a single Set-Cookie header of the response.
struct set_cookie_t
{
	cookie_kind_t m_kind;
	std::string m_name;
	std::string m_value;
	std::string m_path;
	std::chrono::seconds m_max_age;
	//! This flag is always set for stepgate's cookies.
	bool m_http_only;
	bool m_secure;
	same_site_t m_same_site;
	std::optional< std::string > m_domain;

	//! Make a value for Set-Cookie header.
	[[nodiscard]]
	std::string
	to_header_value() const;
};

// For debugging purposes only. The value of the cookie isn't printed.
std::ostream &
operator<<( std::ostream & to, const set_cookie_t & cookie );

//
// invalid_cookie_value_t
//
//! Exception to be thrown on an attempt to write an illegal value.
class invalid_cookie_value_t : public exception_t
{
public:
	using exception_t::exception_t;
};

/*!
 * @brief Check that a value can be used as the value of a cookie.
 *
 * The value should be non-empty and should contain only cookie-octets
 * from RFC 6265.
 */
[[nodiscard]]
bool
is_valid_cookie_value( std::string_view value ) noexcept;

//
// parse_cookie_header
//
/*!
 * @brief Parse the value of Cookie header.
 *
 * Malformed pairs are ignored. If there are several cookies with the
 * same name then the first one is taken.
 */
[[nodiscard]]
std::map< std::string, std::string, std::less<> >
parse_cookie_header( std::string_view header_value );

//
// cookie_store_t
//
/*!
 * @brief Cookies of the current request and Set-Cookies for the response.
 *
 * read() returns values from the incoming request only. Modifications
 * made by write() and clear() are visible only via outgoing().
 */
class cookie_store_t
{
public:
	//! Initializing constructor.
	cookie_store_t(
		//! The value of Cookie header of the incoming request.
		//! Can be empty if there is no such header.
		std::string_view cookie_header,
		//! Deployment-specific attributes.
		transport_attributes_t attributes );

	//! Get the value of a cookie from the incoming request.
	/*!
	 * An empty value is treated as the absence of the cookie.
	 */
	[[nodiscard]]
	std::optional< std::string >
	read( cookie_kind_t kind ) const;

	//! Set a new value for a cookie.
	/*!
	 * @throw invalid_cookie_value_t if @a value contains symbols that
	 * aren't allowed in cookie values or is empty.
	 */
	void
	write( cookie_kind_t kind, std::string value );

	//! Remove a cookie from the browser (Max-Age is set to zero).
	void
	clear( cookie_kind_t kind );

	//! Get all Set-Cookies for the response.
	[[nodiscard]]
	const std::vector< set_cookie_t > &
	outgoing() const noexcept { return m_outgoing; }

	//! Find the Set-Cookie for a cookie kind.
	/*!
	 * @return nullptr if there is no Set-Cookie for @a kind.
	 */
	[[nodiscard]]
	const set_cookie_t *
	find_outgoing( cookie_kind_t kind ) const noexcept;

private:
	const std::map< std::string, std::string, std::less<> > m_incoming;

	const transport_attributes_t m_attributes;

	std::vector< set_cookie_t > m_outgoing;

	void
	store_outgoing(
		cookie_kind_t kind,
		std::string value,
		std::chrono::seconds max_age );
};

} /* namespace stepgate::cookie_store */
