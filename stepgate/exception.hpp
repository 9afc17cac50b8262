/*!
 * @file
 * @brief The base class for exceptions.
 */

#pragma once

#include <stdexcept>

namespace stepgate
{

/*!
 * @brief The base class for all exceptions thrown by stepgate's code.
 *
 * Derived classes:
 * - config_parser_t::parser_exception_t for errors in the config;
 * - identity_provider::provider_failure_t for failed provider calls;
 * - cookie_store::invalid_cookie_value_t for values that can't be
 *   placed into Set-Cookie.
 *
 * The text of such an exception can be returned to a client only if
 * the concrete type says that the text is user-safe.
 */
class exception_t : public std::runtime_error
{
public:
	// Inherit constructors from the base class.
	using std::runtime_error::runtime_error;
};

} /* namespace stepgate */
