/*!
 * @file
 * @brief Identity provider that works via HTTP API.
 */

#pragma once

#include <stepgate/identity_provider/pub.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace stepgate::identity_provider
{

//
// provider_environment_t
//
//! Environments of the identity provider.
enum class provider_environment_t
{
	test,
	live
};

//! Get the default base URL for an environment.
[[nodiscard]]
std::string_view
default_base_url( provider_environment_t env ) noexcept;

//
// http_provider_params_t
//
//! Parameters for HTTP-based identity provider.
struct http_provider_params_t
{
	//! Base URL in form `scheme://host[:port]`.
	std::string m_base_url;

	//! ID of the project. Used as username for basic authentification.
	std::string m_project_id;

	//! Secret of the project. Used as password for basic authentification.
	std::string m_secret;

	//! Timeout for connect, read and write operations.
	std::chrono::milliseconds m_timeout{ std::chrono::seconds{5} };
};

/*!
 * @brief Create an identity provider that talks to the provider's
 * HTTP API.
 *
 * There are no retries. Transport errors and timeouts are reported as
 * failure_kind_t::unavailable.
 */
[[nodiscard]]
identity_provider_shptr_t
make_http_provider( http_provider_params_t params );

} /* namespace stepgate::identity_provider */
