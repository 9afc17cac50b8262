/*!
 * @file
 * @brief Stuff for working with configuration.
 */

#pragma once

#include <stepgate/exception.hpp>

#include <stepgate/cookie_store/pub.hpp>
#include <stepgate/identity_provider/http_provider.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stepgate
{

//
// provider_config_t
//
/*!
 * @brief Config for the identity provider.
 */
struct provider_config_t
{
	//! The environment of the provider.
	identity_provider::provider_environment_t m_environment{
			identity_provider::provider_environment_t::test
		};

	/*!
	 * @brief Base URL of the provider's API.
	 *
	 * If it isn't set then the URL is selected by m_environment.
	 */
	std::optional< std::string > m_base_url;

	//! ID of the project.
	std::string m_project_id;

	//! Secret for the project.
	std::string m_secret;

	//! Timeout for connect, read and write operations.
	std::chrono::milliseconds m_timeout{ 5'000 };

	//! Get the actual base URL.
	[[nodiscard]]
	std::string
	actual_base_url() const
	{
		return m_base_url ? *m_base_url :
				std::string{
						identity_provider::default_base_url( m_environment ) };
	}
};

//
// access_log_config_t
//
/*!
 * @brief Config for access_log.
 */
struct access_log_config_t
{
	//! URL for posting access events.
	/*!
	 * Events are only logged if this URL isn't set.
	 */
	std::optional< std::string > m_url;

	//! Timeout for posting an event.
	std::chrono::milliseconds m_timeout{ 2'000 };
};

/*!
 * @brief Configuration for the whole stepgate.
 */
struct config_t
{
	/*!
	 * @brief Log level to be used for logging.
	 *
	 * The value spdlog::level::off means that logging should
	 * be disabled.
	 */
	spdlog::level::level_enum m_log_level{ spdlog::level::info };

	/*!
	 * @brief The public base URL of the site.
	 *
	 * Has the form `scheme://host[:port]` without the trailing slash.
	 */
	std::string m_public_base_url;

	//! The path of the page for requesting access.
	std::string m_entry_point{ "/request-access" };

	//! The path of the page for entering a one-time code.
	std::string m_second_factor_entry{ "/mfa" };

	/*!
	 * @brief Protected path prefixes.
	 *
	 * Can't be empty.
	 */
	std::vector< std::string > m_protected_prefixes;

	//! The directory with static content.
	std::filesystem::path m_content_root{ "./www" };

	/*!
	 * @brief The secret for signing step-up credentials.
	 *
	 * Should have at least 32 bytes.
	 */
	std::string m_signing_secret;

	//! Config for the identity provider.
	provider_config_t m_provider;

	//! Should OTP challenges be bound to the primary session?
	bool m_bind_primary_session{ true };

	//! Deployment-specific attributes of cookies.
	cookie_store::transport_attributes_t m_cookie_attributes;

	//! Config for access_log.
	access_log_config_t m_access_log;

	//! Count of worker threads for HTTP-entry.
	std::size_t m_http_worker_threads{ 2u };
};

//
// config_parser_t
//
/*!
 * @brief A class for parsing stepgate's config.
 *
 * The config is a text with one command per line:
 * @code
 * # Comments are started with '#'.
 * public_base_url https://example.com
 * protected_prefix /app, /result
 * signing_secret env:STEPGATE_SIGNING_SECRET
 * @endcode
 *
 * Values in form `env:NAME` for secrets are read from the environment
 * variable NAME.
 *
 * It's supposed that an instance of that class is created just
 * once and then reused.
 */
class config_parser_t
{
public:
	//! Type of exception for parsing errors.
	struct parser_exception_t : public exception_t
	{
	public:
		parser_exception_t( const std::string & what );
	};

	config_parser_t();
	~config_parser_t();

	//! Parse the content of the config.
	/*!
	 * @throw parser_exception_t in the case of an error.
	 */
	[[nodiscard]]
	config_t
	parse( std::string_view content );

private:
	struct impl_t;

	std::unique_ptr<impl_t> m_impl;
};

} /* namespace stepgate */
