/*!
 * @file
 * @brief Stuff for working with configuration.
 */

#include <stepgate/config.hpp>

#include <stepgate/credential_signer/pub.hpp>
#include <stepgate/route_gate/pub.hpp>

#include <stepgate/utils/line_reader.hpp>
#include <stepgate/utils/spdlog_log_levels.hpp>
#include <stepgate/utils/url_parts.hpp>

#include <restinio/helpers/http_field_parsers/basics.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <variant>

namespace stepgate
{

namespace parse_config_impl
{

struct success_t {};

class failure_t
{
	std::string m_description;

public:
	failure_t( std::string description )
		:	m_description{ std::move(description) }
	{}

	[[nodiscard]]
	std::string_view
	description() const noexcept { return { m_description }; }
};

using command_handling_result_t = std::variant< success_t, failure_t >;

class command_handler_t
{
protected :
	template< typename Parser, typename Parsing_Result_Handler >
	[[nodiscard]]
	static command_handling_result_t
	perform_parsing(
		std::string_view content,
		Parser && parser,
		Parsing_Result_Handler && result_handler )
	{
		using namespace restinio::easy_parser;

		auto parse_result = try_parse(
				content,
				std::forward<Parser>(parser) );
		if( !parse_result )
			return failure_t{
					fmt::format( "unable to parse argument: {}",
							make_error_description( parse_result.error(), content ) )
			};
		else
			return result_handler( *parse_result );
	}

	//! The same as perform_parsing but the content isn't included
	//! into the description of a failure.
	template< typename Parser, typename Parsing_Result_Handler >
	[[nodiscard]]
	static command_handling_result_t
	perform_sensitive_parsing(
		std::string_view content,
		Parser && parser,
		Parsing_Result_Handler && result_handler )
	{
		using namespace restinio::easy_parser;

		auto parse_result = try_parse(
				content,
				std::forward<Parser>(parser) );
		if( !parse_result )
			return failure_t{
					fmt::format( "unable to parse argument at position {} "
							"(the value is hidden)",
							parse_result.error().position() )
			};
		else
			return result_handler( *parse_result );
	}

public:
	virtual ~command_handler_t() = default;

	[[nodiscard]]
	virtual command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const = 0;
};

using command_handler_unique_ptr_t = std::unique_ptr< command_handler_t >;

namespace parsers
{

//
// timeout_value_p
//
/*!
 * @brief A producer for easy_parser that extracts time-out values
 * with possible suffixes (ms, s, min).
 */
[[nodiscard]]
static auto
timeout_value_p()
{
	struct tmp_value_t
	{
		std::int_least64_t m_count{ 0 };
		int m_multiplier{ 1000 };
	};

	using namespace restinio::http_field_parsers;

	return produce< std::chrono::milliseconds >(
			produce< tmp_value_t >(
				non_negative_decimal_number_p< std::int_least64_t >()
						>> &tmp_value_t::m_count,
				maybe(
					produce< int >(
						alternatives(
							exact_p( "min" ) >> just_result( 60'000 ),
							exact_p( "s" ) >> just_result( 1'000 ),
							exact_p( "ms" ) >> just_result( 1 )
						)
					) >> &tmp_value_t::m_multiplier
				)
			)
			>> convert( []( const auto tmp ) {
					std::chrono::milliseconds r{ tmp.m_count };
					return r * tmp.m_multiplier;
				} )
			>> as_result()
		);
}

//
// on_off_p
//
//! A producer for easy_parser that extracts `on` or `off` values.
[[nodiscard]]
static auto
on_off_p()
{
	using namespace restinio::http_field_parsers;

	return produce< bool >(
			alternatives(
				exact_p( "on" ) >> just_result( true ),
				exact_p( "off" ) >> just_result( false )
			)
		);
}

//
// text_value_p
//
/*!
 * @brief A producer for easy_parser that extracts a non-empty value
 * without spaces.
 */
[[nodiscard]]
static auto
text_value_p()
{
	using namespace restinio::http_field_parsers;

	return produce< std::string >(
			repeat( 1u, N, vchar_symbol_p() >> to_container() )
		);
}

//
// path_p
//
/*!
 * @brief A producer for easy_parser that extracts an absolute path
 * like `/app` or `/api/v1`.
 */
[[nodiscard]]
static auto
path_p()
{
	using namespace restinio::http_field_parsers;

	return produce< std::string >(
			symbol_p( '/' ) >> to_container(),
			repeat( 0u, N,
				produce< char >(
					alternatives(
						token_symbol_p() >> as_result(),
						symbol_p( '/' ) >> as_result()
					)
				) >> to_container()
			)
		);
}

} /* namespace parsers */

/*!
 * @brief Get a secret value.
 *
 * A value in form `env:NAME` is read from the environment variable NAME.
 * All other values are returned as is.
 *
 * @note
 * Values aren't included into error descriptions.
 */
[[nodiscard]]
static std::variant< failure_t, std::string >
resolve_secret( const std::string & value )
{
	constexpr std::string_view env_prefix{ "env:" };

	if( 0 != value.compare( 0u, env_prefix.size(), env_prefix ) )
		return value;

	const auto var_name = value.substr( env_prefix.size() );
	if( var_name.empty() )
		return failure_t{ "empty environment variable name" };

	const char * env_value = std::getenv( var_name.c_str() );
	if( !env_value || !*env_value )
		return failure_t{
				fmt::format( "environment variable {} is not set", var_name )
			};

	return std::string{ env_value };
}

//
// log_level_handler_t
//
/*!
 * @brief Handler for `log_level` command.
 */
class log_level_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		using namespace restinio::http_field_parsers;

		return perform_parsing(
			content,
			token_p(),
			[&]( const std::string & level_name ) -> command_handling_result_t {
				const auto opt_level = stepgate::utils::name_to_spdlog_level_enum(
						level_name );
				if( !opt_level )
					return failure_t{
							fmt::format( "unsupported log-level: {}", level_name )
					};

				current_cfg.m_log_level = *opt_level;

				return success_t{};
			} );
	}
};

//
// public_base_url_handler_t
//
/*!
 * @brief Handler for `public_base_url` command.
 */
class public_base_url_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		return perform_parsing(
			content,
			parsers::text_value_p(),
			[&]( const std::string & url ) -> command_handling_result_t {
				const auto parts = utils::split_url( url );
				if( !parts )
					return failure_t{
							fmt::format( "not an absolute http(s) URL: {}", url )
						};

				// Only the origin is expected.
				if( "/" != parts->m_target )
					return failure_t{
							fmt::format( "URL shouldn't have a path: {}", url )
						};

				current_cfg.m_public_base_url = parts->m_origin;

				return success_t{};
			} );
	}
};

//
// path_handler_t
//
/*!
 * @brief Handler for `entry_point` and `second_factor_entry` commands.
 */
template< std::string config_t::*Field >
class path_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		return perform_parsing(
			content,
			parsers::path_p(),
			[&]( std::string & v ) -> command_handling_result_t {
				current_cfg.*Field = std::move(v);

				return success_t{};
			} );
	}
};

//
// protected_prefix_handler_t
//
/*!
 * @brief Handler for `protected_prefix` command.
 *
 * The command can be used several times. New prefixes are added
 * to the existing ones.
 */
class protected_prefix_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		using namespace restinio::http_field_parsers;
		using prefixes_container_t = std::vector< std::string >;

		const auto prefix_list_p = produce< prefixes_container_t >(
				parsers::path_p() >> to_container(),
				repeat( 0u, N,
					ows(),
					symbol(','),
					ows(),
					parsers::path_p() >> to_container() ),
				maybe( ows(), symbol(',') )
			);

		return perform_parsing(
			content,
			prefix_list_p,
			[&]( prefixes_container_t & container ) -> command_handling_result_t {
				// Prefixes are compared with normalized paths of requests,
				// so they are stored in the normalized form too.
				for( auto & p : container )
				{
					auto normalized = route_gate::normalize_protected_prefix( p );
					// The root prefix protects everything, including the
					// entry point itself.
					if( !normalized )
						return failure_t{
								fmt::format( "invalid protected prefix: '{}' "
										"(it can't be normalized or denotes the root)",
										p )
							};

					p = std::move(*normalized);
				}

				std::move( container.begin(), container.end(),
						std::back_inserter( current_cfg.m_protected_prefixes ) );

				return success_t{};
			} );
	}
};

//
// content_root_handler_t
//
/*!
 * @brief Handler for `content_root` command.
 */
class content_root_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		return perform_parsing(
			content,
			parsers::text_value_p(),
			[&]( const std::string & v ) -> command_handling_result_t {
				current_cfg.m_content_root = v;

				return success_t{};
			} );
	}
};

//
// signing_secret_handler_t
//
/*!
 * @brief Handler for `signing_secret` command.
 */
class signing_secret_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		return perform_sensitive_parsing(
			content,
			parsers::text_value_p(),
			[&]( const std::string & v ) -> command_handling_result_t {
				auto resolved = resolve_secret( v );
				if( auto * f = std::get_if< failure_t >( &resolved ) )
					return std::move(*f);

				auto & secret = std::get< std::string >( resolved );
				if( secret.size() <
						credential_signer::signing_secret_t::min_length )
					return failure_t{
							fmt::format( "signing secret should have at least "
									"{} bytes",
									credential_signer::signing_secret_t::min_length )
						};

				current_cfg.m_signing_secret = std::move(secret);

				return success_t{};
			} );
	}
};

//
// provider_credential_handler_t
//
/*!
 * @brief Handler for `provider.project_id` and `provider.secret` commands.
 */
template< std::string provider_config_t::*Field >
class provider_credential_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		return perform_sensitive_parsing(
			content,
			parsers::text_value_p(),
			[&]( const std::string & v ) -> command_handling_result_t {
				auto resolved = resolve_secret( v );
				if( auto * f = std::get_if< failure_t >( &resolved ) )
					return std::move(*f);

				current_cfg.m_provider.*Field =
						std::move( std::get< std::string >( resolved ) );

				return success_t{};
			} );
	}
};

//
// provider_env_handler_t
//
/*!
 * @brief Handler for `provider.env` command.
 */
class provider_env_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		using namespace restinio::http_field_parsers;
		using identity_provider::provider_environment_t;

		return perform_parsing(
			content,
			produce< provider_environment_t >(
				alternatives(
					exact_p( "test" ) >> just_result( provider_environment_t::test ),
					exact_p( "live" ) >> just_result( provider_environment_t::live )
				)
			),
			[&]( provider_environment_t v ) -> command_handling_result_t {
				current_cfg.m_provider.m_environment = v;

				return success_t{};
			} );
	}
};

//
// url_handler_t
//
/*!
 * @brief Handler for `provider.base_url` and `access_log.url` commands.
 */
template<
	typename Section,
	Section config_t::*Section_Field,
	std::optional< std::string > Section::*Url_Field >
class url_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		return perform_parsing(
			content,
			parsers::text_value_p(),
			[&]( std::string & url ) -> command_handling_result_t {
				if( !utils::split_url( url ) )
					return failure_t{
							fmt::format( "not an absolute http(s) URL: {}", url )
						};

				(current_cfg.*Section_Field).*Url_Field = std::move(url);

				return success_t{};
			} );
	}
};

//
// timeout_handler_t
//
/*!
 * @brief Handler for `provider.timeout` and `access_log.timeout` commands.
 */
template< typename Section, Section config_t::*Section_Field >
class timeout_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		return perform_parsing(
			content,
			parsers::timeout_value_p(),
			[&]( std::chrono::milliseconds v ) -> command_handling_result_t {
				if( std::chrono::milliseconds::zero() == v )
					return failure_t{ "timeout can't be 0" };

				(current_cfg.*Section_Field).m_timeout = v;

				return success_t{};
			} );
	}
};

//
// bind_primary_session_handler_t
//
/*!
 * @brief Handler for `otp.bind_primary_session` command.
 */
class bind_primary_session_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		return perform_parsing(
			content,
			parsers::on_off_p(),
			[&]( bool v ) -> command_handling_result_t {
				current_cfg.m_bind_primary_session = v;

				return success_t{};
			} );
	}
};

//
// cookie_secure_handler_t
//
/*!
 * @brief Handler for `cookie.secure` command.
 */
class cookie_secure_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		return perform_parsing(
			content,
			parsers::on_off_p(),
			[&]( bool v ) -> command_handling_result_t {
				current_cfg.m_cookie_attributes.m_secure = v;

				return success_t{};
			} );
	}
};

//
// cookie_same_site_handler_t
//
/*!
 * @brief Handler for `cookie.same_site` command.
 */
class cookie_same_site_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		using namespace restinio::http_field_parsers;
		using cookie_store::same_site_t;

		return perform_parsing(
			content,
			produce< same_site_t >(
				alternatives(
					exact_p( "strict" ) >> just_result( same_site_t::strict ),
					exact_p( "lax" ) >> just_result( same_site_t::lax ),
					exact_p( "none" ) >> just_result( same_site_t::none )
				)
			),
			[&]( same_site_t v ) -> command_handling_result_t {
				current_cfg.m_cookie_attributes.m_same_site = v;

				return success_t{};
			} );
	}
};

//
// cookie_domain_handler_t
//
/*!
 * @brief Handler for `cookie.domain` command.
 */
class cookie_domain_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		using namespace restinio::http_field_parsers;

		const auto domain_p = produce< std::string >(
				repeat( 1u, N,
					produce< char >(
						alternatives(
							alphanum_symbol_p() >> as_result(),
							symbol_p( '-' ) >> as_result(),
							symbol_p( '.' ) >> as_result()
						)
					) >> to_container()
				)
			);

		return perform_parsing(
			content,
			domain_p,
			[&]( std::string & v ) -> command_handling_result_t {
				current_cfg.m_cookie_attributes.m_domain = std::move(v);

				return success_t{};
			} );
	}
};

//
// worker_threads_handler_t
//
/*!
 * @brief Handler for `http.worker_threads` command.
 */
class worker_threads_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		using namespace restinio::http_field_parsers;

		return perform_parsing(
			content,
			non_negative_decimal_number_p< std::size_t >(),
			[&]( std::size_t v ) -> command_handling_result_t {
				if( 0u == v )
					return failure_t{ "http.worker_threads can't be 0" };

				current_cfg.m_http_worker_threads = v;

				return success_t{};
			} );
	}
};

//
// spaces
//
//! Set of space symbols.
[[nodiscard]]
inline constexpr std::string_view
spaces() noexcept { return { " \t\x0b" }; }

//
// line_reader_t
//
using line_reader_t = ::stepgate::utils::line_reader_t;

/*!
 * @brief Splits specified line into the command and optional part
 * with arguments.
 *
 * @attention
 * It's expected that @a line contains something other than spaces.
 *
 * @return A tuple where the first item is the command name, and the second
 * is the optional part with arguments (the second item can be empty).
 */
[[nodiscard]]
std::tuple< std::string_view, std::string_view >
split_line( std::string_view line )
{
	const auto command_start = line.find_first_not_of( spaces() );
	if( std::string_view::npos == command_start )
		throw config_parser_t::parser_exception_t(
				"split_line: only spaces in the input" );

	// The second part of line after extraction the command name.
	// Maybe empty.
	std::string_view args;

	const auto line_size = line.size();
	const auto command_end = std::min(
			line.find_first_of( spaces(), command_start ),
			line_size );
	if( line_size != command_end )
	{
		// Leading spaces should be removed.
		if( const auto spaces_end = std::min(
				line.find_first_not_of( spaces(), command_end ),
				line_size );
				line_size != spaces_end )
		{
			args = line.substr( spaces_end );
		}
	}

	std::string_view command = line.substr(
			command_start,
			command_end - command_start );

	return { command, args };
}

/*!
 * @brief Check the whole config after processing of all commands.
 *
 * @throw config_parser_t::parser_exception_t if there is an error.
 */
void
check_whole_config( const config_t & cfg )
{
	using parser_exception_t = config_parser_t::parser_exception_t;

	if( cfg.m_public_base_url.empty() )
		throw parser_exception_t{ "public_base_url should be specified" };

	if( cfg.m_protected_prefixes.empty() )
		throw parser_exception_t{
				"At least one protected_prefix should be specified"
			};

	if( cfg.m_signing_secret.empty() )
		throw parser_exception_t{ "signing_secret should be specified" };

	if( cfg.m_provider.m_project_id.empty() )
		throw parser_exception_t{ "provider.project_id should be specified" };

	if( cfg.m_provider.m_secret.empty() )
		throw parser_exception_t{ "provider.secret should be specified" };

	const auto & attrs = cfg.m_cookie_attributes;
	if( cookie_store::same_site_t::none == attrs.m_same_site &&
			!attrs.m_secure )
		throw parser_exception_t{
				"cookie.same_site none requires cookie.secure on"
			};

	if( !attrs.m_secure &&
			0 == cfg.m_public_base_url.compare( 0u, 8u, "https://" ) )
		throw parser_exception_t{
				"cookie.secure can't be turned off for https public_base_url"
			};

	// The entry points can't be protected, otherwise nobody can log in.
	for( const auto * path : { &cfg.m_entry_point, &cfg.m_second_factor_entry } )
	{
		for( const auto & prefix : cfg.m_protected_prefixes )
			if( 0 == path->compare( 0u, prefix.size(), prefix ) )
				throw parser_exception_t{
						fmt::format( "{} is covered by protected_prefix {}",
								*path, prefix )
					};
	}
}

} /* namespace parse_config_impl */

//
// config_parser_t::parser_exception_t
//
config_parser_t::parser_exception_t::parser_exception_t(
	const std::string & what )
	:	exception_t{ "config_parser: " + what }
{}

//
// config_parser_t::impl_t
//
struct config_parser_t::impl_t
{
	using command_map_t = std::map<
			std::string,
			parse_config_impl::command_handler_unique_ptr_t,
			std::less<> >;

	command_map_t m_commands;

	/*!
	 * @return nullptr, if command handler isn't found.
	 */
	[[nodiscard]]
	const parse_config_impl::command_handler_t *
	find_command_handler( std::string_view name ) const noexcept
	{
		const auto it = m_commands.find( name );
		if( it != m_commands.end() )
			return it->second.get();
		else
			return nullptr;
	}
};

//
// config_parser_t
//
config_parser_t::config_parser_t()
	:	m_impl{ std::make_unique< impl_t >() }
{
	using namespace std::string_literals;
	using namespace parse_config_impl;

	m_impl->m_commands.emplace(
			"log_level"s,
			std::make_unique< log_level_handler_t >() );

	m_impl->m_commands.emplace(
			"public_base_url"s,
			std::make_unique< public_base_url_handler_t >() );
	m_impl->m_commands.emplace(
			"entry_point"s,
			std::make_unique<
					path_handler_t< &config_t::m_entry_point >
			>() );
	m_impl->m_commands.emplace(
			"second_factor_entry"s,
			std::make_unique<
					path_handler_t< &config_t::m_second_factor_entry >
			>() );
	m_impl->m_commands.emplace(
			"protected_prefix"s,
			std::make_unique< protected_prefix_handler_t >() );
	m_impl->m_commands.emplace(
			"content_root"s,
			std::make_unique< content_root_handler_t >() );
	m_impl->m_commands.emplace(
			"signing_secret"s,
			std::make_unique< signing_secret_handler_t >() );

	m_impl->m_commands.emplace(
			"provider.project_id"s,
			std::make_unique<
					provider_credential_handler_t<
							&provider_config_t::m_project_id
					>
			>() );
	m_impl->m_commands.emplace(
			"provider.secret"s,
			std::make_unique<
					provider_credential_handler_t<
							&provider_config_t::m_secret
					>
			>() );
	m_impl->m_commands.emplace(
			"provider.env"s,
			std::make_unique< provider_env_handler_t >() );
	m_impl->m_commands.emplace(
			"provider.base_url"s,
			std::make_unique<
					url_handler_t<
							provider_config_t,
							&config_t::m_provider,
							&provider_config_t::m_base_url >
			>() );
	m_impl->m_commands.emplace(
			"provider.timeout"s,
			std::make_unique<
					timeout_handler_t< provider_config_t, &config_t::m_provider >
			>() );

	m_impl->m_commands.emplace(
			"otp.bind_primary_session"s,
			std::make_unique< bind_primary_session_handler_t >() );

	m_impl->m_commands.emplace(
			"cookie.secure"s,
			std::make_unique< cookie_secure_handler_t >() );
	m_impl->m_commands.emplace(
			"cookie.same_site"s,
			std::make_unique< cookie_same_site_handler_t >() );
	m_impl->m_commands.emplace(
			"cookie.domain"s,
			std::make_unique< cookie_domain_handler_t >() );

	m_impl->m_commands.emplace(
			"access_log.url"s,
			std::make_unique<
					url_handler_t<
							access_log_config_t,
							&config_t::m_access_log,
							&access_log_config_t::m_url >
			>() );
	m_impl->m_commands.emplace(
			"access_log.timeout"s,
			std::make_unique<
					timeout_handler_t< access_log_config_t, &config_t::m_access_log >
			>() );

	m_impl->m_commands.emplace(
			"http.worker_threads"s,
			std::make_unique< worker_threads_handler_t >() );
}

config_parser_t::~config_parser_t()
{}

[[nodiscard]]
config_t
config_parser_t::parse( std::string_view content )
{
	config_t result;

	// Counter for processed commands.
	// If it is zero after processing then we've got an empty config and
	// that is an error.
	std::size_t commands_processed{};

	using namespace parse_config_impl;

	line_reader_t line_reader{ content };
	line_reader.for_each_line( [&]( const line_reader_t::line_t & line ) {
			auto [command, rest] = split_line( line.content() );
			const auto handler = m_impl->find_command_handler( command );
			if( handler )
			{
				const auto handling_result = handler->try_handle( rest, result );
				if( const auto failure = std::get_if<failure_t>(&handling_result) )
				{
					throw parser_exception_t{
							fmt::format( "unable to process command {} at line {}: {}",
									command,
									line.number(),
									failure->description() )
						};
				}

				++commands_processed;
			}
			else
				throw parser_exception_t{
						fmt::format( "unknown command {} at line {}",
								command, line.number() )
					};
		} );

	if( !commands_processed )
		throw parser_exception_t{ "Empty config" };

	check_whole_config( result );

	return result;
}

} /* namespace stepgate */
