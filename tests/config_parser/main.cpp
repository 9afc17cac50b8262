#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN 
#include <doctest/doctest.h>

#include <stepgate/config.hpp>

#include <fmt/format.h>

#include <cstdlib>

using namespace std::string_view_literals;
using namespace std::chrono_literals;

namespace
{

const std::string_view mandatory_part =
R"(
public_base_url https://example.com
protected_prefix /app
signing_secret 0123456789abcdef0123456789abcdef
provider.project_id project-test-1234
provider.secret secret-test-5678
)"sv;

[[nodiscard]]
std::string
with_mandatory( std::string_view what )
{
	return std::string{ mandatory_part } + std::string{ what };
}

} /* namespace anonymous */

TEST_CASE("minimalistic config") {
	using namespace stepgate;

	config_parser_t parser;

	{
		const auto what = with_mandatory(
R"(
# This is a comment
				
	# This is an another comment
				)" );

		config_t cfg;
		REQUIRE_NOTHROW( cfg = parser.parse( what ) );

		REQUIRE( spdlog::level::info == cfg.m_log_level );
		REQUIRE( "https://example.com" == cfg.m_public_base_url );
		REQUIRE( "/request-access" == cfg.m_entry_point );
		REQUIRE( "/mfa" == cfg.m_second_factor_entry );
		REQUIRE( std::vector< std::string >{ "/app" } ==
				cfg.m_protected_prefixes );
		REQUIRE( std::filesystem::path{ "./www" } == cfg.m_content_root );
		REQUIRE( "0123456789abcdef0123456789abcdef" == cfg.m_signing_secret );

		REQUIRE( identity_provider::provider_environment_t::test ==
				cfg.m_provider.m_environment );
		REQUIRE( !cfg.m_provider.m_base_url );
		REQUIRE( "https://test.stytch.com" == cfg.m_provider.actual_base_url() );
		REQUIRE( "project-test-1234" == cfg.m_provider.m_project_id );
		REQUIRE( "secret-test-5678" == cfg.m_provider.m_secret );
		REQUIRE( 5s == cfg.m_provider.m_timeout );

		REQUIRE( cfg.m_bind_primary_session );

		REQUIRE( cfg.m_cookie_attributes.m_secure );
		REQUIRE( cookie_store::same_site_t::lax ==
				cfg.m_cookie_attributes.m_same_site );
		REQUIRE( !cfg.m_cookie_attributes.m_domain );

		REQUIRE( !cfg.m_access_log.m_url );
		REQUIRE( 2s == cfg.m_access_log.m_timeout );

		REQUIRE( 2u == cfg.m_http_worker_threads );
	}
}

TEST_CASE("empty config") {
	using namespace stepgate;

	config_parser_t parser;

	REQUIRE_THROWS_AS( parser.parse( ""sv ),
			config_parser_t::parser_exception_t );
	REQUIRE_THROWS_AS( parser.parse( "# Just a comment\n"sv ),
			config_parser_t::parser_exception_t );
}

TEST_CASE("unknown command") {
	using namespace stepgate;

	config_parser_t parser;

	REQUIRE_THROWS_AS( parser.parse( with_mandatory( "nserver 1.1.1.1\n" ) ),
			config_parser_t::parser_exception_t );
}

TEST_CASE("mandatory values") {
	using namespace stepgate;

	config_parser_t parser;

	{
		const auto what =
R"(
protected_prefix /app
signing_secret 0123456789abcdef0123456789abcdef
provider.project_id project-test-1234
provider.secret secret-test-5678
)"sv;
		REQUIRE_THROWS_WITH( parser.parse( what ),
				"config_parser: public_base_url should be specified" );
	}

	{
		const auto what =
R"(
public_base_url https://example.com
signing_secret 0123456789abcdef0123456789abcdef
provider.project_id project-test-1234
provider.secret secret-test-5678
)"sv;
		REQUIRE_THROWS_AS( parser.parse( what ),
				config_parser_t::parser_exception_t );
	}

	{
		const auto what =
R"(
public_base_url https://example.com
protected_prefix /app
provider.project_id project-test-1234
provider.secret secret-test-5678
)"sv;
		REQUIRE_THROWS_WITH( parser.parse( what ),
				"config_parser: signing_secret should be specified" );
	}

	{
		const auto what =
R"(
public_base_url https://example.com
protected_prefix /app
signing_secret 0123456789abcdef0123456789abcdef
provider.secret secret-test-5678
)"sv;
		REQUIRE_THROWS_WITH( parser.parse( what ),
				"config_parser: provider.project_id should be specified" );
	}
}

TEST_CASE("log_level") {
	using namespace stepgate;

	config_parser_t parser;

	{
		config_t cfg;
		REQUIRE_NOTHROW( cfg = parser.parse(
				with_mandatory( "log_level debug\n" ) ) );
		REQUIRE( spdlog::level::debug == cfg.m_log_level );
	}

	{
		config_t cfg;
		REQUIRE_NOTHROW( cfg = parser.parse(
				with_mandatory( "log_level off\n" ) ) );
		REQUIRE( spdlog::level::off == cfg.m_log_level );
	}

	REQUIRE_THROWS_AS( parser.parse( with_mandatory( "log_level verbose\n" ) ),
			config_parser_t::parser_exception_t );
}

TEST_CASE("public_base_url") {
	using namespace stepgate;

	config_parser_t parser;

	const auto make = []( std::string_view url ) {
		return fmt::format(
R"(
public_base_url {}
protected_prefix /app
signing_secret 0123456789abcdef0123456789abcdef
provider.project_id project-test-1234
provider.secret secret-test-5678
)", url );
	};

	{
		config_t cfg;
		REQUIRE_NOTHROW( cfg = parser.parse( make( "http://localhost:8080" ) ) );
		REQUIRE( "http://localhost:8080" == cfg.m_public_base_url );
	}

	{
		config_t cfg;
		REQUIRE_NOTHROW( cfg = parser.parse( make( "https://example.com/" ) ) );
		REQUIRE( "https://example.com" == cfg.m_public_base_url );
	}

	REQUIRE_THROWS_AS( parser.parse( make( "ftp://example.com" ) ),
			config_parser_t::parser_exception_t );
	REQUIRE_THROWS_AS( parser.parse( make( "example.com" ) ),
			config_parser_t::parser_exception_t );
	REQUIRE_THROWS_AS( parser.parse( make( "https://example.com/app" ) ),
			config_parser_t::parser_exception_t );
}

TEST_CASE("entry points") {
	using namespace stepgate;

	config_parser_t parser;

	{
		config_t cfg;
		REQUIRE_NOTHROW( cfg = parser.parse( with_mandatory(
				"entry_point /login\n"
				"second_factor_entry /login/second-step\n" ) ) );
		REQUIRE( "/login" == cfg.m_entry_point );
		REQUIRE( "/login/second-step" == cfg.m_second_factor_entry );
	}

	REQUIRE_THROWS_AS( parser.parse( with_mandatory( "entry_point login\n" ) ),
			config_parser_t::parser_exception_t );

	// The entry point can't be protected.
	REQUIRE_THROWS_AS( parser.parse( with_mandatory( "entry_point /app/login\n" ) ),
			config_parser_t::parser_exception_t );
	REQUIRE_THROWS_AS( parser.parse( with_mandatory( "protected_prefix /mf\n" ) ),
			config_parser_t::parser_exception_t );
}

TEST_CASE("protected_prefix") {
	using namespace stepgate;

	config_parser_t parser;

	{
		config_t cfg;
		REQUIRE_NOTHROW( cfg = parser.parse( with_mandatory(
				"protected_prefix /result, /reports/daily\n"
				"protected_prefix /admin,\n" ) ) );
		REQUIRE( std::vector< std::string >{
					"/app", "/result", "/reports/daily", "/admin"
				} == cfg.m_protected_prefixes );
	}

	// Prefixes are stored in the normalized form.
	{
		config_t cfg;
		REQUIRE_NOTHROW( cfg = parser.parse( with_mandatory(
				"protected_prefix //result, /reports/, /./admin, /x/../billing\n"
				"protected_prefix /data//exports/\n" ) ) );
		REQUIRE( std::vector< std::string >{
					"/app", "/result", "/reports", "/admin", "/billing",
					"/data/exports"
				} == cfg.m_protected_prefixes );
	}

	REQUIRE_THROWS_AS( parser.parse( with_mandatory( "protected_prefix /\n" ) ),
			config_parser_t::parser_exception_t );
	REQUIRE_THROWS_AS( parser.parse( with_mandatory( "protected_prefix //\n" ) ),
			config_parser_t::parser_exception_t );
	REQUIRE_THROWS_AS( parser.parse( with_mandatory( "protected_prefix /./\n" ) ),
			config_parser_t::parser_exception_t );
	REQUIRE_THROWS_AS( parser.parse( with_mandatory( "protected_prefix /app/..\n" ) ),
			config_parser_t::parser_exception_t );
	REQUIRE_THROWS_AS( parser.parse( with_mandatory( "protected_prefix /../app\n" ) ),
			config_parser_t::parser_exception_t );
	REQUIRE_THROWS_AS( parser.parse( with_mandatory( "protected_prefix /a%zz\n" ) ),
			config_parser_t::parser_exception_t );
	REQUIRE_THROWS_AS( parser.parse( with_mandatory( "protected_prefix app\n" ) ),
			config_parser_t::parser_exception_t );
	REQUIRE_THROWS_AS( parser.parse( with_mandatory( "protected_prefix\n" ) ),
			config_parser_t::parser_exception_t );
}

TEST_CASE("signing_secret") {
	using namespace stepgate;

	config_parser_t parser;

	const auto make = []( std::string_view secret ) {
		return fmt::format(
R"(
public_base_url https://example.com
protected_prefix /app
signing_secret {}
provider.project_id project-test-1234
provider.secret secret-test-5678
)", secret );
	};

	// Too short.
	REQUIRE_THROWS_AS( parser.parse( make( "0123456789abcdef" ) ),
			config_parser_t::parser_exception_t );

	// A value from the environment.
	::setenv( "STEPGATE_TEST_SIGNING_SECRET",
			"fedcba9876543210fedcba9876543210", 1 );
	{
		config_t cfg;
		REQUIRE_NOTHROW( cfg = parser.parse(
				make( "env:STEPGATE_TEST_SIGNING_SECRET" ) ) );
		REQUIRE( "fedcba9876543210fedcba9876543210" == cfg.m_signing_secret );
	}

	::unsetenv( "STEPGATE_TEST_SIGNING_SECRET" );
	REQUIRE_THROWS_AS( parser.parse( make( "env:STEPGATE_TEST_SIGNING_SECRET" ) ),
			config_parser_t::parser_exception_t );
	REQUIRE_THROWS_AS( parser.parse( make( "env:" ) ),
			config_parser_t::parser_exception_t );
}

TEST_CASE("secret values are not in error messages") {
	using namespace stepgate;

	config_parser_t parser;

	const auto what =
R"(
public_base_url https://example.com
protected_prefix /app
signing_secret 0123456789abcdef0123456789abcdef
provider.project_id project-test-1234
provider.secret super-secret value
)"sv;

	bool thrown = false;
	try
	{
		(void)parser.parse( what );
	}
	catch( const config_parser_t::parser_exception_t & x )
	{
		thrown = true;
		const std::string_view description{ x.what() };
		REQUIRE( std::string_view::npos ==
				description.find( "super-secret" ) );
	}

	REQUIRE( thrown );
}

TEST_CASE("provider") {
	using namespace stepgate;

	config_parser_t parser;

	{
		config_t cfg;
		REQUIRE_NOTHROW( cfg = parser.parse( with_mandatory(
				"provider.env live\n"
				"provider.timeout 750ms\n" ) ) );
		REQUIRE( identity_provider::provider_environment_t::live ==
				cfg.m_provider.m_environment );
		REQUIRE( "https://api.stytch.com" == cfg.m_provider.actual_base_url() );
		REQUIRE( 750ms == cfg.m_provider.m_timeout );
	}

	{
		config_t cfg;
		REQUIRE_NOTHROW( cfg = parser.parse( with_mandatory(
				"provider.base_url http://127.0.0.1:9000\n"
				"provider.timeout 1min\n" ) ) );
		REQUIRE( cfg.m_provider.m_base_url );
		REQUIRE( "http://127.0.0.1:9000" == cfg.m_provider.actual_base_url() );
		REQUIRE( 60s == cfg.m_provider.m_timeout );
	}

	{
		config_t cfg;
		REQUIRE_NOTHROW( cfg = parser.parse( with_mandatory(
				"provider.timeout 3\n" ) ) );
		REQUIRE( 3s == cfg.m_provider.m_timeout );
	}

	REQUIRE_THROWS_AS( parser.parse( with_mandatory( "provider.env staging\n" ) ),
			config_parser_t::parser_exception_t );
	REQUIRE_THROWS_AS( parser.parse( with_mandatory( "provider.timeout 0\n" ) ),
			config_parser_t::parser_exception_t );
	REQUIRE_THROWS_AS( parser.parse( with_mandatory( "provider.timeout 5h\n" ) ),
			config_parser_t::parser_exception_t );
	REQUIRE_THROWS_AS( parser.parse( with_mandatory(
				"provider.base_url test.stytch.com\n" ) ),
			config_parser_t::parser_exception_t );
}

TEST_CASE("otp.bind_primary_session") {
	using namespace stepgate;

	config_parser_t parser;

	{
		config_t cfg;
		REQUIRE_NOTHROW( cfg = parser.parse( with_mandatory(
				"otp.bind_primary_session off\n" ) ) );
		REQUIRE( !cfg.m_bind_primary_session );
	}

	REQUIRE_THROWS_AS( parser.parse( with_mandatory(
				"otp.bind_primary_session yes\n" ) ),
			config_parser_t::parser_exception_t );
}

TEST_CASE("cookie attributes") {
	using namespace stepgate;

	config_parser_t parser;

	{
		config_t cfg;
		REQUIRE_NOTHROW( cfg = parser.parse( with_mandatory(
				"cookie.same_site strict\n"
				"cookie.domain example.com\n" ) ) );
		REQUIRE( cookie_store::same_site_t::strict ==
				cfg.m_cookie_attributes.m_same_site );
		REQUIRE( cfg.m_cookie_attributes.m_domain );
		REQUIRE( "example.com" == *cfg.m_cookie_attributes.m_domain );
	}

	{
		const auto what =
R"(
public_base_url http://localhost:8080
protected_prefix /app
signing_secret 0123456789abcdef0123456789abcdef
provider.project_id project-test-1234
provider.secret secret-test-5678
cookie.secure off
)"sv;

		config_t cfg;
		REQUIRE_NOTHROW( cfg = parser.parse( what ) );
		REQUIRE( !cfg.m_cookie_attributes.m_secure );
	}

	// Secure can't be turned off for https.
	REQUIRE_THROWS_AS( parser.parse( with_mandatory( "cookie.secure off\n" ) ),
			config_parser_t::parser_exception_t );

	// SameSite=None requires Secure.
	{
		const auto what =
R"(
public_base_url http://localhost:8080
protected_prefix /app
signing_secret 0123456789abcdef0123456789abcdef
provider.project_id project-test-1234
provider.secret secret-test-5678
cookie.secure off
cookie.same_site none
)"sv;

		REQUIRE_THROWS_AS( parser.parse( what ),
				config_parser_t::parser_exception_t );
	}

	REQUIRE_THROWS_AS( parser.parse( with_mandatory( "cookie.same_site relaxed\n" ) ),
			config_parser_t::parser_exception_t );
	REQUIRE_THROWS_AS( parser.parse( with_mandatory( "cookie.domain exa;mple\n" ) ),
			config_parser_t::parser_exception_t );
}

TEST_CASE("access_log") {
	using namespace stepgate;

	config_parser_t parser;

	{
		config_t cfg;
		REQUIRE_NOTHROW( cfg = parser.parse( with_mandatory(
				"access_log.url http://127.0.0.1:3000/events\n"
				"access_log.timeout 500ms\n" ) ) );
		REQUIRE( cfg.m_access_log.m_url );
		REQUIRE( "http://127.0.0.1:3000/events" == *cfg.m_access_log.m_url );
		REQUIRE( 500ms == cfg.m_access_log.m_timeout );
	}

	REQUIRE_THROWS_AS( parser.parse( with_mandatory(
				"access_log.url /events\n" ) ),
			config_parser_t::parser_exception_t );
}

TEST_CASE("http.worker_threads") {
	using namespace stepgate;

	config_parser_t parser;

	{
		config_t cfg;
		REQUIRE_NOTHROW( cfg = parser.parse( with_mandatory(
				"http.worker_threads 8\n" ) ) );
		REQUIRE( 8u == cfg.m_http_worker_threads );
	}

	REQUIRE_THROWS_AS( parser.parse( with_mandatory( "http.worker_threads 0\n" ) ),
			config_parser_t::parser_exception_t );
	REQUIRE_THROWS_AS( parser.parse( with_mandatory( "http.worker_threads many\n" ) ),
			config_parser_t::parser_exception_t );
}
