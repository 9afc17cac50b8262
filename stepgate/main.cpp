#include <stepgate/utils/spdlog_log_levels.hpp>
#include <stepgate/utils/ensure_successful_syscall.hpp>
#include <stepgate/utils/load_file_into_memory.hpp>
#include <stepgate/utils/overloaded.hpp>

#include <stepgate/startup_manager/pub.hpp>

#include <stepgate/config.hpp>

#include <stepgate/logging/wrap_logging.hpp>

#include <stepgate/nothrow_block/macros.hpp>

#include <signal.h>
#include <syslog.h>
#include <unistd.h>

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <memory>
#include <array>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <vector>
#include <filesystem>

#include <args/args.hxx>

#include <optional>
#include <variant>

#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/syslog_sink.h>

#include <fmt/ostream.h>
#include <fmt/ranges.h>

#include <so_5/all.hpp>

namespace {

const char version_string[] = "stepgate v.0.1.0";

const char version_description[] =
R"ver([magic link + SMS one-time code step-up]
)ver";

//
// to_string
//

[[nodiscard]]
std::string
to_string( const spdlog::string_view_t what )
{
	return std::string( what.data(), what.size() );
}

//
// detect_log_level
//

[[nodiscard]]
spdlog::level::level_enum
detect_log_level( const std::string & name )
{
	const auto r = stepgate::utils::name_to_spdlog_level_enum( name );

	if( !r )
	{
		throw std::runtime_error( "Unsupported log-level: " + name );
	}

	return *r;
}

//
// log_target_t
//

//! Logging to the standard output or error stream.
struct console_target_t
{
	bool m_use_stderr{ false };
};

//! Logging to syslog with the specified ident.
struct syslog_target_t
{
	std::string m_ident;
};

//! Logging to a set of rotating files.
struct file_target_t
{
	std::string m_file_name;
};

using log_target_t = std::variant<
		console_target_t, syslog_target_t, file_target_t >;

/*!
 * Value 'stdout' or 'stderr' is a console, '@ident' is syslog,
 * anything else is a file name.
 */
[[nodiscard]]
log_target_t
parse_log_target( const std::string & value )
{
	if( "stdout" == value )
		return console_target_t{ false };
	if( "stderr" == value )
		return console_target_t{ true };

	if( !value.empty() && '@' == value.front() )
	{
		if( 1u == value.size() )
			throw std::runtime_error( "syslog ident is missing in "
					"log-target: " + value );
		return syslog_target_t{ value.substr( 1u ) };
	}

	return file_target_t{ value };
}

std::ostream &
operator<<( std::ostream & o, const log_target_t & target )
{
	std::visit( stepgate::utils::overloaded{
			[&o]( const console_target_t & c ) {
				o << (c.m_use_stderr ? "stderr" : "stdout");
			},
			[&o]( const syslog_target_t & s ) {
				o << "@" << s.m_ident;
			},
			[&o]( const file_target_t & f ) {
				o << f.m_file_name;
			}
		},
		target );

	return o;
}

//
// log_params_t
//

//! Logging parameters.
struct log_params_t
{
	//! Destinations for log messages.
	/*!
	 * Only one destination of every kind is allowed.
	 * If the list is empty then stdout is used.
	 */
	std::vector< log_target_t > m_targets;

	//! Log level from the command line.
	/*!
	 * If it is set then it overrides log_level from the config.
	 */
	std::optional< spdlog::level::level_enum > m_log_level;
	spdlog::level::level_enum m_log_flush_level{ spdlog::level::err };
	std::size_t m_log_file_size{ 10ull*1024u*1024u };
	std::size_t m_log_file_count{ 3u };

	void
	add_target( const std::string & value )
	{
		auto target = parse_log_target( value );

		const auto it = std::find_if(
				m_targets.begin(), m_targets.end(),
				[&target]( const log_target_t & t ) {
					return t.index() == target.index();
				} );
		if( it != m_targets.end() )
			throw std::runtime_error( fmt::format(
					"log-target of the same kind is already present: {}, "
					"additional target: {}",
					fmt::streamed( *it ), value ) );

		m_targets.push_back( std::move(target) );
	}
};

std::ostream &
operator<<( std::ostream & o, const log_params_t & params )
{
	for( const auto & t : params.m_targets )
		fmt::print( o, "(log_target {}) ", fmt::streamed( t ) );

	if(params.m_log_level)
		fmt::print( o, "(log_level {}) ",
			spdlog::level::to_string_view(*(params.m_log_level)) );
	fmt::print( o, "(log_flush_level {}) ",
		spdlog::level::to_string_view(params.m_log_flush_level) );

	fmt::print( o, "(log_file_size {}) ", params.m_log_file_size );
	fmt::print( o, "(log_file_count {}) ", params.m_log_file_count );

	return o;
}

//
// cmd_line_args_t
//

//! Command-line arguments.
struct cmd_line_args_t
{
	log_params_t m_log_params;

	asio::ip::address m_http_ip;
	std::uint16_t m_http_port;

	std::filesystem::path m_config_path;
};

std::ostream &
operator<<( std::ostream & o, const cmd_line_args_t & args )
{
	fmt::print( o, "(log_params {}) ", fmt::streamed( args.m_log_params ) );

	fmt::print( o, "(http_ip {}) ", args.m_http_ip.to_string() );
	fmt::print( o, "(http_port {}) ", args.m_http_port );

	fmt::print( o, "(config_path {}) ", args.m_config_path.string() );

	return o;
}

//
// finish_app_ex_t
//

//! An exception for errors related to command-line args parsing.
/*!
 * If such an exception is throw then the application has to be finished.
 */
class finish_app_ex_t : public std::runtime_error {

	int m_exit_code;

public:
	finish_app_ex_t(
		const char * what_arg,
		int exit_code )
	:	std::runtime_error{ what_arg }
	,	m_exit_code{ exit_code }
	{
	}

	int
	exit_code() const noexcept { return m_exit_code; }
};

//
// parse_cmd_line
//

/*!
 * Returns values of command-line args or throws finish_app_ex_t
 * in the case of an error.
 */
[[nodiscard]]
cmd_line_args_t
parse_cmd_line( int argc, char ** argv )
{
	cmd_line_args_t result;

	args::ArgumentParser parser( "stepgate", "\n" );

	// Common parameters.

	args::HelpFlag help( parser, "help", "Display this help text",
			{ 'h', "help" } );

	args::Flag version(parser, "version", "Show verion number and "
			"description", { 'v', "version" } );

	// Parameters for logging.

	args::ValueFlagList< std::string > log_target( parser,
		"name", "Set log destination. "
		"Value 'stdout' means the standard output stream. "
		"Value 'stderr' means the standard error stream. "
		"Value '@something' means syslog as 'something'. "
		"Other values mean a file name. "
		" (default: stdout)",
		{ "log-target" } );

	args::ValueFlag< std::string > log_level( parser,
			"level", "Set logging level. Value 'off' turns logging off "
			" (default: log_level from the config)",
			{ 'l', "log-level" } );

	args::ValueFlag< std::string > log_flush_level( parser,
			"level", "Set flush level. Value 'off' turns flushing off "
			" (default: " +
			to_string(
				spdlog::level::to_string_view(
					result.m_log_params.m_log_flush_level) ) + ")",
			{ 'f', "log-flush-level" } );

	args::ValueFlag< unsigned int > log_file_size( parser,
			"bytes", "Set maximum size of log file"
			" (default: " + std::to_string(
				result.m_log_params.m_log_file_size ) + ")",
			{ "log-file-size" } );

	args::ValueFlag< unsigned int > log_file_count( parser,
			"non-zero-value", "Set maximum count of log files in rotation. "
			"This value should be at least 2 "
			" (default: " + std::to_string(
				result.m_log_params.m_log_file_count ) + ")",
			{ "log-file-count" } );

	// Parameters for HTTP-server.

	args::ValueFlag<std::string> http_ip( parser,
			"char-seq", "Set http endpoint ip-address."
			" [required parameter]",
			{"http-ip"});

	args::ValueFlag<unsigned short> http_port( parser,
			"ushort", "Set http port. [required parameter]",
			{"http-port"});

	// A path to the config.

	args::ValueFlag<std::string> config_path( parser,
			"path", "Set path to the configuration file."
			" [required parameter]",
			{"config-path"});

	try
	{
		parser.ParseCLI( argc, argv );
	}
	catch( const args::Completion & e )
	{
		std::cout << e.what();
		throw finish_app_ex_t("bash-completion", 0);
	}
	catch( const args::Help & /*e*/ )
	{
		std::cout << parser;
		throw finish_app_ex_t( "cmd-line-help", 1 );
	}
	catch( const args::ParseError & e )
	{
		std::cerr << e.what() << std::endl;
		throw finish_app_ex_t( "cmd-line-parse-error", 2 );
	}

	if( version )
	{
		std::cout << version_string << "\n" << version_description
				<< std::endl;
		throw finish_app_ex_t( "show-version-only", 0 );
	}

	if( log_target )
	{
		for ( const auto & nm: args::get( log_target ) )
		{
			result.m_log_params.add_target(nm);
		}
	}
	if( log_level )
		result.m_log_params.m_log_level = detect_log_level( args::get( log_level ) );
	if( log_flush_level )
		result.m_log_params.m_log_flush_level = detect_log_level(
			args::get( log_flush_level ) );
	if( log_file_size )
	{
		result.m_log_params.m_log_file_size = args::get( log_file_size );
		if(0u == result.m_log_params.m_log_file_size)
			throw std::runtime_error("zero can't be used as log-file-size");
	}
	if( log_file_count )
	{
		result.m_log_params.m_log_file_count = args::get( log_file_count );
		if( 2u > result.m_log_params.m_log_file_count )
			throw std::runtime_error( "log-file-count should be at least 2" );
	}

	if( http_ip )
	{
		asio::error_code ec;
		result.m_http_ip = asio::ip::make_address(
			args::get( http_ip ).c_str(), ec );

		if(ec)
			throw std::runtime_error("invalid value of --http-ip");
	}
	else
		throw std::runtime_error( "param --http-ip is absent" );
	if( http_port )
		result.m_http_port = args::get( http_port );
	else
		throw std::runtime_error( "param --http-port is absent" );

	if( config_path )
		result.m_config_path = args::get( config_path );
	else
		throw std::runtime_error( "param --config-path is absent" );

	return result;
}

//
// Handling of termination signals.
//

const std::array<int, 5> signals_to_handle{
	SIGINT, SIGHUP, SIGQUIT, SIGTERM, SIGPIPE
};

[[nodiscard]]
sigset_t
make_handled_sigset()
{
	sigset_t result;
	sigemptyset(&result);
	for(auto s : signals_to_handle)
	{
		::stepgate::utils::ensure_successful_syscall(
				sigaddset(&result, s),
				"make_handled_sigset.sigaddset()");
	}

	return result;
}

// Signals have to be blocked before the start of any thread.
// Otherwise a signal can be delivered to a worker thread.
void
block_signals_for_current_process()
{
	const sigset_t sigset = make_handled_sigset();

	::stepgate::utils::ensure_successful_syscall(
			sigprocmask(SIG_BLOCK, &sigset, nullptr),
			"block_signals_for_current_process.sigprocmask()");
}

//! Wait for a signal that finishes the application.
/*!
 * SIGPIPE is ignored, any other of the handled signals is returned.
 */
[[nodiscard]]
int
wait_termination_signal()
{
	const sigset_t sigset = make_handled_sigset();

	for(;;)
	{
		int signal;
		const int rc = sigwait(&sigset, &signal);

		if(0 != rc)
			throw std::runtime_error("sigwait failed -> " +
					std::system_category().message(rc));

		if(SIGPIPE != signal)
			return signal;
	}
}

//
// sink_list_t
//

using sink_list_t = std::vector<spdlog::sink_ptr>;

[[nodiscard]]
sink_list_t
make_sinks( const log_params_t & log_params )
{
	sink_list_t result;

	for( const auto & target : log_params.m_targets )
	{
		result.push_back( std::visit( stepgate::utils::overloaded{
				[]( const console_target_t & c ) -> spdlog::sink_ptr {
					if( c.m_use_stderr )
						return std::make_shared<
								spdlog::sinks::stderr_color_sink_mt >();
					return std::make_shared<
							spdlog::sinks::stdout_color_sink_mt >();
				},
				[]( const syslog_target_t & s ) -> spdlog::sink_ptr {
					// LOG_USER facility, messages are formatted by spdlog.
					return std::make_shared< spdlog::sinks::syslog_sink_mt >(
							s.m_ident, 0, LOG_USER, true );
				},
				[&log_params]( const file_target_t & f ) -> spdlog::sink_ptr {
					return std::make_shared<
							spdlog::sinks::rotating_file_sink_mt >(
								f.m_file_name,
								log_params.m_log_file_size,
								log_params.m_log_file_count );
				}
			},
			target ) );
	}

	if( result.empty() )
	{
		result.push_back(
			std::make_shared<spdlog::sinks::stdout_color_sink_mt>() );
	}

	return result;
}

[[nodiscard]]
std::shared_ptr<spdlog::logger>
make_logger(
	std::string logger_name,
	const sink_list_t & sinks,
	const log_params_t & log_params )
{
	auto logger = std::make_shared< spdlog::logger >(
		std::move(logger_name), sinks.begin(), sinks.end() );

	// Everything is logged until the config is loaded.
	logger->set_level( log_params.m_log_level.value_or(
			spdlog::level::trace ) );
	logger->flush_on( log_params.m_log_flush_level );

	return logger;
}

//! Load and parse the config.
/*!
 * @throw std::exception in the case of an error.
 */
[[nodiscard]]
stepgate::config_t
load_config( const std::filesystem::path & config_path )
{
	const auto content = stepgate::utils::load_file_into_memory(
			config_path );

	stepgate::config_parser_t parser;
	auto config = parser.parse( content );

	::stepgate::logging::direct_mode::info(
			[&]( auto & logger, auto level ) {
				logger.log( level, "config loaded from {}: public_base_url={}, "
						"protected_prefixes=[{}], content_root={}, "
						"provider={}, bind_primary_session={}",
						config_path.string(),
						config.m_public_base_url,
						fmt::join( config.m_protected_prefixes, ", " ),
						config.m_content_root.string(),
						config.m_provider.actual_base_url(),
						config.m_bind_primary_session );
			} );

	return config;
}

// Helper function for tuning of SObjectizer parameters.
[[nodiscard]]
so_5::environment_params_t
make_sobjectizer_params()
{
	// Special logger that redirects all error messages to
	// the application logger.
	class so5_error_logger_t : public so_5::error_logger_t
	{
	public:
		so5_error_logger_t() = default;

		void
		log(
			const char * file_name,
			unsigned int line,
			const std::string & message ) override
		{
			STEPGATE_NOTHROW_BLOCK_BEGIN()
				STEPGATE_NOTHROW_BLOCK_STAGE(log_error_msg)

				::stepgate::logging::wrap_logging(
						::stepgate::direct_logging_mode,
						spdlog::level::err,
						[&]( auto & logger, auto level )
						{
							logger.log(
									level,
									"an error detected by SObjectizer: {} (at {}:{})",
									message, file_name, line );
						} );
			STEPGATE_NOTHROW_BLOCK_END(LOG_THEN_IGNORE)
		}
	};

	// Special logger that logs exceptions thrown from event-handlers.
	class so5_event_exception_logger_t : public so_5::event_exception_logger_t
	{
	public:
		so5_event_exception_logger_t() = default;

		void
		log_exception(
			const std::exception & event_exception,
			const so_5::coop_handle_t & coop ) noexcept override
		{
			// This method can't throw. So catch all exceptions.
			STEPGATE_NOTHROW_BLOCK_BEGIN()
				STEPGATE_NOTHROW_BLOCK_STAGE(log_exception)

				::stepgate::logging::wrap_logging(
						::stepgate::direct_logging_mode,
						spdlog::level::err,
						[&]( auto & logger, auto level )
						{
							logger.log(
									level,
									"an exception from SObjectizer's agent event: \"{}\", "
									"agent's coop ID: {}",
									event_exception.what(),
									coop.id() );
						} );
			STEPGATE_NOTHROW_BLOCK_END(LOG_THEN_IGNORE)
		}
	};

	so_5::environment_params_t params;

	params.error_logger( std::make_shared< so5_error_logger_t >() );
	params.event_exception_logger(
			std::make_unique< so5_event_exception_logger_t >() );

	params.queue_locks_defaults_manager(
			so_5::make_defaults_manager_for_simple_locks() );

	return params;
}

} /* anonimous namespace */

int
main(int argc, char ** argv)
{

	try
	{
		const auto cmd_line_args = parse_cmd_line( argc, argv );

		auto sinks =  make_sinks( cmd_line_args.m_log_params );
		auto logger = make_logger(
				"stepgate", sinks, cmd_line_args.m_log_params );
		stepgate::logging::logger_holder_t log_holder{ logger };

		block_signals_for_current_process();

		::stepgate::logging::direct_mode::info(
				[&]( auto & logger, auto level ) {
					logger.log( level, "{} started with: {}",
							version_string, fmt::streamed( cmd_line_args ) );
				} );

		auto config = load_config( cmd_line_args.m_config_path );

		// The level from the command line has priority.
		if( !cmd_line_args.m_log_params.m_log_level )
			logger->set_level( config.m_log_level );

		so_5::wrapped_env_t sobj{
			[&]( so_5::environment_t & env ) {
				stepgate::startup_manager::introduce_startup_manager(
						env,
						stepgate::startup_manager::params_t{
								std::move(config),
								cmd_line_args.m_http_ip,
								cmd_line_args.m_http_port
						} );
			},
			[]( so_5::environment_params_t & params ) {
				params = make_sobjectizer_params();
			}
		};

		const int signal = wait_termination_signal();
		::stepgate::logging::direct_mode::info(
				[signal]( auto & logger, auto level ) {
					logger.log( level, "stepgate: shutdown on signal {} ({})",
							signal, ::strsignal( signal ) );
				} );
	}
	catch(const finish_app_ex_t & need_finish) {
		return need_finish.exit_code();
	}
	catch(const std::exception & ex)
	{
		std::cerr << "*** Exception caught: " << ex.what() << std::endl;
		return 2;
	}
	catch(...)
	{
		std::cerr << "*** Unknown exception caught! ***" << std::endl;
		return 2;
	}

	return 0;
}
