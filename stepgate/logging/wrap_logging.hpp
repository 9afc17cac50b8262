/*!
 * @file
 * @brief Access to the application logger.
 *
 * There is just one logger for the whole process. It's installed by
 * logger_holder_t in main(). If no logger is installed (unit-tests for
 * example) then a special null-logger is used and all messages are
 * discarded.
 *
 * A message is formatted only if its level is enabled:
 * @code
 * ::stepgate::logging::direct_mode::warn(
 * 		[&]( auto & logger, auto level ) {
 * 			logger.log( level, "identity provider: {} failed: {}",
 * 					path, error );
 * 		} );
 * @endcode
 */

#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace stepgate
{

namespace logging
{

namespace impl
{

//! Install the logger for the whole application.
void
setup_logger( std::shared_ptr< spdlog::logger > logger ) noexcept;

//! Remove the logger installed by setup_logger().
void
remove_logger() noexcept;

/*!
 * @brief Get the installed logger or the null-logger if there is
 * no installed logger.
 */
[[nodiscard]]
spdlog::logger &
logger() noexcept;

[[nodiscard]]
inline bool
should_log( spdlog::level::level_enum level ) noexcept
{
	return logger().should_log( level );
}

} /* namespace impl */

//
// logger_holder_t
//
/*!
 * @brief Installs the logger in the constructor and removes it in
 * the destructor.
 */
class logger_holder_t
{
public:
	logger_holder_t( std::shared_ptr< spdlog::logger > logger ) noexcept
	{
		impl::setup_logger( std::move(logger) );
	}

	~logger_holder_t()
	{
		impl::remove_logger();
	}

	logger_holder_t( const logger_holder_t & ) = delete;
	logger_holder_t &
	operator=( const logger_holder_t & ) = delete;
};

//! Marker for logging via the application logger.
struct direct_logging_marker_t {};

//
// processed_log_level_t
//
/*!
 * @brief Log level that has already been checked by wrap_logging.
 *
 * Can be passed to spdlog::logger::log() as an ordinary level.
 */
class processed_log_level_t
{
	spdlog::level::level_enum m_level;

public:
	explicit processed_log_level_t(
		spdlog::level::level_enum level )
		:	m_level{ level }
	{}

	[[nodiscard]]
	auto
	value() const noexcept { return m_level; }

	[[nodiscard]]
	operator spdlog::level::level_enum() const noexcept { return value(); }
};

/*!
 * @brief Call @a action only if @a level is enabled.
 *
 * The @a action should have the format:
 * @code
 * void(spdlog::logger &, processed_log_level_t);
 * @endcode
 */
template< typename Logging_Action >
void
wrap_logging(
	direct_logging_marker_t,
	spdlog::level::level_enum level,
	Logging_Action && action )
{
	if( impl::should_log( level ) )
	{
		action( impl::logger(), processed_log_level_t{ level } );
	}
}

//! Shorthands for wrap_logging() with a fixed level.
namespace direct_mode
{

#define STEPGATE_LOGGING_DIRECT_MODE_FUNC(name, spdlog_level) \
template< typename Logging_Action > \
void \
name( Logging_Action && action ) \
{ \
	wrap_logging( direct_logging_marker_t{}, spdlog::level::spdlog_level, \
			std::forward<Logging_Action>(action) ); \
}

STEPGATE_LOGGING_DIRECT_MODE_FUNC(trace, trace)
STEPGATE_LOGGING_DIRECT_MODE_FUNC(debug, debug)
STEPGATE_LOGGING_DIRECT_MODE_FUNC(info, info)
STEPGATE_LOGGING_DIRECT_MODE_FUNC(warn, warn)
STEPGATE_LOGGING_DIRECT_MODE_FUNC(err, err)
STEPGATE_LOGGING_DIRECT_MODE_FUNC(critical, critical)

#undef STEPGATE_LOGGING_DIRECT_MODE_FUNC

} /* namespace direct_mode */

} /* namespace logging */

inline constexpr logging::direct_logging_marker_t direct_logging_mode;

} /* namespace stepgate */
