/*!
 * @file
 * @brief Helpers for logging.
 */

#include <stepgate/logging/wrap_logging.hpp>

namespace stepgate::logging
{

namespace impl
{

static std::shared_ptr< spdlog::logger > g_logger;

void
setup_logger( std::shared_ptr< spdlog::logger > logger ) noexcept
{
	g_logger = std::move(logger);
}

void
remove_logger() noexcept
{
	g_logger = {};
}

[[nodiscard]]
static spdlog::logger &
null_logger() noexcept
{
	// A logger without sinks. Everything sent to it is just discarded.
	static spdlog::logger logger{ "null" };
	logger.set_level( spdlog::level::off );

	return logger;
}

[[nodiscard]]
spdlog::logger &
logger() noexcept
{
	if( g_logger )
		return *g_logger;

	return null_logger();
}

} /* namespace impl */

} /* namespace stepgate::logging */
