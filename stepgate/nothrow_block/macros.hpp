/*!
 * @file
 * @brief Macros for blocks of code that must not throw.
 *
 * Such blocks are used on best-effort paths: an exception raised
 * inside the block is logged and suppressed.
 */

#pragma once

#include <stepgate/logging/wrap_logging.hpp>

#include <exception>

namespace stepgate::nothrow_block::impl
{

/*!
 * @brief Log an exception suppressed by a nothrow block.
 *
 * @note
 * spdlog handles errors of formatting and writing by itself, so
 * this function doesn't throw.
 *
 * @a what is nullptr if the exception isn't derived from std::exception.
 */
inline void
log_suppressed_exception(
	const char * file,
	int line,
	const char * function,
	const char * stage,
	const char * what ) noexcept
{
	::stepgate::logging::direct_mode::err(
			[&]( auto & logger, auto level ) {
				logger.log( level,
						"{}:{} [{}] exception suppressed at stage '{}' => {}",
						file, line, function,
						stage ? stage : "unspecified",
						what ? what : "description not available" );
			} );
}

} /* namespace stepgate::nothrow_block::impl */

/*!
 * Starts a new block for catching and suppressing all exceptions.
 *
 * Usage example:
 * @code
 * STEPGATE_NOTHROW_BLOCK_BEGIN()
 * 	STEPGATE_NOTHROW_BLOCK_STAGE(post_event)
 * 	... // Some code that can throw.
 * STEPGATE_NOTHROW_BLOCK_END(LOG_THEN_IGNORE)
 * @endcode
 */
#define STEPGATE_NOTHROW_BLOCK_BEGIN() \
{ \
	const char * stepgate_nothrow_block_stage__ = nullptr; \
	(void)stepgate_nothrow_block_stage__; \
	try \
	{

/*!
 * Sets the name of the current stage. The name is used for logging
 * if an exception is caught.
 */
#define STEPGATE_NOTHROW_BLOCK_STAGE(stage_name) \
	stepgate_nothrow_block_stage__ = #stage_name;

#define STEPGATE_NOTHROW_BLOCK_END_LOG_THEN_IGNORE() \
	} \
	catch( const std::exception & x ) \
	{ \
		::stepgate::nothrow_block::impl::log_suppressed_exception( \
				__FILE__, __LINE__, __PRETTY_FUNCTION__, \
				stepgate_nothrow_block_stage__, x.what() ); \
	} \
	catch( ... ) \
	{ \
		::stepgate::nothrow_block::impl::log_suppressed_exception( \
				__FILE__, __LINE__, __PRETTY_FUNCTION__, \
				stepgate_nothrow_block_stage__, nullptr ); \
	}

/*!
 * Finishes block started by STEPGATE_NOTHROW_BLOCK_BEGIN.
 *
 * @a action can be LOG_THEN_IGNORE only.
 */
#define STEPGATE_NOTHROW_BLOCK_END(action) \
	STEPGATE_NOTHROW_BLOCK_END_##action() \
}
