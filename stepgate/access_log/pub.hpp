/*!
 * @file
 * @brief The public interface of access_log.
 */

#pragma once

#include <so_5/all.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace stepgate::access_log
{

//
// event_kind_t
//
//! Kinds of events to be recorded.
enum class event_kind_t
{
	//! A user has asked for access (a magic link is going to be sent).
	access_requested,
	//! A magic link has been consumed successfully.
	primary_factor_completed,
	//! A one-time code has been sent.
	second_factor_requested,
	//! A one-time code has been accepted.
	second_factor_completed
};

[[nodiscard]]
std::string_view
to_string_view( event_kind_t kind ) noexcept;

//
// fields_t
//
/*!
 * @brief Fields of an event.
 *
 * @attention
 * Tokens, tickets and credentials must never be placed here.
 */
using fields_t = std::map< std::string, std::string >;

//
// sink_t
//
/*!
 * @brief Interface of a receiver of access events.
 *
 * Recording is a fire-and-forget operation. It never blocks for
 * a long time and never throws.
 */
class sink_t
{
public:
	virtual ~sink_t();

	virtual void
	record( event_kind_t kind, fields_t fields ) noexcept = 0;
};

//
// sink_shptr_t
//
using sink_shptr_t = std::shared_ptr< sink_t >;

/*!
 * @brief Make a JSON representation of an event.
 *
 * The result looks like:
 * @code
 * {"event":"access_requested","timestamp":1700000000,"fields":{"email":"a@b.c"}}
 * @endcode
 */
[[nodiscard]]
std::string
make_event_json(
	event_kind_t kind,
	const fields_t & fields,
	std::chrono::system_clock::time_point timestamp );

//
// params_t
//
//! Initial parameters for access_log-agent.
struct params_t
{
	//! URL for posting events.
	/*!
	 * Events are only logged if it is empty.
	 */
	std::optional< std::string > m_url;

	//! Timeout for posting an event.
	std::chrono::milliseconds m_timeout{ std::chrono::seconds{2} };

	//! Max number of events waiting in the queue.
	/*!
	 * New events are dropped if the queue is full.
	 */
	std::size_t m_queue_limit{ 1024u };
};

//
// introduce_access_log
//
/*!
 * @brief A factory for creation of a new access_log-agent and
 * binding it to the specified dispatcher.
 *
 * @return a sink that sends events to the new agent.
 */
[[nodiscard]]
sink_shptr_t
introduce_access_log(
	//! SObjectizer Environment to work within.
	so_5::environment_t & env,
	//! The parent coop for a new agent.
	so_5::coop_handle_t parent_coop,
	//! The dispatcher for a new agent.
	so_5::disp_binder_shptr_t disp_binder,
	//! Initial params for a new agent.
	params_t params );

} /* namespace stepgate::access_log */
