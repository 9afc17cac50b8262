/*!
 * @file
 * @brief Agent for recording access events.
 */

#pragma once

#include <stepgate/access_log/pub.hpp>

#include <stepgate/utils/url_parts.hpp>

#include <so_5/all.hpp>

namespace stepgate::access_log
{

//
// record_t
//
//! A message with an event to be recorded.
struct record_t final : public so_5::message_t
{
	event_kind_t m_kind;
	fields_t m_fields;
	std::chrono::system_clock::time_point m_timestamp;

	record_t(
		event_kind_t kind,
		fields_t fields,
		std::chrono::system_clock::time_point timestamp )
		:	m_kind{ kind }
		,	m_fields{ std::move(fields) }
		,	m_timestamp{ timestamp }
	{}
};

//
// a_access_log_t
//
/*!
 * @brief Agent that logs access events and posts them to an
 * external collector.
 *
 * The agent should work on its own worker thread because posting
 * of an event is a blocking operation.
 */
class a_access_log_t : public so_5::agent_t
{
public:
	//! Initializing constructor.
	a_access_log_t(
		//! SObjectizer-related parameters for the agent.
		context_t ctx,
		//! Initial params for the agent.
		params_t params );

	void
	so_define_agent() override;

	void
	so_evt_start() override;

private:
	//! Initial parameters for the agent.
	const params_t m_params;

	//! Parts of URL for posting events.
	/*!
	 * Empty if posting is turned off.
	 */
	const std::optional< utils::url_parts_t > m_target;

	void
	on_record( mhood_t< record_t > cmd );

	void
	post_event( const std::string & body ) const;
};

} /* namespace stepgate::access_log */
