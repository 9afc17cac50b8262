/*!
 * @file
 * @brief Agent that starts all main parts in the right sequence.
 */

#pragma once

#include <stepgate/startup_manager/pub.hpp>

#include <stepgate/access_log/pub.hpp>
#include <stepgate/auth_orchestrator/pub.hpp>
#include <stepgate/credential_signer/pub.hpp>
#include <stepgate/http_entry/pub.hpp>
#include <stepgate/route_gate/pub.hpp>

#include <so_5/all.hpp>

#include <memory>

namespace stepgate::startup_manager
{

//
// a_manager_t
//
/*!
 * @brief Agent that starts all main parts in the right sequence.
 *
 * The sequence of launching:
 * - access_log agent on its own worker thread;
 * - the identity provider, the orchestrator and the route gate;
 * - HTTP-entry.
 *
 * The agent owns the orchestrator and the route gate because
 * HTTP-entry holds references to them.
 */
class a_manager_t : public so_5::agent_t
{
public:
	//! Initializing constructor.
	a_manager_t(
		//! SObjectizer-related parameters for the agent.
		context_t ctx,
		//! Initial params for the agent.
		params_t params );

	void
	so_define_agent() override;

	void
	so_evt_start() override;

	void
	so_evt_finish() override;

private:
	//! Command for the creation of HTTP-entry.
	struct make_http_entry final : public so_5::signal_t {};

	//! Initial parameters for the agent.
	const params_t m_params;

	//! State for launching HTTP-entry.
	state_t st_http_entry_stage{ this, "http_entry_stage" };
	//! The normal state when all components are started.
	state_t st_normal{ this, "normal" };

	//! Receiver of access events.
	access_log::sink_shptr_t m_access_log;

	//! Signer for step-up credentials.
	std::unique_ptr< credential_signer::credential_signer_t > m_signer;

	//! The implementation of the authentication flow.
	std::unique_ptr< auth_orchestrator::orchestrator_t > m_orchestrator;

	//! The guard for protected paths.
	std::unique_ptr< route_gate::route_gate_t > m_route_gate;

	//! The HTTP-entry.
	http_entry::running_entry_handle_t m_entry;

	//! on_enter-handler for http_entry_stage state.
	/*!
	 * The agent sends make_http_entry to itself.
	 *
	 * We can't do actions that throws in on_enter-handler because
	 * on_enter-handler should be noexcept method. So we send a message
	 * and then do all necessary actions in an ordinary event-handler
	 * where exceptions can go out.
	 */
	void
	on_enter_http_entry_stage();

	//! Handler for a command to create HTTP-entry.
	void
	on_make_http_entry(
		mhood_t< make_http_entry > );
};

} /* namespace stepgate::startup_manager */
