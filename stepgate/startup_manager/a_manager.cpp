/*!
 * @file
 * @brief Agent that starts all main parts in the right sequence.
 */

#include <stepgate/startup_manager/a_manager.hpp>

#include <stepgate/identity_provider/http_provider.hpp>

#include <stepgate/logging/wrap_logging.hpp>

namespace stepgate::startup_manager
{

//
// a_manager_t
//
a_manager_t::a_manager_t(
	context_t ctx,
	params_t params )
	:	so_5::agent_t{ std::move(ctx) }
	,	m_params{ std::move(params) }
{}

void
a_manager_t::so_define_agent()
{
	// NOTE: on_enter handlers can't throw exceptions.
	// But we don't care about this because the whole application
	// has to be terminated in the case of an error in on_enter handlers.
	st_http_entry_stage
		.on_enter( [this]{ on_enter_http_entry_stage(); } )
		.event( &a_manager_t::on_make_http_entry );
}

void
a_manager_t::so_evt_start()
{
	::stepgate::logging::direct_mode::info(
			[&]( auto & logger, auto level )
			{
				logger.log( level, "startup_manager: startup procedure started" );
			} );

	const auto & cfg = m_params.m_config;

	// access_log doesn't require additional attention to itself.
	m_access_log = ::stepgate::access_log::introduce_access_log(
			so_environment(),
			so_coop(),
			// This agent will use own worker thread.
			so_5::disp::one_thread::make_dispatcher(
					so_environment(),
					"access_log" ).binder(),
			::stepgate::access_log::params_t{
					cfg.m_access_log.m_url,
					cfg.m_access_log.m_timeout
			} );

	this >>= st_http_entry_stage;
}

void
a_manager_t::so_evt_finish()
{
	// If HTTP-entry works then it should be stopped.
	if( m_entry )
		m_entry->stop();
}

void
a_manager_t::on_enter_http_entry_stage()
{
	so_5::send< make_http_entry >( *this );
}

void
a_manager_t::on_make_http_entry(
	mhood_t< make_http_entry > )
{
	::stepgate::logging::direct_mode::debug(
			[]( auto & logger, auto level )
			{
				logger.log(
						level,
						"startup_manager: starting HTTP-entry" );
			} );

	const auto & cfg = m_params.m_config;

	auto provider = ::stepgate::identity_provider::make_http_provider(
			::stepgate::identity_provider::http_provider_params_t{
					cfg.m_provider.actual_base_url(),
					cfg.m_provider.m_project_id,
					cfg.m_provider.m_secret,
					cfg.m_provider.m_timeout
			} );

	m_signer = std::make_unique< credential_signer::credential_signer_t >(
			credential_signer::signing_secret_t{ cfg.m_signing_secret } );

	m_orchestrator = std::make_unique< auth_orchestrator::orchestrator_t >(
			auth_orchestrator::orchestrator_params_t{
					cfg.m_public_base_url,
					cfg.m_entry_point,
					cfg.m_second_factor_entry,
					cfg.m_bind_primary_session
			},
			std::move(provider),
			*m_signer,
			m_access_log );

	m_route_gate = std::make_unique< route_gate::route_gate_t >(
			cfg.m_protected_prefixes,
			cfg.m_entry_point,
			*m_signer );

	m_entry = ::stepgate::http_entry::start_entry(
			::stepgate::http_entry::entry_params_t{
					m_params.m_http_ip,
					m_params.m_http_port,
					cfg.m_http_worker_threads,
					cfg.m_content_root,
					cfg.m_cookie_attributes
			},
			*m_orchestrator,
			*m_route_gate );

	this >>= st_normal;

	::stepgate::logging::direct_mode::info(
			[]( auto & logger, auto level )
			{
				logger.log(
						level,
						"startup_manager: all components are started" );
			} );
}

//
// introduce_startup_manager
//
void
introduce_startup_manager(
	so_5::environment_t & env,
	params_t params )
{
	env.register_agent_as_coop(
			env.make_agent< a_manager_t >( std::move(params) ) );
}

} /* namespace stepgate::startup_manager */
