/*!
 * @file
 * @brief Agent for recording access events.
 */

#include <stepgate/access_log/a_access_log.hpp>

#include <stepgate/logging/wrap_logging.hpp>

#include <stepgate/nothrow_block/macros.hpp>

#include <stepgate/exception.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <httplib.h>

namespace stepgate::access_log
{

namespace
{

[[nodiscard]]
std::optional< utils::url_parts_t >
make_target( const std::optional< std::string > & url )
{
	if( !url )
		return std::nullopt;

	auto parts = utils::split_url( *url );
	if( !parts )
		throw exception_t{ "access_log: invalid URL: " + *url };

	return parts;
}

//
// mbox_sink_t
//
//! Actual implementation of sink interface that sends events to
//! access_log-agent.
class mbox_sink_t final : public sink_t
{
public:
	explicit mbox_sink_t( so_5::mbox_t dest )
		:	m_dest{ std::move(dest) }
	{}

	void
	record( event_kind_t kind, fields_t fields ) noexcept override
	{
		STEPGATE_NOTHROW_BLOCK_BEGIN()
			STEPGATE_NOTHROW_BLOCK_STAGE(send_record)
			so_5::send< record_t >(
					m_dest,
					kind,
					std::move(fields),
					std::chrono::system_clock::now() );
		STEPGATE_NOTHROW_BLOCK_END(LOG_THEN_IGNORE)
	}

private:
	const so_5::mbox_t m_dest;
};

} /* anonymous namespace */

//
// a_access_log_t
//
a_access_log_t::a_access_log_t(
	context_t ctx,
	params_t params )
	:	so_5::agent_t{ ctx + limit_then_drop< record_t >( params.m_queue_limit ) }
	,	m_params{ std::move(params) }
	,	m_target{ make_target( m_params.m_url ) }
{}

void
a_access_log_t::so_define_agent()
{
	so_subscribe_self().event( &a_access_log_t::on_record );
}

void
a_access_log_t::so_evt_start()
{
	::stepgate::logging::direct_mode::info(
			[this]( auto & logger, auto level )
			{
				logger.log( level, "access_log: started, posting to: {}",
						m_target ? m_target->m_origin : std::string{ "<none>" } );
			} );
}

void
a_access_log_t::on_record( mhood_t< record_t > cmd )
{
	::stepgate::logging::direct_mode::info(
			[&cmd]( auto & logger, auto level )
			{
				logger.log( level, "access_log: {} {}",
						to_string_view( cmd->m_kind ),
						cmd->m_fields );
			} );

	if( !m_target )
		return;

	// A failure of posting should not stop the agent.
	STEPGATE_NOTHROW_BLOCK_BEGIN()
		STEPGATE_NOTHROW_BLOCK_STAGE(make_body)
		const auto body = make_event_json(
				cmd->m_kind, cmd->m_fields, cmd->m_timestamp );

		STEPGATE_NOTHROW_BLOCK_STAGE(post_event)
		post_event( body );
	STEPGATE_NOTHROW_BLOCK_END(LOG_THEN_IGNORE)
}

void
a_access_log_t::post_event( const std::string & body ) const
{
	httplib::Client client{ m_target->m_origin };
	client.set_connection_timeout( m_params.m_timeout );
	client.set_read_timeout( m_params.m_timeout );
	client.set_write_timeout( m_params.m_timeout );

	const auto result = client.Post(
			m_target->m_target, body, "application/json" );
	if( !result )
		throw exception_t{
				fmt::format( "access_log: post failed: {}",
						httplib::to_string( result.error() ) )
			};

	if( result->status < 200 || result->status >= 300 )
		throw exception_t{
				fmt::format( "access_log: collector replied {}",
						result->status )
			};
}

//
// introduce_access_log
//
[[nodiscard]]
sink_shptr_t
introduce_access_log(
	so_5::environment_t & env,
	so_5::coop_handle_t parent_coop,
	so_5::disp_binder_shptr_t disp_binder,
	params_t params )
{
	auto coop_holder = env.make_coop( parent_coop, std::move(disp_binder) );
	so_5::mbox_t dest = coop_holder->make_agent< a_access_log_t >(
			std::move(params) )->so_direct_mbox();

	env.register_coop( std::move(coop_holder) );

	return std::make_shared< mbox_sink_t >( std::move(dest) );
}

} /* namespace stepgate::access_log */
