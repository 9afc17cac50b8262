#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN 
#include <doctest/doctest.h>

#include <stepgate/access_log/pub.hpp>

#include <so_5/all.hpp>

#include <httplib.h>

#include <nlohmann/json.hpp>

#include <fmt/format.h>

#include <condition_variable>
#include <mutex>
#include <thread>

using namespace std::string_literals;
using namespace std::chrono_literals;

namespace
{

using namespace stepgate::access_log;

constexpr int collector_port = 18766;

//
// collector_t
//
//! A simple HTTP-server that receives posted events.
class collector_t
{
public:
	collector_t()
	{
		m_server.Post( "/events",
				[this]( const httplib::Request & req, httplib::Response & res ) {
					{
						std::lock_guard< std::mutex > lock{ m_lock };
						m_bodies.push_back( req.body );
					}
					m_cv.notify_all();

					res.status = 200;
				} );

		m_thread = std::thread{ [this] {
				m_server.listen( "127.0.0.1", collector_port );
			} };

		while( !m_server.is_running() )
			std::this_thread::sleep_for( 10ms );
	}

	~collector_t()
	{
		m_server.stop();
		m_thread.join();
	}

	[[nodiscard]]
	std::vector< std::string >
	wait_bodies( std::size_t count )
	{
		std::unique_lock< std::mutex > lock{ m_lock };
		m_cv.wait_for( lock, 5s, [&] { return m_bodies.size() >= count; } );
		return m_bodies;
	}

private:
	httplib::Server m_server;
	std::thread m_thread;

	std::mutex m_lock;
	std::condition_variable m_cv;
	std::vector< std::string > m_bodies;
};

//
// a_starter_t
//
//! Agent that creates access_log-agent and records some events.
class a_starter_t final : public so_5::agent_t
{
public:
	a_starter_t( context_t ctx, params_t params )
		:	so_5::agent_t{ std::move(ctx) }
		,	m_params{ std::move(params) }
	{}

	void
	so_evt_start() override
	{
		auto sink = introduce_access_log(
				so_environment(),
				so_coop(),
				so_5::disp::one_thread::make_dispatcher(
						so_environment(), "access_log" ).binder(),
				m_params );

		sink->record( event_kind_t::access_requested,
				fields_t{ { "email", "sandbox@stytch.com" } } );
		sink->record( event_kind_t::second_factor_requested,
				fields_t{ { "phone", "***4567" } } );
	}

private:
	const params_t m_params;
};

} /* namespace anonymous */

TEST_CASE("event in JSON") {
	const auto json = nlohmann::json::parse( make_event_json(
			event_kind_t::primary_factor_completed,
			fields_t{ { "subject_id", "user-test-16d9ba61" } },
			std::chrono::system_clock::time_point{
					std::chrono::seconds{ 1704067200 } } ) );

	REQUIRE( "primary_factor_completed" == json.at( "event" ) );
	REQUIRE( 1704067200 == json.at( "timestamp" ) );
	REQUIRE( "user-test-16d9ba61" == json.at( "fields" ).at( "subject_id" ) );
}

TEST_CASE("names of events") {
	REQUIRE( "access_requested" ==
			to_string_view( event_kind_t::access_requested ) );
	REQUIRE( "primary_factor_completed" ==
			to_string_view( event_kind_t::primary_factor_completed ) );
	REQUIRE( "second_factor_requested" ==
			to_string_view( event_kind_t::second_factor_requested ) );
	REQUIRE( "second_factor_completed" ==
			to_string_view( event_kind_t::second_factor_completed ) );
}

TEST_CASE("events are posted to collector") {
	collector_t collector;

	params_t params;
	params.m_url = fmt::format( "http://127.0.0.1:{}/events", collector_port );
	params.m_timeout = 1s;

	std::vector< std::string > bodies;
	{
		so_5::wrapped_env_t sobj;

		sobj.environment().introduce_coop( [&]( so_5::coop_t & coop ) {
				coop.make_agent< a_starter_t >( params );
			} );

		bodies = collector.wait_bodies( 2u );
	}

	REQUIRE( 2u == bodies.size() );

	const auto first = nlohmann::json::parse( bodies[ 0 ] );
	REQUIRE( "access_requested" == first.at( "event" ) );
	REQUIRE( "sandbox@stytch.com" == first.at( "fields" ).at( "email" ) );

	const auto second = nlohmann::json::parse( bodies[ 1 ] );
	REQUIRE( "second_factor_requested" == second.at( "event" ) );
	REQUIRE( "***4567" == second.at( "fields" ).at( "phone" ) );
}
