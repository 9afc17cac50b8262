#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <stepgate/identity_provider/http_provider.hpp>

#include <stepgate/phone_number/pub.hpp>

#include <httplib.h>

#include <nlohmann/json.hpp>

#include <map>
#include <mutex>
#include <thread>

using namespace std::string_literals;
using namespace std::string_view_literals;
using namespace std::chrono_literals;

namespace
{

using namespace stepgate::identity_provider;

constexpr int provider_port = 18767;

// Nobody listens on that port.
constexpr int closed_port = 18768;

const std::string project_id{ "project-test-1234" };
const std::string project_secret{ "secret-test-5678" };

//! The value of Authorization header for project_id:project_secret.
const std::string expected_authorization{
		"Basic cHJvamVjdC10ZXN0LTEyMzQ6c2VjcmV0LXRlc3QtNTY3OA=="
	};

//
// reply_t
//
//! The reply of the scripted provider for a path.
struct reply_t
{
	int m_status{ 200 };
	std::string m_body;
	//! Delay before sending the reply.
	std::chrono::milliseconds m_delay{ 0 };
};

//
// received_request_t
//
struct received_request_t
{
	std::string m_method;
	std::string m_path;
	std::string m_authorization;
	std::string m_body;
};

//
// scripted_provider_t
//
//! HTTP-server that imitates the identity provider API.
class scripted_provider_t
{
public:
	scripted_provider_t()
	{
		const auto handler =
				[this]( const httplib::Request & req, httplib::Response & res ) {
					handle( req, res );
				};
		m_server.Post( R"(/v1/.*)", handler );
		m_server.Get( R"(/v1/.*)", handler );

		m_thread = std::thread{ [this] {
				m_server.listen( "127.0.0.1", provider_port );
			} };

		while( !m_server.is_running() )
			std::this_thread::sleep_for( 10ms );
	}

	~scripted_provider_t()
	{
		m_server.stop();
		m_thread.join();
	}

	void
	set_reply( std::string path, reply_t reply )
	{
		std::lock_guard< std::mutex > lock{ m_lock };
		m_replies[ std::move(path) ] = std::move(reply);
	}

	[[nodiscard]]
	std::vector< received_request_t >
	requests() const
	{
		std::lock_guard< std::mutex > lock{ m_lock };
		return m_requests;
	}

private:
	httplib::Server m_server;
	std::thread m_thread;

	mutable std::mutex m_lock;
	std::map< std::string, reply_t > m_replies;
	std::vector< received_request_t > m_requests;

	void
	handle( const httplib::Request & req, httplib::Response & res )
	{
		reply_t reply{ 404, R"({"error_message":"Unknown path."})" };
		{
			std::lock_guard< std::mutex > lock{ m_lock };
			m_requests.push_back( received_request_t{
					req.method,
					req.path,
					req.get_header_value( "Authorization" ),
					req.body
				} );

			if( const auto it = m_replies.find( req.path );
					it != m_replies.end() )
				reply = it->second;
		}

		if( reply.m_delay.count() )
			std::this_thread::sleep_for( reply.m_delay );

		res.status = reply.m_status;
		res.set_content( reply.m_body, "application/json" );
	}
};

[[nodiscard]]
identity_provider_shptr_t
make_provider(
	int port = provider_port,
	std::chrono::milliseconds timeout = 2s )
{
	return make_http_provider( http_provider_params_t{
			"http://127.0.0.1:" + std::to_string( port ),
			project_id,
			project_secret,
			timeout
		} );
}

[[nodiscard]]
nlohmann::json
body_of( const received_request_t & r )
{
	return nlohmann::json::parse( r.m_body );
}

//! Run @a action and return the kind of provider_failure_t thrown.
template< typename Action >
[[nodiscard]]
std::optional< failure_kind_t >
failure_kind_of( Action && action )
{
	try
	{
		action();
	}
	catch( const provider_failure_t & x )
	{
		return x.kind();
	}

	return std::nullopt;
}

[[nodiscard]]
stepgate::phone_number::e164_phone_t
test_phone()
{
	return stepgate::phone_number::normalize_phone( "+15551234567" ).value();
}

} /* namespace anonymous */

TEST_CASE("default base URLs") {
	REQUIRE( "https://test.stytch.com"sv ==
			default_base_url( provider_environment_t::test ) );
	REQUIRE( "https://api.stytch.com"sv ==
			default_base_url( provider_environment_t::live ) );
}

TEST_CASE("magic link requests") {
	scripted_provider_t server;
	auto provider = make_provider();

	server.set_reply( "/v1/magic_links/email/login_or_create",
			reply_t{ 200, R"({"request_id":"request-id-test-1","status_code":200})" } );
	server.set_reply( "/v1/magic_links/authenticate",
			reply_t{ 200, R"({"session_token":"session-token-1",)"
					R"("user_id":"user-test-16d9ba61"})" } );

	const auto sent = provider->send_magic_link(
			"sandbox@stytch.com",
			"https://example.com/api/auth/link/consume",
			"https://example.com/api/auth/link/consume" );
	REQUIRE( "request-id-test-1" == sent.m_request_id );

	const auto session = provider->authenticate_magic_link(
			"link-token-ok", std::chrono::minutes{ 60 } );
	REQUIRE( "session-token-1" == session.m_session_token );
	REQUIRE( "user-test-16d9ba61" == session.m_subject_id );

	const auto requests = server.requests();
	REQUIRE( 2u == requests.size() );

	REQUIRE( "POST" == requests[0].m_method );
	REQUIRE( "/v1/magic_links/email/login_or_create" == requests[0].m_path );
	REQUIRE( expected_authorization == requests[0].m_authorization );
	const auto send_body = body_of( requests[0] );
	REQUIRE( "sandbox@stytch.com" == send_body.at( "email" ) );
	REQUIRE( "https://example.com/api/auth/link/consume" ==
			send_body.at( "login_magic_link_url" ) );
	REQUIRE( "https://example.com/api/auth/link/consume" ==
			send_body.at( "signup_magic_link_url" ) );

	REQUIRE( "/v1/magic_links/authenticate" == requests[1].m_path );
	REQUIRE( expected_authorization == requests[1].m_authorization );
	const auto auth_body = body_of( requests[1] );
	REQUIRE( "link-token-ok" == auth_body.at( "token" ) );
	REQUIRE( 60 == auth_body.at( "session_duration_minutes" ) );
}

TEST_CASE("one-time code sending") {
	scripted_provider_t server;
	auto provider = make_provider();

	server.set_reply( "/v1/otps/sms/send",
			reply_t{ 200, R"({"phone_id":"phone-number-test-1"})" } );
	server.set_reply( "/v1/otps/sms/login_or_create",
			reply_t{ 200, R"({"phone_id":"phone-number-test-2"})" } );

	SUBCASE("bound to the primary session") {
		const auto sent = provider->send_otp(
				test_phone(), "session-token-1"s );
		REQUIRE( "phone-number-test-1" == sent.m_challenge_id );

		const auto requests = server.requests();
		REQUIRE( 1u == requests.size() );
		REQUIRE( "/v1/otps/sms/send" == requests[0].m_path );
		REQUIRE( expected_authorization == requests[0].m_authorization );

		const auto body = body_of( requests[0] );
		REQUIRE( "+15551234567" == body.at( "phone_number" ) );
		REQUIRE( "session-token-1" == body.at( "session_token" ) );
	}

	SUBCASE("without the primary session") {
		const auto sent = provider->send_otp( test_phone(), std::nullopt );
		REQUIRE( "phone-number-test-2" == sent.m_challenge_id );

		const auto requests = server.requests();
		REQUIRE( 1u == requests.size() );
		REQUIRE( "/v1/otps/sms/login_or_create" == requests[0].m_path );

		const auto body = body_of( requests[0] );
		REQUIRE( "+15551234567" == body.at( "phone_number" ) );
		REQUIRE( !body.contains( "session_token" ) );
	}
}

TEST_CASE("one-time code authentication") {
	scripted_provider_t server;
	auto provider = make_provider();

	server.set_reply( "/v1/otps/authenticate",
			reply_t{ 200, R"({"session_jwt":"session-jwt-2",)"
					R"("session":{"user_id":"user-test-16d9ba61"}})" } );

	const auto session = provider->authenticate_otp(
			"phone-number-test-1", "123456", "session-token-1"s,
			std::chrono::minutes{ 60 } );
	REQUIRE( "session-jwt-2" == session.m_session_token );
	REQUIRE( "user-test-16d9ba61" == session.m_subject_id );

	const auto requests = server.requests();
	REQUIRE( 1u == requests.size() );
	REQUIRE( "/v1/otps/authenticate" == requests[0].m_path );

	const auto body = body_of( requests[0] );
	REQUIRE( "phone-number-test-1" == body.at( "method_id" ) );
	REQUIRE( "123456" == body.at( "code" ) );
	REQUIRE( "session-token-1" == body.at( "session_token" ) );
	REQUIRE( 60 == body.at( "session_duration_minutes" ) );
}

TEST_CASE("session description") {
	scripted_provider_t server;
	auto provider = make_provider();

	SUBCASE("contacts in the session reply") {
		server.set_reply( "/v1/sessions/authenticate",
				reply_t{ 200, R"({"user":{"user_id":"user-test-16d9ba61",)"
						R"("emails":[{"email":"sandbox@stytch.com"}],)"
						R"("phone_numbers":[{"phone_number":"+15551234567"}]}})" } );

		const auto d = provider->describe_session( "session-token-1" );
		REQUIRE( "user-test-16d9ba61" == d.m_subject_id );
		REQUIRE( "sandbox@stytch.com" == d.m_email );
		REQUIRE( "+15551234567" == d.m_phone );

		const auto requests = server.requests();
		REQUIRE( 1u == requests.size() );
		REQUIRE( "session-token-1" ==
				body_of( requests[0] ).at( "session_token" ) );
	}

	SUBCASE("contacts requested separately") {
		server.set_reply( "/v1/sessions/authenticate",
				reply_t{ 200, R"({"session":{"user_id":"user-test-16d9ba61"}})" } );
		server.set_reply( "/v1/users/user-test-16d9ba61",
				reply_t{ 200, R"({"user_id":"user-test-16d9ba61",)"
						R"("emails":[{"email":"sandbox@stytch.com"}]})" } );

		const auto d = provider->describe_session( "session-token-1" );
		REQUIRE( "user-test-16d9ba61" == d.m_subject_id );
		REQUIRE( "sandbox@stytch.com" == d.m_email );
		REQUIRE( !d.m_phone );

		const auto requests = server.requests();
		REQUIRE( 2u == requests.size() );
		REQUIRE( "GET" == requests[1].m_method );
		REQUIRE( "/v1/users/user-test-16d9ba61" == requests[1].m_path );
		REQUIRE( expected_authorization == requests[1].m_authorization );
	}
}

TEST_CASE("failures") {
	scripted_provider_t server;
	auto provider = make_provider();

	SUBCASE("4xx is a rejection") {
		server.set_reply( "/v1/otps/authenticate",
				reply_t{ 401, R"({"error_message":"The passcode is incorrect."})" } );

		try
		{
			(void)provider->authenticate_otp( "phone-number-test-1", "000000",
					std::nullopt, std::chrono::minutes{ 60 } );
			FAIL( "provider_failure_t expected" );
		}
		catch( const provider_failure_t & x )
		{
			REQUIRE( failure_kind_t::rejected == x.kind() );
			REQUIRE( "The passcode is incorrect."s == x.what() );
		}
	}

	SUBCASE("5xx means the provider is unavailable") {
		server.set_reply( "/v1/magic_links/email/login_or_create",
				reply_t{ 503, "Service Unavailable" } );

		REQUIRE( failure_kind_t::unavailable == failure_kind_of( [&] {
				(void)provider->send_magic_link( "sandbox@stytch.com",
						"https://example.com/c", "https://example.com/c" );
			} ) );
	}

	SUBCASE("no session in the reply") {
		server.set_reply( "/v1/magic_links/authenticate",
				reply_t{ 200, R"({"user_id":"user-test-16d9ba61"})" } );

		REQUIRE( failure_kind_t::no_session_issued == failure_kind_of( [&] {
				(void)provider->authenticate_magic_link(
						"link-token-ok", std::chrono::minutes{ 60 } );
			} ) );
	}

	SUBCASE("malformed reply") {
		server.set_reply( "/v1/otps/sms/send",
				reply_t{ 200, "<html>not a json</html>" } );

		REQUIRE( failure_kind_t::unavailable == failure_kind_of( [&] {
				(void)provider->send_otp( test_phone(), "session-token-1"s );
			} ) );
	}
}

TEST_CASE("timeout") {
	scripted_provider_t server;
	auto provider = make_provider( provider_port, 300ms );

	server.set_reply( "/v1/otps/sms/send",
			reply_t{ 200, R"({"phone_id":"phone-number-test-1"})", 1500ms } );

	const auto started_at = std::chrono::steady_clock::now();
	REQUIRE( failure_kind_t::unavailable == failure_kind_of( [&] {
			(void)provider->send_otp( test_phone(), "session-token-1"s );
		} ) );

	// There are no retries and no waiting for the late reply.
	REQUIRE( std::chrono::steady_clock::now() - started_at < 1400ms );
	REQUIRE( 1u == server.requests().size() );
}

TEST_CASE("provider can't be reached") {
	auto provider = make_provider( closed_port, 500ms );

	REQUIRE( failure_kind_t::unavailable == failure_kind_of( [&] {
			(void)provider->authenticate_magic_link(
					"link-token-ok", std::chrono::minutes{ 60 } );
		} ) );
}
