/*!
 * @file
 * @brief The public interface of HTTP-entry.
 */

#include <stepgate/http_entry/pub.hpp>
#include <stepgate/http_entry/helpers.hpp>

#include <stepgate/phone_number/pub.hpp>

#include <stepgate/logging/wrap_logging.hpp>

#include <stepgate/utils/overloaded.hpp>

#include <restinio/sync_chain/fixed_size.hpp>
#include <restinio/all.hpp>

#include <restinio/helpers/http_field_parsers/content-type.hpp>
#include <restinio/helpers/http_field_parsers/try_parse_field.hpp>

#include <nlohmann/json.hpp>

#include <fmt/format.h>

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <system_error>

namespace stepgate::http_entry
{

//
// running_entry_instance_t
//
running_entry_instance_t::~running_entry_instance_t()
{}

namespace impl
{

namespace ao = ::stepgate::auth_orchestrator;
namespace cs = ::stepgate::cookie_store;

//! Prefix for all authentication API entry-points.
constexpr std::string_view api_auth_prefix{ "/api/auth/" };

//! Prefix for all API entry-points.
constexpr std::string_view api_prefix{ "/api/" };

[[nodiscard]]
bool
starts_with( std::string_view what, std::string_view prefix ) noexcept
{
	return what.substr( 0u, prefix.size() ) == prefix;
}

[[nodiscard]]
std::string_view
cookie_header_of( const restinio::request_handle_t & req )
{
	const auto v = req->header().opt_value_of( "Cookie" );
	return v ? *v : std::string_view{};
}

//
// make_route_gate_checker
//
/*!
 * @brief A factory for handler that redirects requests to protected
 * paths without a valid step-up credential.
 */
[[nodiscard]]
auto
make_route_gate_checker(
	const route_gate::route_gate_t & gate )
{
	return [&gate]( const auto & req ) -> restinio::request_handling_status_t
	{
		return std::visit( ::stepgate::utils::overloaded{
				[]( const route_gate::pass_t & ) {
					// Allow to work to the next handler.
					return restinio::request_not_handled();
				},
				[&req]( const route_gate::redirect_t & r ) {
					return reply_redirect( req, r.m_location );
				}
			},
			gate.check( req->header().path(), cookie_header_of( req ) ) );
	};
}

//
// make_content_type_checker
//
/*!
 * @brief A factory for handler that checks the presence and the
 * value of Content-Type for POST requests to authentication API.
 */
[[nodiscard]]
auto
make_content_type_checker()
{
	return []( const auto & req ) -> restinio::request_handling_status_t
	{
		if( restinio::http_method_post() == req->header().method() &&
				starts_with( req->header().path(), api_auth_prefix ) )
		{
			using namespace restinio::http_field_parsers;

			const auto parse_result = try_parse_field< content_type_value_t >(
					*req, restinio::http_field::content_type );
			const auto * ct_val = std::get_if< content_type_value_t >(
					&parse_result );

			// Wait the content only in application/json format.
			if( !ct_val || !("application" == ct_val->media_type.type &&
					"json" == ct_val->media_type.subtype) )
			{
				return reply_json( req, 400u,
						nlohmann::json{
							{ "ok", false },
							{ "error", "Content is expected in "
									"application/json format" }
						} );
			}
		}

		// There is no problem. Go to the next handler.
		return restinio::request_not_handled();
	};
}

//
// mime_type_for
//
//! Detect Content-Type for a static file by its extension.
[[nodiscard]]
std::string_view
mime_type_for( const std::filesystem::path & file )
{
	using item_t = std::pair< std::string_view, std::string_view >;
	static constexpr std::array< item_t, 10 > known{
		item_t{ ".html", "text/html; charset=utf-8" },
		item_t{ ".htm", "text/html; charset=utf-8" },
		item_t{ ".css", "text/css; charset=utf-8" },
		item_t{ ".js", "text/javascript; charset=utf-8" },
		item_t{ ".json", "application/json" },
		item_t{ ".txt", "text/plain; charset=utf-8" },
		item_t{ ".svg", "image/svg+xml" },
		item_t{ ".png", "image/png" },
		item_t{ ".jpg", "image/jpeg" },
		item_t{ ".ico", "image/x-icon" }
	};

	const auto ext = file.extension().string();
	for( const auto & [e, type] : known )
		if( e == ext )
			return type;

	return "application/octet-stream";
}

//
// optional_string_field
//
//! Get a string field from a JSON object.
[[nodiscard]]
std::optional< std::string >
optional_string_field(
	const nlohmann::json & object,
	const char * name )
{
	const auto it = object.find( name );
	if( it == object.end() || !it->is_string() )
		return std::nullopt;

	return it->get< std::string >();
}

//
// code_field
//
/*!
 * @brief Get the one-time code from a JSON object.
 *
 * Clients can send the code as a string or as a number. A number is
 * converted to its decimal form. Values of other types are returned
 * in the serialized form and then rejected as malformed codes.
 */
[[nodiscard]]
std::optional< std::string >
code_field( const nlohmann::json & object )
{
	const auto it = object.find( "code" );
	if( it == object.end() || it->is_null() )
		return std::nullopt;

	if( it->is_string() )
		return it->get< std::string >();
	if( it->is_number_unsigned() )
		return std::to_string( it->get< std::uint64_t >() );
	if( it->is_number_integer() )
		return std::to_string( it->get< std::int64_t >() );

	return it->dump();
}

//
// request_processor_t
//
/*!
 * @brief Type of object for handling incoming requests.
 */
class request_processor_t
{
public:
	request_processor_t(
		ao::orchestrator_t & orchestrator,
		std::filesystem::path content_root,
		cs::transport_attributes_t cookie_attributes );

	[[nodiscard]]
	restinio::request_handling_status_t
	on_request( restinio::request_handle_t req );

private:
	//! The actual implementation of authentication steps.
	ao::orchestrator_t & m_orchestrator;

	//! The directory with static content.
	const std::filesystem::path m_content_root;

	//! Attributes for cookies to be set.
	const cs::transport_attributes_t m_cookie_attributes;

	[[nodiscard]]
	cs::cookie_store_t
	make_cookie_store( const restinio::request_handle_t & req ) const
	{
		return { cookie_header_of( req ), m_cookie_attributes };
	}

	//! The handler for a request for a magic link.
	[[nodiscard]]
	restinio::request_handling_status_t
	on_link_request(
		const restinio::request_handle_t & req ) const;

	//! The handler for a click on a magic link.
	[[nodiscard]]
	restinio::request_handling_status_t
	on_link_consume(
		const restinio::request_handle_t & req ) const;

	//! The handler for a request for a one-time code.
	[[nodiscard]]
	restinio::request_handling_status_t
	on_otp_request(
		const restinio::request_handle_t & req ) const;

	//! The handler for a one-time code entered by a user.
	[[nodiscard]]
	restinio::request_handling_status_t
	on_otp_consume(
		const restinio::request_handle_t & req ) const;

	//! The handler for a request for the current identity.
	[[nodiscard]]
	restinio::request_handling_status_t
	on_me(
		const restinio::request_handle_t & req ) const;

	//! The handler for static content.
	[[nodiscard]]
	restinio::request_handling_status_t
	on_static_content(
		const restinio::request_handle_t & req ) const;

	//! Parse the body of a POST request as JSON object.
	/*!
	 * @return empty optional if the body isn't a JSON object.
	 */
	[[nodiscard]]
	static std::optional< nlohmann::json >
	parse_json_body( const restinio::request_handle_t & req );

	[[nodiscard]]
	static restinio::request_handling_status_t
	reply_invalid_json( const restinio::request_handle_t & req );

	[[nodiscard]]
	static restinio::request_handling_status_t
	reply_failure(
		const restinio::request_handle_t & req,
		const ao::failure_t & failure,
		const cs::cookie_store_t & cookies );
};

request_processor_t::request_processor_t(
	ao::orchestrator_t & orchestrator,
	std::filesystem::path content_root,
	cs::transport_attributes_t cookie_attributes )
	:	m_orchestrator{ orchestrator }
	,	m_content_root{ std::move(content_root) }
	,	m_cookie_attributes{ std::move(cookie_attributes) }
{}

restinio::request_handling_status_t
request_processor_t::on_request( restinio::request_handle_t req )
{
	const auto method = req->header().method();
	const auto path = req->header().path();

	::stepgate::logging::direct_mode::debug(
			[&]( auto & logger, auto level )
			{
				logger.log( level, "http_entry: {} {}",
						method.c_str(), path );
			} );

	return envelope_request_handling(
			"http_entry::request_processor_t::on_request",
			req,
			[&]() -> restinio::request_handling_status_t
			{
				if( restinio::http_method_post() == method &&
						path == entry_point_link_request )
					return on_link_request( req );

				if( restinio::http_method_get() == method &&
						path == entry_point_link_consume )
					return on_link_consume( req );

				if( restinio::http_method_post() == method &&
						path == entry_point_otp_request )
					return on_otp_request( req );

				if( restinio::http_method_post() == method &&
						path == entry_point_otp_consume )
					return on_otp_consume( req );

				if( restinio::http_method_get() == method &&
						path == entry_point_me )
					return on_me( req );

				if( starts_with( path, api_prefix ) )
					return reply_json( req, 404u,
							nlohmann::json{
								{ "ok", false }, { "error", "Not found" } } );

				if( restinio::http_method_get() == method )
					return on_static_content( req );

				return req->create_response(
							restinio::status_method_not_allowed() )
						.append_header_date_field()
						.done();
			} );
}

restinio::request_handling_status_t
request_processor_t::on_link_request(
	const restinio::request_handle_t & req ) const
{
	const auto body = parse_json_body( req );
	if( !body )
		return reply_invalid_json( req );

	const auto email = optional_string_field( *body, "email" );
	const auto phone = optional_string_field( *body, "phone" );

	auto result = m_orchestrator.request_magic_link(
			email ? std::string_view{ *email } : std::string_view{},
			phone );

	// No cookies are changed by this step.
	const auto cookies = make_cookie_store( req );

	return std::visit( ::stepgate::utils::overloaded{
			[&]( const ao::failure_t & f ) {
				return reply_failure( req, f, cookies );
			},
			[&]( const ao::link_requested_t & r ) {
				return reply_json( req, 200u,
						nlohmann::json{
							{ "ok", true },
							{ "request_id", r.m_request_id }
						} );
			}
		},
		result );
}

restinio::request_handling_status_t
request_processor_t::on_link_consume(
	const restinio::request_handle_t & req ) const
{
	std::optional< std::string > token;
	try
	{
		const auto qp = restinio::parse_query<
					restinio::parse_query_traits::javascript_compatible >(
				req->header().query() );
		if( qp.has( "token" ) )
			token = restinio::cast_to< std::string >( qp[ "token" ] );
	}
	catch( const std::exception & x )
	{
		// The token will be treated as missing.
		::stepgate::logging::direct_mode::debug(
				[&]( auto & logger, auto level )
				{
					logger.log( level, "http_entry: unable to parse query "
							"string: {}", x.what() );
				} );
	}

	auto cookies = make_cookie_store( req );
	const auto redirect = m_orchestrator.consume_magic_link( token, cookies );

	return reply_redirect( req, redirect.m_location, &cookies );
}

restinio::request_handling_status_t
request_processor_t::on_otp_request(
	const restinio::request_handle_t & req ) const
{
	const auto body = parse_json_body( req );
	if( !body )
		return reply_invalid_json( req );

	const auto raw_phone = optional_string_field( *body, "phone" );
	const auto phone = raw_phone ?
			phone_number::normalize_phone( *raw_phone ) :
			std::optional< phone_number::e164_phone_t >{};

	auto cookies = make_cookie_store( req );
	const auto result = m_orchestrator.request_otp( phone, cookies );

	return std::visit( ::stepgate::utils::overloaded{
			[&]( const ao::failure_t & f ) {
				return reply_failure( req, f, cookies );
			},
			[&]( const ao::otp_requested_t & ) {
				return reply_json( req, 200u,
						nlohmann::json{ { "ok", true } },
						&cookies );
			}
		},
		result );
}

restinio::request_handling_status_t
request_processor_t::on_otp_consume(
	const restinio::request_handle_t & req ) const
{
	const auto body = parse_json_body( req );
	if( !body )
		return reply_invalid_json( req );

	const auto code = code_field( *body );

	auto cookies = make_cookie_store( req );
	const auto result = m_orchestrator.consume_otp(
			code ? std::string_view{ *code } : std::string_view{},
			cookies );

	return std::visit( ::stepgate::utils::overloaded{
			[&]( const ao::failure_t & f ) {
				return reply_failure( req, f, cookies );
			},
			[&]( const ao::step_up_completed_t & ) {
				return reply_json( req, 200u,
						nlohmann::json{ { "ok", true } },
						&cookies );
			}
		},
		result );
}

restinio::request_handling_status_t
request_processor_t::on_me(
	const restinio::request_handle_t & req ) const
{
	const auto identity = m_orchestrator.describe_identity(
			make_cookie_store( req ) );

	const auto to_json = []( const std::optional< std::string > & v ) {
		return v ? nlohmann::json( *v ) : nlohmann::json( nullptr );
	};

	return reply_json( req, 200u,
			nlohmann::json{
				{ "email", to_json( identity.m_email ) },
				{ "phone", to_json( identity.m_phone ) },
				{ "state", std::string{ ao::to_string_view( identity.m_state ) } }
			} );
}

restinio::request_handling_status_t
request_processor_t::on_static_content(
	const restinio::request_handle_t & req ) const
{
	const auto not_found = [&req] {
		return req->create_response( restinio::status_not_found() )
				.append_header_date_field()
				.done();
	};

	// The normalized path has no '..' segments, so the result is
	// always inside the content root.
	const auto path = route_gate::normalize_path( req->header().path() );
	if( !path )
		return not_found();

	std::string relative = path->substr( 1u );
	if( relative.empty() || '/' == relative.back() )
		relative += "index.html";

	auto file = m_content_root / relative;

	std::error_code ec;
	if( !std::filesystem::is_regular_file( file, ec ) )
	{
		// Pages like "/mfa" are stored as "mfa.html".
		file = m_content_root / (relative + ".html");
		if( !std::filesystem::is_regular_file( file, ec ) )
			return not_found();
	}

	return req->create_response()
			.append_header_date_field()
			.append_header( restinio::http_field::content_type,
					mime_type_for( file ) )
			.set_body( restinio::sendfile( file.string() ) )
			.done();
}

[[nodiscard]]
std::optional< nlohmann::json >
request_processor_t::parse_json_body( const restinio::request_handle_t & req )
{
	auto parsed = nlohmann::json::parse( req->body(), nullptr, false );
	if( parsed.is_discarded() || !parsed.is_object() )
		return std::nullopt;

	return parsed;
}

[[nodiscard]]
restinio::request_handling_status_t
request_processor_t::reply_invalid_json( const restinio::request_handle_t & req )
{
	return reply_json( req, 400u,
			nlohmann::json{ { "ok", false }, { "error", "Invalid JSON" } } );
}

[[nodiscard]]
restinio::request_handling_status_t
request_processor_t::reply_failure(
	const restinio::request_handle_t & req,
	const ao::failure_t & failure,
	const cs::cookie_store_t & cookies )
{
	::stepgate::logging::direct_mode::debug(
			[&]( auto & logger, auto level )
			{
				logger.log( level, "http_entry: {} failed: {}",
						req->header().path(), failure );
			} );

	return reply_json( req, ao::http_status_code( failure.m_reason ),
			nlohmann::json{ { "ok", false }, { "error", failure.m_message } },
			&cookies );
}

//
// server_traits_t
//
struct server_traits_t : public restinio::default_traits_t
{
	// There are only three handlers in the chain:
	// - the route gate;
	// - checks for content-type for POST-requests;
	// - actual handling.
	using request_handler_t = restinio::sync_chain::fixed_size_chain_t<3>;
};

//
// actual_running_entry_instance_t
//
class actual_running_entry_instance_t
	:	public running_entry_instance_t
{
public:
	using server_handle_t =
			restinio::running_server_handle_t< server_traits_t >;

	actual_running_entry_instance_t(
		server_handle_t h_server )
		:	m_server{ std::move(h_server) }
	{}

	void
	stop() override
	{
		m_server->stop();
	}

private:
	//! A handle of the running RESTinio-server.
	server_handle_t m_server;
};

} /* namespace impl */

//
// start_entry
//
[[nodiscard]]
running_entry_handle_t
start_entry(
	entry_params_t params,
	auth_orchestrator::orchestrator_t & orchestrator,
	const route_gate::route_gate_t & gate )
{
	auto processor = std::make_shared< impl::request_processor_t >(
			orchestrator,
			params.m_content_root,
			params.m_cookie_attributes );

	auto server = restinio::run_async(
			restinio::own_io_context(),
			restinio::server_settings_t< impl::server_traits_t >{}
				.address( params.m_ip )
				.port( params.m_port )
				.request_handler(
					// The first handler checks access to protected paths.
					impl::make_route_gate_checker( gate ),
					// The next handler checks Content-Type for POST-requests.
					impl::make_content_type_checker(),
					// The next handler does the actual processing.
					[handler = std::move(processor)]( auto req ) {
						return handler->on_request( std::move(req) );
					} ),
			params.m_worker_threads );

	::stepgate::logging::direct_mode::info(
			[&]( auto & logger, auto level )
			{
				logger.log( level, "http_entry: started on {}:{}, "
						"content_root={}",
						params.m_ip.to_string(),
						params.m_port,
						params.m_content_root.string() );
			} );

	return std::make_unique< impl::actual_running_entry_instance_t >(
			std::move(server) );
}

} /* namespace stepgate::http_entry */
