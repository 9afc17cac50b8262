/*!
 * @file
 * @brief Various helpers for working with HTTP-entry.
 */

#pragma once

#include <stepgate/cookie_store/pub.hpp>

#include <stepgate/logging/wrap_logging.hpp>

#include <restinio/all.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <exception>
#include <string_view>

namespace stepgate::http_entry
{

//! Get the status-line for a status code used by stepgate.
[[nodiscard]]
inline restinio::http_status_line_t
status_line_for( std::uint16_t code )
{
	switch( code )
	{
		case 200u: return restinio::status_ok();
		case 400u: return restinio::status_bad_request();
		case 404u: return restinio::status_not_found();
		case 405u: return restinio::status_method_not_allowed();
		default: break;
	}

	return restinio::status_internal_server_error();
}

//! Add Set-Cookie headers to a response.
template< typename Response_Builder >
Response_Builder &
append_set_cookies(
	Response_Builder & resp,
	const cookie_store::cookie_store_t & cookies )
{
	for( const auto & c : cookies.outgoing() )
		resp.append_header(
				"Set-Cookie",
				c.to_header_value() );

	return resp;
}

/*!
 * @brief Send a JSON response.
 *
 * Responses with JSON are never cached.
 */
inline restinio::request_handling_status_t
reply_json(
	const restinio::request_handle_t & req,
	std::uint16_t status_code,
	const nlohmann::json & body,
	const cookie_store::cookie_store_t * cookies = nullptr )
{
	auto resp = req->create_response( status_line_for( status_code ) );
	resp.append_header_date_field()
		.append_header( restinio::http_field::content_type,
				"application/json" )
		.append_header( restinio::http_field::cache_control, "no-store" );

	if( cookies )
		append_set_cookies( resp, *cookies );

	return resp.set_body( body.dump() ).done();
}

//! Send a redirect.
inline restinio::request_handling_status_t
reply_redirect(
	const restinio::request_handle_t & req,
	const std::string & location,
	const cookie_store::cookie_store_t * cookies = nullptr )
{
	auto resp = req->create_response( restinio::status_found() );
	resp.append_header_date_field()
		.append_header( restinio::http_field::location, location )
		.append_header( restinio::http_field::cache_control, "no-store" );

	if( cookies )
		append_set_cookies( resp, *cookies );

	return resp.done();
}

/*!
 * @brief Helper function for processing of a request with
 * protection from exceptions.
 *
 * If @a lambda throws then the exception is logged and a negative
 * response without details is sent back.
 *
 * @tparam Lambda Type of lambda-function (functor). That lambda-function
 * should have the following format:
 * @code
 * restinio::request_handling_status_t lambda();
 * @endcode
 */
template< typename Lambda >
restinio::request_handling_status_t
envelope_request_handling(
	//! The description of the context where the processing is initiated.
	//! That description will be used for logging.
	std::string_view context_description,
	//! The incoming request.
	const restinio::request_handle_t & req,
	//! Lambda-function for actual request processing.
	Lambda && lambda )
{
	try
	{
		return lambda();
	}
	catch( const std::exception & x )
	{
		::stepgate::logging::direct_mode::err(
				[&]( auto & logger, auto level )
				{
					logger.log( level, "{}: exception caught: {}",
							context_description, x.what() );
				} );
	}

	// Raw descriptions of exceptions are never sent to the client.
	return reply_json( req, 500u,
			nlohmann::json{ { "ok", false }, { "error", "Internal error" } } );
}

} /* namespace stepgate::http_entry */
