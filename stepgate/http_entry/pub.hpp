/*!
 * @file
 * @brief The public interface of HTTP-entry.
 */

#pragma once

#include <stepgate/auth_orchestrator/pub.hpp>
#include <stepgate/cookie_store/pub.hpp>
#include <stepgate/route_gate/pub.hpp>

#include <asio/ip/address.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>

namespace stepgate::http_entry
{

//
// running_entry_instance_t
//
/*!
 * @brief Interface of an object for stopping the running HTTP-entry.
 */
class running_entry_instance_t
{
public:
	virtual ~running_entry_instance_t();

	//! Sends 'stop' command to HTTP-entry.
	virtual void
	stop() = 0;
};

//
// running_entry_handle_t
//
//! Alias for unique_ptr to running_entry_instance.
using running_entry_handle_t = std::unique_ptr< running_entry_instance_t >;

//
// entry_params_t
//
/*!
 * @brief Parameters for HTTP-entry.
 */
struct entry_params_t
{
	//! IP-address for the HTTP-entry.
	asio::ip::address m_ip;
	//! TCP-port for the HTTP-entry.
	std::uint16_t m_port;
	//! Count of worker threads.
	std::size_t m_worker_threads{ 2u };
	//! The directory with static content.
	std::filesystem::path m_content_root;
	//! Deployment-specific attributes of cookies.
	cookie_store::transport_attributes_t m_cookie_attributes;
};

// Names of API entry-points.
inline constexpr std::string_view entry_point_link_request{
		"/api/auth/link/request" };
inline constexpr std::string_view entry_point_link_consume{
		"/api/auth/link/consume" };
inline constexpr std::string_view entry_point_otp_request{
		"/api/auth/otp/request" };
inline constexpr std::string_view entry_point_otp_consume{
		"/api/auth/otp/consume" };
inline constexpr std::string_view entry_point_me{ "/api/auth/me" };

//
// start_entry
//
/*!
 * @brief Function for launching of the HTTP-entry.
 *
 * Every request goes through the route gate first. Then API requests
 * are handled by @a orchestrator and all other GET requests are served
 * from the content root.
 *
 * Returns an actual running_entry_handle_t or throws an exception.
 */
[[nodiscard]]
running_entry_handle_t
start_entry(
	//! Parameters for the entry.
	entry_params_t params,
	//! The orchestrator for authentication requests.
	//! This reference is guaranteed to be valid for the whole lifetime
	//! of the HTTP-entry.
	auth_orchestrator::orchestrator_t & orchestrator,
	//! The guard for protected paths.
	//! This reference is guaranteed to be valid for the whole lifetime
	//! of the HTTP-entry.
	const route_gate::route_gate_t & gate );

} /* namespace stepgate::http_entry */
