/*!
 * @file
 * @brief The public interface of startup_manager-agent.
 */

#pragma once

#include <stepgate/config.hpp>

#include <so_5/all.hpp>

#include <asio/ip/address.hpp>

namespace stepgate::startup_manager
{

//
// params_t
//
/*!
 * @brief Initial parameters for startup_manager-agent.
 */
struct params_t
{
	//! The configuration loaded at the start.
	config_t m_config;

	//! IP-address of HTTP-entry.
	asio::ip::address m_http_ip;
	//! TCP-port of HTTP-entry.
	std::uint16_t m_http_port;
};

//
// introduce_startup_manager
//
/*!
 * @brief A factory for creation and launching a new startup_manager-agent.
 */
void
introduce_startup_manager(
	so_5::environment_t & env,
	params_t params );

} /* namespace stepgate::startup_manager */
