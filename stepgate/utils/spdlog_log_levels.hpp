/*!
 * @file
 * @brief Helpers for working with spdlog's severity levels.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace stepgate::utils
{

namespace spdlog_levels_details
{

using level_name_t = std::pair< std::string_view, spdlog::level::level_enum >;

// Names are the same as in the config file and on the command line.
inline constexpr std::array< level_name_t, 7 > known_levels{
	level_name_t{ "trace", spdlog::level::trace },
	level_name_t{ "debug", spdlog::level::debug },
	level_name_t{ "info", spdlog::level::info },
	level_name_t{ "warn", spdlog::level::warn },
	level_name_t{ "error", spdlog::level::err },
	level_name_t{ "crit", spdlog::level::critical },
	level_name_t{ "off", spdlog::level::off }
};

} /* namespace spdlog_levels_details */

[[nodiscard]]
inline std::optional< spdlog::level::level_enum >
name_to_spdlog_level_enum( std::string_view name ) noexcept
{
	for( const auto & [n, level] : spdlog_levels_details::known_levels )
		if( n == name )
			return level;

	return std::nullopt;
}

} /* namespace stepgate::utils */
