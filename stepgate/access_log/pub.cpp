/*!
 * @file
 * @brief The public interface of access_log.
 */

#include <stepgate/access_log/pub.hpp>

#include <nlohmann/json.hpp>

namespace stepgate::access_log
{

[[nodiscard]]
std::string_view
to_string_view( event_kind_t kind ) noexcept
{
	switch( kind )
	{
		case event_kind_t::access_requested:
			return "access_requested";
		case event_kind_t::primary_factor_completed:
			return "primary_factor_completed";
		case event_kind_t::second_factor_requested:
			return "second_factor_requested";
		case event_kind_t::second_factor_completed:
			return "second_factor_completed";
	}

	return "unknown";
}

//
// sink_t
//
sink_t::~sink_t()
{}

[[nodiscard]]
std::string
make_event_json(
	event_kind_t kind,
	const fields_t & fields,
	std::chrono::system_clock::time_point timestamp )
{
	const auto seconds = std::chrono::duration_cast< std::chrono::seconds >(
			timestamp.time_since_epoch() ).count();

	const nlohmann::json event{
			{ "event", std::string{ to_string_view( kind ) } },
			{ "timestamp", seconds },
			{ "fields", fields }
		};

	return event.dump();
}

} /* namespace stepgate::access_log */
