/*!
 * @file
 * @brief The public interface of identity provider.
 */

#include <stepgate/identity_provider/pub.hpp>

namespace stepgate::identity_provider
{

[[nodiscard]]
std::string_view
to_string_view( failure_kind_t kind ) noexcept
{
	switch( kind )
	{
		case failure_kind_t::rejected: return "rejected";
		case failure_kind_t::unavailable: return "unavailable";
		case failure_kind_t::no_session_issued: return "no_session_issued";
	}

	return "unknown";
}

std::ostream &
operator<<( std::ostream & to, failure_kind_t kind )
{
	return (to << to_string_view( kind ));
}

//
// provider_failure_t
//
provider_failure_t::provider_failure_t(
	failure_kind_t kind,
	const std::string & user_safe_message )
	:	exception_t{ user_safe_message }
	,	m_kind{ kind }
{}

//
// identity_provider_t
//
identity_provider_t::~identity_provider_t()
{}

} /* namespace stepgate::identity_provider */
