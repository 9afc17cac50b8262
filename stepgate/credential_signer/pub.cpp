/*!
 * @file
 * @brief Implementation of step-up credential signer.
 */

#include <stepgate/credential_signer/pub.hpp>

#include <stepgate/utils/overloaded.hpp>

#include <jwt-cpp/jwt.h>

#include <fmt/format.h>

namespace stepgate::credential_signer
{

namespace
{

[[nodiscard]]
std::int64_t
to_unix_seconds( clock_type::time_point tp ) noexcept
{
	return std::chrono::duration_cast< std::chrono::seconds >(
			tp.time_since_epoch() ).count();
}

//
// fixed_clock_t
//
//! Clock for jwt::verifier that always returns the specified time.
struct fixed_clock_t
{
	jwt::date m_now;

	[[nodiscard]]
	jwt::date
	now() const { return m_now; }
};

//! Name of the claim with the second factor flag.
constexpr char mfa_claim_name[] = "mfa";

} /* anonymous namespace */

//
// signing_secret_t
//
signing_secret_t::signing_secret_t( std::string bytes )
	:	m_bytes{ std::move(bytes) }
{
	if( m_bytes.size() < min_length )
		throw exception_t{
				fmt::format( "signing secret is too short: {} bytes, "
						"at least {} bytes are required",
						m_bytes.size(), min_length )
			};
}

std::ostream &
operator<<( std::ostream & to, const verification_result_t & v )
{
	std::visit( ::stepgate::utils::overloaded{
			[&to]( const invalid_credential_t & ) {
				to << "(invalid)";
			},
			[&to]( const claims_t & claims ) {
				to << "(valid: sub=" << claims.m_subject_id
						<< ", mfa=" << std::boolalpha
						<< claims.m_second_factor_satisfied
						<< ", exp=" << to_unix_seconds( claims.m_expires_at )
						<< ")";
			}
		},
		v );

	return to;
}

//
// credential_signer_t
//
credential_signer_t::credential_signer_t( signing_secret_t secret )
	:	m_secret{ std::move(secret) }
{}

[[nodiscard]]
std::string
credential_signer_t::issue(
	std::string_view subject_id,
	bool second_factor_satisfied,
	std::chrono::seconds ttl,
	clock_type::time_point now ) const
{
	if( subject_id.empty() )
		throw exception_t{ "credential can't be issued for empty subject" };
	if( ttl <= std::chrono::seconds::zero() )
		throw exception_t{ "credential ttl should be positive" };

	const jwt::date issued_at =
			std::chrono::time_point_cast< std::chrono::seconds >( now );

	return jwt::create()
			.set_type( "JWT" )
			.set_subject( std::string{ subject_id } )
			.set_payload_claim( mfa_claim_name,
					jwt::claim( picojson::value( second_factor_satisfied ) ) )
			.set_issued_at( issued_at )
			.set_expires_at( issued_at + ttl )
			.sign( jwt::algorithm::hs256{ m_secret.bytes() } );
}

[[nodiscard]]
verification_result_t
credential_signer_t::verify(
	std::string_view credential,
	clock_type::time_point now ) const
{
	// jwt-cpp reports every problem (malformed token, wrong algorithm,
	// bad signature, expired token, missing claim) by an exception.
	// All of them mean the same invalid credential for a caller.
	try
	{
		const auto decoded = jwt::decode( std::string{ credential } );

		jwt::verify< fixed_clock_t, jwt::traits::kazuho_picojson >(
					fixed_clock_t{ now } )
				.allow_algorithm( jwt::algorithm::hs256{ m_secret.bytes() } )
				.verify( decoded );

		claims_t claims{
				decoded.get_subject(),
				decoded.get_payload_claim( mfa_claim_name ).as_bool(),
				decoded.get_issued_at(),
				decoded.get_expires_at()
			};

		if( claims.m_subject_id.empty() ||
				claims.m_expires_at <= claims.m_issued_at )
			return invalid_credential_t{};

		// jwt-cpp accepts a token at the exact expiry time, but
		// the credential is valid only strictly before it.
		if( to_unix_seconds( now ) >= to_unix_seconds( claims.m_expires_at ) )
			return invalid_credential_t{};

		return claims;
	}
	catch( const std::exception & )
	{
		return invalid_credential_t{};
	}
}

} /* namespace stepgate::credential_signer */
