#pragma once

#include <stepgate/identity_provider/pub.hpp>
#include <stepgate/access_log/pub.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fake_identity_provider
{

//
// behavior_t
//
//! What the fake provider should do.
struct behavior_t
{
	//! The magic link token accepted by the provider.
	std::string m_valid_link_token{ "link-token-ok" };

	//! The one-time code accepted by the provider.
	std::string m_valid_code{ "123456" };

	//! Session token issued for a magic link.
	std::string m_link_session_token{ "session-token-1" };

	//! Session token issued for a one-time code.
	std::string m_otp_session_token{ "session-token-2" };

	//! The ID of a user.
	std::string m_subject_id{ "user-test-16d9ba61" };

	//! The ID of a new OTP challenge.
	std::string m_challenge_id{ "phone-number-test-1" };

	//! If set then every call fails with that kind.
	std::optional< stepgate::identity_provider::failure_kind_t > m_fail_with;

	//! Should authenticate calls return a response without a session?
	bool m_no_session{ false };

	//! Email and phone returned by describe_session.
	std::optional< std::string > m_email{ "sandbox@stytch.com" };
	std::optional< std::string > m_phone{ "+15551234567" };
};

//
// call_t
//
//! Description of a call to the fake provider.
struct call_t
{
	std::string m_method;
	std::vector< std::string > m_args;
	std::optional< std::string > m_existing_session;
};

//
// provider_t
//
class provider_t final
	:	public stepgate::identity_provider::identity_provider_t
{
public:
	explicit provider_t( behavior_t behavior = behavior_t{} )
		:	m_behavior{ std::move(behavior) }
	{}

	stepgate::identity_provider::magic_link_sent_t
	send_magic_link(
		std::string_view email,
		std::string_view login_redirect_url,
		std::string_view signup_redirect_url ) override
	{
		store_call( call_t{ "send_magic_link",
				{ std::string{ email },
					std::string{ login_redirect_url },
					std::string{ signup_redirect_url } },
				std::nullopt } );
		fail_if_needed();

		return { "request-id-test-1" };
	}

	stepgate::identity_provider::session_issued_t
	authenticate_magic_link(
		std::string_view token,
		std::chrono::minutes session_ttl ) override
	{
		store_call( call_t{ "authenticate_magic_link",
				{ std::string{ token }, std::to_string( session_ttl.count() ) },
				std::nullopt } );
		fail_if_needed();

		if( token != m_behavior.m_valid_link_token )
			throw stepgate::identity_provider::provider_failure_t{
					stepgate::identity_provider::failure_kind_t::rejected,
					"Magic link is expired or already used"
				};

		return issue_session( m_behavior.m_link_session_token );
	}

	stepgate::identity_provider::otp_sent_t
	send_otp(
		const stepgate::phone_number::e164_phone_t & phone,
		const std::optional< std::string > & existing_session ) override
	{
		store_call( call_t{ "send_otp", { phone.value() }, existing_session } );
		fail_if_needed();

		return { m_behavior.m_challenge_id };
	}

	stepgate::identity_provider::session_issued_t
	authenticate_otp(
		std::string_view challenge_id,
		std::string_view code,
		const std::optional< std::string > & existing_session,
		std::chrono::minutes session_ttl ) override
	{
		store_call( call_t{ "authenticate_otp",
				{ std::string{ challenge_id }, std::string{ code },
					std::to_string( session_ttl.count() ) },
				existing_session } );
		fail_if_needed();

		if( challenge_id != m_behavior.m_challenge_id ||
				code != m_behavior.m_valid_code )
			throw stepgate::identity_provider::provider_failure_t{
					stepgate::identity_provider::failure_kind_t::rejected,
					"The passcode is incorrect."
				};

		return issue_session( m_behavior.m_otp_session_token );
	}

	stepgate::identity_provider::session_description_t
	describe_session(
		std::string_view session_token ) override
	{
		store_call( call_t{ "describe_session",
				{ std::string{ session_token } }, std::nullopt } );
		fail_if_needed();

		return { m_behavior.m_subject_id, m_behavior.m_email, m_behavior.m_phone };
	}

	[[nodiscard]]
	std::vector< call_t >
	calls() const
	{
		std::lock_guard< std::mutex > lock{ m_lock };
		return m_calls;
	}

	[[nodiscard]]
	std::size_t
	calls_count() const
	{
		std::lock_guard< std::mutex > lock{ m_lock };
		return m_calls.size();
	}

	void
	change_behavior( behavior_t behavior )
	{
		std::lock_guard< std::mutex > lock{ m_lock };
		m_behavior = std::move(behavior);
	}

private:
	mutable std::mutex m_lock;
	behavior_t m_behavior;
	std::vector< call_t > m_calls;

	void
	store_call( call_t call )
	{
		std::lock_guard< std::mutex > lock{ m_lock };
		m_calls.push_back( std::move(call) );
	}

	void
	fail_if_needed() const
	{
		if( m_behavior.m_fail_with )
			throw stepgate::identity_provider::provider_failure_t{
					*m_behavior.m_fail_with,
					"Identity provider is unavailable"
				};
	}

	[[nodiscard]]
	stepgate::identity_provider::session_issued_t
	issue_session( const std::string & token ) const
	{
		if( m_behavior.m_no_session )
			throw stepgate::identity_provider::provider_failure_t{
					stepgate::identity_provider::failure_kind_t::no_session_issued,
					"No session was issued by identity provider"
				};

		return { token, m_behavior.m_subject_id };
	}
};

//
// sink_t
//
//! Access log sink that collects all events.
class sink_t final : public stepgate::access_log::sink_t
{
public:
	using event_t = std::pair<
			stepgate::access_log::event_kind_t,
			stepgate::access_log::fields_t >;

	void
	record(
		stepgate::access_log::event_kind_t kind,
		stepgate::access_log::fields_t fields ) noexcept override
	{
		std::lock_guard< std::mutex > lock{ m_lock };
		m_events.emplace_back( kind, std::move(fields) );
	}

	[[nodiscard]]
	std::vector< event_t >
	events() const
	{
		std::lock_guard< std::mutex > lock{ m_lock };
		return m_events;
	}

private:
	mutable std::mutex m_lock;
	std::vector< event_t > m_events;
};

} /* namespace fake_identity_provider */
