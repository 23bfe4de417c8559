#pragma once

#ifndef MQ_SUBSCRIPTION_CONFIGURATION_HPP
#define MQ_SUBSCRIPTION_CONFIGURATION_HPP

#include <string>
#include <string_view>
#include <vector>
#include <chrono>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>

#include "constants.hpp"
#include "connection_configuration.hpp"
#include "duration_conversions.hpp"
#include "logger.hpp"

namespace mq {

class subscription_configuration_builder;

/*
Per-subscription options read by the subscription setup. Only a
subscription_configuration_builder produces one; once built it is
treated as a read-only value.
*/
class subscription_configuration
{
public:
	friend class subscription_configuration_builder;

	subscription_configuration(subscription_configuration const& other) = default;
	subscription_configuration(subscription_configuration&& other) = default;
	subscription_configuration& operator=(subscription_configuration const& other) = default;
	subscription_configuration& operator=(subscription_configuration&& other) = default;

	std::vector<std::string> const& topics() const { return topics_; }
	bool auto_delete() const { return auto_delete_; }
	int priority() const { return priority_; }
	bool cancel_on_ha_failover() const { return cancel_on_ha_failover_; }
	std::uint16_t prefetch_count() const { return prefetch_count_; }
	// milliseconds, never above constants::kMaxQueueExpires
	std::optional<std::int32_t> const& expires() const { return expires_; }
	// milliseconds, unset means messages never expire
	std::optional<std::int32_t> const& message_ttl() const { return message_ttl_; }
	bool is_exclusive() const { return is_exclusive_; }

private:
	explicit subscription_configuration(std::uint16_t default_prefetch_count)
		: prefetch_count_(default_prefetch_count)
	{}

	std::vector<std::string> topics_;
	bool auto_delete_ = false;
	int priority_ = 0;
	bool cancel_on_ha_failover_ = false;
	std::uint16_t prefetch_count_;
	std::optional<std::int32_t> expires_;
	std::optional<std::int32_t> message_ttl_;
	bool is_exclusive_ = false;
};

/*
Chainable builder handed to the configuration callback of a subscription.

	auto configuration = mq::subscription_configuration_builder(30)
		.with_topic("orders.*")
		.with_auto_delete()
		.with_expires_in_days(30)
		.build();

Expiry is capped at 24 days on every path. Values above the cap are
clamped silently, nothing is rejected here.
*/
class subscription_configuration_builder
{
public:
	using self_type = subscription_configuration_builder;

	explicit subscription_configuration_builder(std::uint16_t default_prefetch_count)
		: settings_(default_prefetch_count)
	{}

	self_type& with_topic(std::string_view topic) { settings_.topics_.emplace_back(topic); return *this; }
	self_type& with_auto_delete(bool auto_delete = true) { settings_.auto_delete_ = auto_delete; return *this; }
	self_type& with_priority(int priority) { settings_.priority_ = priority; return *this; }
	self_type& with_cancel_on_ha_failover(bool cancel_on_ha_failover = true) { settings_.cancel_on_ha_failover_ = cancel_on_ha_failover; return *this; }
	self_type& with_prefetch_count(std::uint16_t prefetch_count) { settings_.prefetch_count_ = prefetch_count; return *this; }
	self_type& as_exclusive() { settings_.is_exclusive_ = true; return *this; }

	self_type& with_expires_max()
	{
		return with_expires(std::numeric_limits<std::int32_t>::max());
	}

	self_type& with_expires(std::int32_t expires)
	{
		auto const max_expires = static_cast<std::int32_t>(constants::kMaxQueueExpires.count());
		if (expires > max_expires)
		{
			MQ_DEBUG("queue expiry of {}ms clamped to {}ms", expires, max_expires);
			expires = max_expires;
		}
		else if (expires <= 0)
		{
			MQ_WARN("queue expiry of {}ms will be rejected by the broker, it must be greater than zero", expires);
		}

		settings_.expires_ = expires;
		return *this;
	}

	template <class Rep, class Period>
	self_type& with_expires(std::chrono::duration<Rep, Period> expires)
	{
		// compared as floating point milliseconds so coarse durations near their max cannot overflow
		using double_ms = std::chrono::duration<double, std::milli>;
		if (double_ms(expires) > double_ms(constants::kMaxQueueExpires))
		{
			return with_expires(static_cast<std::int32_t>(constants::kMaxQueueExpires.count()));
		}
		return with_expires(detail::to_milliseconds_int32(expires));
	}

	self_type& with_expires_in_days(int expires)
	{
		if (expires > constants::kMaxQueueExpiresInDays)
		{
			expires = constants::kMaxQueueExpiresInDays;
		}
		auto const ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::hours(24) * static_cast<std::int64_t>(expires));
		return with_expires(detail::saturate_to_int32(ms.count()));
	}

	template <class Rep, class Period>
	self_type& with_message_ttl(std::chrono::duration<Rep, Period> ttl)
	{
		settings_.message_ttl_ = detail::to_milliseconds_int32(ttl);
		return *this;
	}

	self_type& with_message_ttl(std::nullopt_t)
	{
		settings_.message_ttl_.reset();
		return *this;
	}

	template <class Rep, class Period>
	self_type& with_message_ttl(std::optional<std::chrono::duration<Rep, Period>> const& ttl)
	{
		if (ttl.has_value())
		{
			return with_message_ttl(ttl.value());
		}
		return with_message_ttl(std::nullopt);
	}

	subscription_configuration const& configuration() const { return settings_; }
	subscription_configuration build() const { return settings_; }

private:
	subscription_configuration settings_;
};

using configure_subscription = std::function<void(subscription_configuration_builder&)>;

// runs the registration callback against a builder seeded with the default prefetch count
inline subscription_configuration make_subscription_configuration(
	std::uint16_t default_prefetch_count,
	configure_subscription const& configure
)
{
	subscription_configuration_builder builder(default_prefetch_count);
	if (configure)
	{
		configure(builder);
	}
	return builder.build();
}

inline subscription_configuration make_subscription_configuration(
	connection_configuration const& connection,
	configure_subscription const& configure
)
{
	return make_subscription_configuration(connection.prefetch_count(), configure);
}

} // mq

#endif // MQ_SUBSCRIPTION_CONFIGURATION_HPP
