#pragma once

#ifndef MQ_SUBSCRIPTION_DECLARATION_HPP
#define MQ_SUBSCRIPTION_DECLARATION_HPP

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <boost/system/error_code.hpp>

#include "constants.hpp"
#include "error/error.hpp"
#include "logger.hpp"
#include "subscription_configuration.hpp"

namespace mq {

// amqp field table restricted to the value types subscriptions use
using field_value = std::variant<bool, std::int32_t, std::string>;
using field_table = std::map<std::string, field_value>;

struct queue_declaration
{
	std::string name;
	bool durable = true;
	bool exclusive = false;
	bool auto_delete = false;
	field_table arguments;
};

struct binding_declaration
{
	std::string exchange;
	std::string queue;
	std::string routing_key;
};

struct consumer_declaration
{
	std::string queue;
	std::uint16_t prefetch_count = 0;
	bool exclusive = false;
	field_table arguments;
};

struct subscription_declaration
{
	queue_declaration queue;
	std::vector<binding_declaration> bindings;
	consumer_declaration consumer;
};

inline std::string make_queue_name(std::string_view type_name, std::string_view subscription_id)
{
	std::string name;
	name.reserve(type_name.size() + subscription_id.size() + 1);
	name.append(type_name).append("_").append(subscription_id);
	return name;
}

/*
Translates a finished subscription_configuration into the declarations
the broker transport issues: queue.declare, one queue.bind per topic
(or a single '#' binding when no topic was given) and basic.consume.

Values the broker would refuse are reported through ec, in which case
an empty declaration is returned.
*/
inline subscription_declaration declare_subscription(
	std::string_view exchange,
	std::string_view queue_name,
	subscription_configuration const& configuration,
	boost::system::error_code& ec
)
{
	ec.clear();

	if (queue_name.empty())
	{
		ec = declaration_errors::empty_queue_name;
	}
	else if (configuration.expires().has_value() && configuration.expires().value() <= 0)
	{
		ec = declaration_errors::invalid_expires;
	}
	else if (configuration.message_ttl().has_value() && configuration.message_ttl().value() < 0)
	{
		ec = declaration_errors::invalid_message_ttl;
	}

	if (ec)
	{
		MQ_ERROR("cannot declare subscription queue '{}' : {}", queue_name, ec.message());
		return subscription_declaration{};
	}

	subscription_declaration declaration;

	auto& queue = declaration.queue;
	queue.name = queue_name;
	queue.auto_delete = configuration.auto_delete();
	if (configuration.expires().has_value())
	{
		queue.arguments[arguments::expires] = configuration.expires().value();
	}
	if (configuration.message_ttl().has_value())
	{
		queue.arguments[arguments::message_ttl] = configuration.message_ttl().value();
	}

	if (configuration.topics().empty())
	{
		declaration.bindings.push_back(binding_declaration{ std::string(exchange), queue.name, constants::kDefaultTopic });
	}
	else
	{
		for (auto const& topic : configuration.topics())
		{
			declaration.bindings.push_back(binding_declaration{ std::string(exchange), queue.name, topic });
		}
	}

	auto& consumer = declaration.consumer;
	consumer.queue = queue.name;
	consumer.prefetch_count = configuration.prefetch_count();
	consumer.exclusive = configuration.is_exclusive();
	consumer.arguments[arguments::priority] = configuration.priority();
	consumer.arguments[arguments::cancel_on_ha_failover] = configuration.cancel_on_ha_failover();

	MQ_DEBUG("declared subscription queue '{}' with {} binding(s), prefetch count {}",
		queue.name,
		declaration.bindings.size(),
		consumer.prefetch_count
	);

	return declaration;
}

} // mq

#endif // MQ_SUBSCRIPTION_DECLARATION_HPP
