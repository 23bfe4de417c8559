#include <chrono>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include "connection_string_parser.hpp"
#include "subscription_configuration.hpp"
#include "subscription_declaration.hpp"

static std::string to_string(mq::field_table const& table)
{
	std::string result;
	for (auto const& [key, value] : table)
	{
		if (!result.empty())
			result += ", ";
		result += key + "=";
		std::visit([&result](auto const& v)
		{
			using value_type = std::decay_t<decltype(v)>;
			if constexpr (std::is_same_v<value_type, bool>)
				result += v ? "true" : "false";
			else if constexpr (std::is_same_v<value_type, std::string>)
				result += v;
			else
				result += std::to_string(v);
		}, value);
	}
	return result;
}

int main(int argc, char** argv)
{
	if (argc != 4 && argc != 5)
	{
		MQ_ERROR("expected 3 or 4 arguments, got {}", argc - 1);
		MQ_ERROR("usage: <executable> <connection-string> <exchange> <topic> [trace | debug | info | warn | error | critical | off]");
		MQ_ERROR("example: ./subscribe-configuration \"host=localhost;prefetchcount=30;timeout=20\" requests orders.* info");
		return 1;
	}

	// get command arguments, the log level defaults to info
	std::string_view connection_string = argv[1];
	std::string_view exchange = argv[2];
	std::string_view topic = argv[3];
	std::string_view lvl = argc == 5 ? argv[4] : "info";
	MQ_DEFAULT_LOG_LEVEL(lvl);

	boost::system::error_code ec;
	auto connection = mq::parse_connection_string(connection_string, ec);
	if (ec)
	{
		MQ_ERROR("could not parse connection string : {}", ec.message());
		return 1;
	}

	// the callback is what a caller passes when registering a handler
	auto configuration = mq::make_subscription_configuration(connection, [topic](mq::subscription_configuration_builder& x)
	{
		using namespace std::chrono_literals;

		x.with_topic(topic)
			.with_auto_delete()
			.with_expires_in_days(30)
			.with_message_ttl(5min);
	});

	auto declaration = mq::declare_subscription(exchange, mq::make_queue_name("OrderPlaced", "example"), configuration, ec);
	if (ec)
	{
		MQ_ERROR("could not declare subscription : {}", ec.message());
		return 1;
	}

	MQ_INFO("queue.declare name={} durable={} exclusive={} auto_delete={} arguments=[{}]",
		declaration.queue.name,
		declaration.queue.durable,
		declaration.queue.exclusive,
		declaration.queue.auto_delete,
		to_string(declaration.queue.arguments)
	);

	for (auto const& binding : declaration.bindings)
	{
		MQ_INFO("queue.bind exchange={} queue={} routing_key={}", binding.exchange, binding.queue, binding.routing_key);
	}

	MQ_INFO("basic.qos prefetch_count={}", declaration.consumer.prefetch_count);
	MQ_INFO("basic.consume queue={} exclusive={} arguments=[{}]",
		declaration.consumer.queue,
		declaration.consumer.exclusive,
		to_string(declaration.consumer.arguments)
	);

	return 0;
}
