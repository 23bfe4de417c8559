#pragma once

#ifndef MQ_CONNECTION_STRING_PARSER_HPP
#define MQ_CONNECTION_STRING_PARSER_HPP

#include <charconv>
#include <optional>
#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/system/error_code.hpp>

#include "connection_configuration.hpp"
#include "error/error.hpp"
#include "logger.hpp"

namespace mq {
namespace detail {

template <class Integer>
bool parse_number(std::string const& value, Integer& out)
{
	if (value.empty())
		return false;

	auto const* first = value.data();
	auto const* last = value.data() + value.size();
	auto [ptr, ec] = std::from_chars(first, last, out);
	return ec == std::errc() && ptr == last;
}

inline bool parse_boolean(std::string const& value, bool& out)
{
	if (boost::algorithm::iequals(value, "true"))
	{
		out = true;
		return true;
	}
	if (boost::algorithm::iequals(value, "false"))
	{
		out = false;
		return true;
	}
	return false;
}

inline boost::system::error_code parse_port(std::string const& value, std::optional<std::uint16_t>& port)
{
	std::uint16_t number = 0;
	if (!parse_number(value, number))
		return configuration_errors::invalid_number;
	port = number;
	return {};
}

/*
name[:port] separated by commas. IPv6 literals are bracketed, "[::1]:5672",
and stored without the brackets. The port follows the last ':' outside brackets.
*/
inline boost::system::error_code parse_hosts(std::string const& value, std::vector<host_configuration>& hosts)
{
	std::vector<std::string> entries;
	boost::algorithm::split(entries, value, boost::algorithm::is_any_of(","));
	for (auto& entry : entries)
	{
		boost::algorithm::trim(entry);
		if (entry.empty())
			continue;

		host_configuration host;
		boost::system::error_code ec;

		if (entry.front() == '[')
		{
			auto const close = entry.find(']');
			if (close == std::string::npos)
				return configuration_errors::malformed_pair;

			host.host = entry.substr(1, close - 1);
			auto const rest = entry.substr(close + 1);
			if (!rest.empty())
			{
				if (rest.front() != ':')
					return configuration_errors::malformed_pair;
				ec = parse_port(rest.substr(1), host.port);
			}
		}
		else
		{
			auto const colon = entry.rfind(':');
			host.host = entry.substr(0, colon);
			if (colon != std::string::npos)
			{
				ec = parse_port(entry.substr(colon + 1), host.port);
			}
		}

		if (ec)
			return ec;

		boost::algorithm::trim(host.host);
		// unbracketed names cannot carry a ':' once the port is split off
		if (host.host.empty() || (entry.front() != '[' && host.host.find(':') != std::string::npos))
			return configuration_errors::malformed_pair;

		hosts.push_back(std::move(host));
	}
	return {};
}

} // detail

/*
Parses a connection string made of key=value pairs separated by ';', for example
"host=localhost;persistentMessages=false;prefetchcount=30;timeout=20".
Keys are case insensitive. On failure ec is set and a default configuration is returned.
*/
inline connection_configuration parse_connection_string(std::string_view connection_string, boost::system::error_code& ec)
{
	ec.clear();

	connection_configuration_builder builder;
	std::vector<host_configuration> hosts;

	std::string const input(connection_string);
	std::vector<std::string> segments;
	boost::algorithm::split(segments, input, boost::algorithm::is_any_of(";"));

	for (auto& segment : segments)
	{
		boost::algorithm::trim(segment);
		if (segment.empty())
			continue;

		auto const equals = segment.find('=');
		if (equals == std::string::npos)
		{
			ec = configuration_errors::malformed_pair;
		}
		else
		{
			auto key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(segment.substr(0, equals)));
			auto value = boost::algorithm::trim_copy(segment.substr(equals + 1));

			std::uint16_t number = 0;
			bool flag = false;

			if (key.empty())
			{
				ec = configuration_errors::malformed_pair;
			}
			else if (key == "host")
			{
				ec = detail::parse_hosts(value, hosts);
			}
			else if (key == "port")
			{
				if (detail::parse_number(value, number)) builder.with_port(number);
				else ec = configuration_errors::invalid_number;
			}
			else if (key == "virtualhost")
			{
				builder.with_virtual_host(value);
			}
			else if (key == "username")
			{
				builder.with_user_name(value);
			}
			else if (key == "password")
			{
				builder.with_password(value);
			}
			else if (key == "requestedheartbeat")
			{
				if (detail::parse_number(value, number)) builder.with_requested_heartbeat(std::chrono::seconds(number));
				else ec = configuration_errors::invalid_number;
			}
			else if (key == "timeout")
			{
				if (detail::parse_number(value, number)) builder.with_timeout(std::chrono::seconds(number));
				else ec = configuration_errors::invalid_number;
			}
			else if (key == "prefetchcount")
			{
				if (detail::parse_number(value, number)) builder.with_prefetch_count(number);
				else ec = configuration_errors::invalid_number;
			}
			else if (key == "persistentmessages")
			{
				if (detail::parse_boolean(value, flag)) builder.with_persistent_messages(flag);
				else ec = configuration_errors::invalid_boolean;
			}
			else if (key == "publisherconfirms")
			{
				if (detail::parse_boolean(value, flag)) builder.with_publisher_confirms(flag);
				else ec = configuration_errors::invalid_boolean;
			}
			else if (key == "product")
			{
				builder.with_product(value);
			}
			else if (key == "platform")
			{
				builder.with_platform(value);
			}
			else
			{
				ec = configuration_errors::unknown_key;
			}
		}

		if (ec)
		{
			MQ_ERROR("invalid connection string segment '{}' : {}", segment, ec.message());
			return connection_configuration_builder().build();
		}
	}

	if (hosts.empty())
	{
		ec = configuration_errors::missing_host;
		MQ_ERROR("invalid connection string : {}", ec.message());
		return connection_configuration_builder().build();
	}

	MQ_DEBUG("parsed connection string with {} host(s)", hosts.size());
	return builder.with_hosts(hosts).build();
}

} // mq

#endif // MQ_CONNECTION_STRING_PARSER_HPP
