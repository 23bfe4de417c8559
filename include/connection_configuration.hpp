#pragma once

#ifndef MQ_CONNECTION_CONFIGURATION_HPP
#define MQ_CONNECTION_CONFIGURATION_HPP

#include <string>
#include <string_view>
#include <vector>
#include <chrono>
#include <optional>

#include "constants.hpp"

namespace mq {

struct host_configuration
{
	std::string host;
	// unset means the connection's default port
	std::optional<std::uint16_t> port;

	bool operator==(host_configuration const& rhs) const { return host == rhs.host && port == rhs.port; }
	bool operator!=(host_configuration const& rhs) const { return !this->operator==(rhs); }
};

class connection_configuration_builder;

class connection_configuration
{
public:
	connection_configuration(connection_configuration const& other) = default;
	connection_configuration(connection_configuration&& other) = default;
	connection_configuration& operator=(connection_configuration const&) = default;
	connection_configuration& operator=(connection_configuration&&) = default;

	std::vector<host_configuration> const& hosts() const { return hosts_; }
	std::uint16_t port() const { return port_; }
	std::string const& virtual_host() const { return virtual_host_; }
	std::string const& user_name() const { return user_name_; }
	std::string const& password() const { return password_; }
	std::chrono::seconds requested_heartbeat() const { return requested_heartbeat_; }
	std::chrono::seconds timeout() const { return timeout_; }
	std::uint16_t prefetch_count() const { return prefetch_count_; }
	bool persistent_messages() const { return persistent_messages_; }
	bool publisher_confirms() const { return publisher_confirms_; }
	std::string const& product() const { return product_; }
	std::string const& platform() const { return platform_; }

private:
	explicit connection_configuration() = default;
	friend class connection_configuration_builder;

	std::vector<host_configuration> hosts_;
	std::uint16_t port_ = mq::constants::kDefaultPort;
	std::string virtual_host_ = mq::constants::kDefaultVirtualHost;
	std::string user_name_ = mq::constants::kDefaultUserName;
	std::string password_ = mq::constants::kDefaultPassword;
	std::chrono::seconds requested_heartbeat_ = mq::constants::kDefaultRequestedHeartbeat;
	std::chrono::seconds timeout_ = mq::constants::kDefaultTimeout;
	std::uint16_t prefetch_count_ = mq::constants::kDefaultPrefetchCount;
	bool persistent_messages_ = mq::constants::kDefaultPersistentMessages;
	bool publisher_confirms_ = mq::constants::kDefaultPublisherConfirms;
	std::string product_;
	std::string platform_;
};

class connection_configuration_builder
{
private:
	using self_type = connection_configuration_builder;
	connection_configuration settings_;
public:
	explicit connection_configuration_builder() = default;

	self_type& with_host(std::string_view host) { settings_.hosts_.push_back(host_configuration{ std::string(host), std::nullopt }); return *this; }
	self_type& with_host(std::string_view host, std::uint16_t port) { settings_.hosts_.push_back(host_configuration{ std::string(host), port }); return *this; }
	self_type& with_hosts(std::vector<host_configuration> const& hosts)
	{
		settings_.hosts_.clear();
		settings_.hosts_.insert(settings_.hosts_.end(), hosts.cbegin(), hosts.cend());
		return *this;
	}
	self_type& with_port(std::uint16_t port) { settings_.port_ = port; return *this; }
	self_type& with_virtual_host(std::string_view virtual_host) { settings_.virtual_host_ = virtual_host; return *this; }
	self_type& with_user_name(std::string_view user_name) { settings_.user_name_ = user_name; return *this; }
	self_type& with_password(std::string_view password) { settings_.password_ = password; return *this; }
	self_type& with_requested_heartbeat(std::chrono::seconds heartbeat) { settings_.requested_heartbeat_ = heartbeat; return *this; }
	self_type& with_timeout(std::chrono::seconds timeout) { settings_.timeout_ = timeout; return *this; }
	self_type& with_prefetch_count(std::uint16_t prefetch_count) { settings_.prefetch_count_ = prefetch_count; return *this; }
	self_type& with_persistent_messages(bool persistent) { settings_.persistent_messages_ = persistent; return *this; }
	self_type& with_publisher_confirms(bool confirms) { settings_.publisher_confirms_ = confirms; return *this; }
	self_type& with_product(std::string_view product) { settings_.product_ = product; return *this; }
	self_type& with_platform(std::string_view platform) { settings_.platform_ = platform; return *this; }

	// hosts without an explicit port are resolved against the configured port
	connection_configuration build()
	{
		connection_configuration settings = settings_;
		for (auto& host : settings.hosts_)
		{
			if (!host.port.has_value())
			{
				host.port = settings.port_;
			}
		}
		return settings;
	}
};

} // mq

#endif // MQ_CONNECTION_CONFIGURATION_HPP
