#include <catch2/catch.hpp>

#include "connection_string_parser.hpp"

TEST_CASE("parse_connection_string reads key value pairs", "[connection_string]")
{
	boost::system::error_code ec;

	SECTION("connection string used by request/respond subscribers")
	{
		auto configuration = mq::parse_connection_string("host=localhost;persistentMessages=false;prefetchcount=30;timeout=20", ec);

		REQUIRE(!ec);
		REQUIRE(configuration.hosts().size() == 1);
		REQUIRE(configuration.hosts()[0].host == "localhost");
		REQUIRE(configuration.hosts()[0].port == mq::constants::kDefaultPort);
		REQUIRE_FALSE(configuration.persistent_messages());
		REQUIRE(configuration.prefetch_count() == 30);
		REQUIRE(configuration.timeout() == std::chrono::seconds(20));
	}
	SECTION("unspecified keys keep their defaults")
	{
		auto configuration = mq::parse_connection_string("host=localhost", ec);

		REQUIRE(!ec);
		REQUIRE(configuration.virtual_host() == "/");
		REQUIRE(configuration.user_name() == "guest");
		REQUIRE(configuration.password() == "guest");
		REQUIRE(configuration.requested_heartbeat() == mq::constants::kDefaultRequestedHeartbeat);
		REQUIRE(configuration.timeout() == mq::constants::kDefaultTimeout);
		REQUIRE(configuration.prefetch_count() == mq::constants::kDefaultPrefetchCount);
		REQUIRE(configuration.persistent_messages());
		REQUIRE_FALSE(configuration.publisher_confirms());
	}
	SECTION("keys are case insensitive and whitespace is trimmed")
	{
		auto configuration = mq::parse_connection_string(" HOST = rabbit ; VirtualHost = orders ; UserName=svc ; Password = secret ;PublisherConfirms=TRUE;", ec);

		REQUIRE(!ec);
		REQUIRE(configuration.hosts()[0].host == "rabbit");
		REQUIRE(configuration.virtual_host() == "orders");
		REQUIRE(configuration.user_name() == "svc");
		REQUIRE(configuration.password() == "secret");
		REQUIRE(configuration.publisher_confirms());
	}
	SECTION("host lists keep explicit ports and default the rest")
	{
		auto configuration = mq::parse_connection_string("host=first:5673, second ,third:5674;port=5680", ec);

		REQUIRE(!ec);
		REQUIRE(configuration.hosts().size() == 3);
		REQUIRE(configuration.hosts()[0] == mq::host_configuration{ "first", 5673 });
		REQUIRE(configuration.hosts()[1] == mq::host_configuration{ "second", 5680 });
		REQUIRE(configuration.hosts()[2] == mq::host_configuration{ "third", 5674 });
		REQUIRE(configuration.port() == 5680);
	}
	SECTION("bracketed ipv6 literals with and without a port")
	{
		auto configuration = mq::parse_connection_string("host=[::1]:5673,[fe80::1]", ec);

		REQUIRE(!ec);
		REQUIRE(configuration.hosts().size() == 2);
		REQUIRE(configuration.hosts()[0] == mq::host_configuration{ "::1", 5673 });
		REQUIRE(configuration.hosts()[1] == mq::host_configuration{ "fe80::1", mq::constants::kDefaultPort });
	}
	SECTION("heartbeat, product and platform")
	{
		auto configuration = mq::parse_connection_string("host=h;requestedHeartbeat=30;product=billing;platform=linux", ec);

		REQUIRE(!ec);
		REQUIRE(configuration.requested_heartbeat() == std::chrono::seconds(30));
		REQUIRE(configuration.product() == "billing");
		REQUIRE(configuration.platform() == "linux");
	}
}

TEST_CASE("parse_connection_string reports malformed input through error codes", "[connection_string][error]")
{
	boost::system::error_code ec;

	SECTION("segment without equals sign")
	{
		mq::parse_connection_string("host=localhost;prefetchcount", ec);
		REQUIRE(ec == mq::configuration_errors::malformed_pair);
	}
	SECTION("segment with an empty key")
	{
		mq::parse_connection_string("host=localhost;=5", ec);
		REQUIRE(ec == mq::configuration_errors::malformed_pair);
	}
	SECTION("unknown key")
	{
		mq::parse_connection_string("host=localhost;flavour=vanilla", ec);
		REQUIRE(ec == mq::configuration_errors::unknown_key);
	}
	SECTION("prefetch count that is not a number or does not fit 16 bits")
	{
		mq::parse_connection_string("host=localhost;prefetchcount=lots", ec);
		REQUIRE(ec == mq::configuration_errors::invalid_number);
		mq::parse_connection_string("host=localhost;prefetchcount=65536", ec);
		REQUIRE(ec == mq::configuration_errors::invalid_number);
		mq::parse_connection_string("host=localhost;prefetchcount=-1", ec);
		REQUIRE(ec == mq::configuration_errors::invalid_number);
	}
	SECTION("host with a bad port")
	{
		mq::parse_connection_string("host=localhost:http", ec);
		REQUIRE(ec == mq::configuration_errors::invalid_number);
	}
	SECTION("host with an empty name")
	{
		mq::parse_connection_string("host=:5672", ec);
		REQUIRE(ec == mq::configuration_errors::malformed_pair);
		mq::parse_connection_string("host=[]:5672", ec);
		REQUIRE(ec == mq::configuration_errors::malformed_pair);
	}
	SECTION("ipv6 literals must be bracketed and well formed")
	{
		mq::parse_connection_string("host=::1", ec);
		REQUIRE(ec == mq::configuration_errors::malformed_pair);
		mq::parse_connection_string("host=[::1", ec);
		REQUIRE(ec == mq::configuration_errors::malformed_pair);
		mq::parse_connection_string("host=[::1]5672", ec);
		REQUIRE(ec == mq::configuration_errors::malformed_pair);
		mq::parse_connection_string("host=[::1]:http", ec);
		REQUIRE(ec == mq::configuration_errors::invalid_number);
	}
	SECTION("boolean that is not true or false")
	{
		mq::parse_connection_string("host=localhost;persistentMessages=yes", ec);
		REQUIRE(ec == mq::configuration_errors::invalid_boolean);
	}
	SECTION("no host")
	{
		mq::parse_connection_string("prefetchcount=30", ec);
		REQUIRE(ec == mq::configuration_errors::missing_host);
		mq::parse_connection_string("", ec);
		REQUIRE(ec == mq::configuration_errors::missing_host);
	}
	SECTION("failed parse returns a default configuration")
	{
		auto configuration = mq::parse_connection_string("host=localhost;prefetchcount=30;timeout=soon", ec);
		REQUIRE(ec);
		REQUIRE(configuration.hosts().empty());
		REQUIRE(configuration.prefetch_count() == mq::constants::kDefaultPrefetchCount);
	}
	SECTION("error codes belong to the configuration category")
	{
		mq::parse_connection_string("flavour=vanilla", ec);
		REQUIRE(ec.category() == mq::configuration_category);
		REQUIRE(std::string(ec.category().name()) == "mqsub.configuration");
		REQUIRE(ec.message() == "connection string contains an unknown key");
	}
	SECTION("a successful parse clears a previous error")
	{
		mq::parse_connection_string("flavour=vanilla", ec);
		REQUIRE(ec);
		mq::parse_connection_string("host=localhost", ec);
		REQUIRE(!ec);
	}
}
