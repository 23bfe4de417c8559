#pragma once

#ifndef MQ_ERROR_HPP
#define MQ_ERROR_HPP

#include <string>

#include <boost/system/error_code.hpp>

namespace mq {

enum class configuration_errors
{
	// cannot start at 0, 0 is used as default success code
	malformed_pair = 1,
	unknown_key = 2,
	invalid_number = 3,
	invalid_boolean = 4,
	missing_host = 5
};

enum class declaration_errors
{
	empty_queue_name = 1,
	invalid_expires = 2,
	invalid_message_ttl = 3
};

namespace error {

struct configuration_category : public boost::system::error_category
{
	const char* name() const noexcept override
	{
		return "mqsub.configuration";
	}

	std::string message(int e) const override
	{
		switch (static_cast<configuration_errors>(e))
		{
		case configuration_errors::malformed_pair:
			return "connection string segment is not a key=value pair";
		case configuration_errors::unknown_key:
			return "connection string contains an unknown key";
		case configuration_errors::invalid_number:
			return "value is not a number or is out of range";
		case configuration_errors::invalid_boolean:
			return "value is not true or false";
		case configuration_errors::missing_host:
			return "connection string does not name a host";
		default:
			return "unknown error";
		}
	}
};

struct declaration_category : public boost::system::error_category
{
	const char* name() const noexcept override
	{
		return "mqsub.declaration";
	}

	std::string message(int e) const override
	{
		switch (static_cast<declaration_errors>(e))
		{
		case declaration_errors::empty_queue_name:
			return "subscription queue name is empty";
		case declaration_errors::invalid_expires:
			return "queue expiry must be greater than zero";
		case declaration_errors::invalid_message_ttl:
			return "message ttl cannot be negative";
		default:
			return "unknown error";
		}
	}
};

inline const configuration_category& get_configuration_category()
{
	static configuration_category conf_category{};
	return conf_category;
}

inline const declaration_category& get_declaration_category()
{
	static declaration_category decl_category{};
	return decl_category;
}

} // error

inline boost::system::error_code make_error_code(mq::configuration_errors ec) noexcept
{
	return boost::system::error_code{ static_cast<int>(ec), mq::error::get_configuration_category() };
}

inline boost::system::error_code make_error_code(mq::declaration_errors ec) noexcept
{
	return boost::system::error_code{ static_cast<int>(ec), mq::error::get_declaration_category() };
}

static const boost::system::error_category& configuration_category = error::get_configuration_category();
static const boost::system::error_category& declaration_category = error::get_declaration_category();

} // mq

namespace boost {
namespace system {

template <>
struct is_error_code_enum<mq::configuration_errors>
{
	static constexpr bool value = true;
};

template <>
struct is_error_code_enum<mq::declaration_errors>
{
	static constexpr bool value = true;
};

} // system
} // boost

#endif // MQ_ERROR_HPP
