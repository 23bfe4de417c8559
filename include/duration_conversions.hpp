#pragma once

#ifndef MQ_DURATION_CONVERSIONS_HPP
#define MQ_DURATION_CONVERSIONS_HPP

#include <chrono>
#include <cstdint>
#include <limits>

#define MQ_MILLISECONDS_CAST(expr) std::chrono::duration_cast<std::chrono::milliseconds>(expr)

#define MQ_MILLISECONDS(expr) MQ_MILLISECONDS_CAST(expr).count()

namespace mq {
namespace detail {

// amqp integer arguments are signed 32 bit, anything wider saturates
inline std::int32_t saturate_to_int32(std::int64_t value)
{
	if (value > std::numeric_limits<std::int32_t>::max())
		return std::numeric_limits<std::int32_t>::max();
	if (value < std::numeric_limits<std::int32_t>::min())
		return std::numeric_limits<std::int32_t>::min();
	return static_cast<std::int32_t>(value);
}

// duration_cast truncates toward zero, sub-millisecond remainders are dropped
template <class Rep, class Period>
std::int32_t to_milliseconds_int32(std::chrono::duration<Rep, Period> const& duration)
{
	using double_ms = std::chrono::duration<double, std::milli>;
	auto const ms = std::chrono::duration_cast<double_ms>(duration).count();
	if (ms >= static_cast<double>(std::numeric_limits<std::int32_t>::max()))
		return std::numeric_limits<std::int32_t>::max();
	if (ms <= static_cast<double>(std::numeric_limits<std::int32_t>::min()))
		return std::numeric_limits<std::int32_t>::min();
	return static_cast<std::int32_t>(MQ_MILLISECONDS(duration));
}

} // detail
} // mq

#endif // MQ_DURATION_CONVERSIONS_HPP
