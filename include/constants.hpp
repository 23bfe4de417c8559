#pragma once

#ifndef MQ_CONSTANTS_HPP
#define MQ_CONSTANTS_HPP

#include <cstdint>
#include <chrono>

namespace mq {
namespace constants {

// connection defaults
inline const std::uint16_t kDefaultPort = 5672;
inline const char kDefaultVirtualHost[] = "/";
inline const char kDefaultUserName[] = "guest";
inline const char kDefaultPassword[] = "guest";
inline const auto kDefaultRequestedHeartbeat = std::chrono::seconds(10);
inline const auto kDefaultTimeout = std::chrono::seconds(10);
inline const std::uint16_t kDefaultPrefetchCount = 50;
inline const bool kDefaultPersistentMessages = true;
inline const bool kDefaultPublisherConfirms = false;

// subscription queues
inline const int kMaxQueueExpiresInDays = 24;
inline const auto kMaxQueueExpires = std::chrono::milliseconds(std::chrono::hours(24 * kMaxQueueExpiresInDays));
inline const char kDefaultTopic[] = "#";

} // constants

namespace arguments {

inline const char expires[] = "x-expires";
inline const char message_ttl[] = "x-message-ttl";
inline const char priority[] = "x-priority";
inline const char cancel_on_ha_failover[] = "x-cancel-on-ha-failover";

} // arguments
} // mq

#endif // MQ_CONSTANTS_HPP
