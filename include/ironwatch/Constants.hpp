#pragma once
#include <cstddef>

namespace ironwatch {

constexpr int MAX_STRING_LENGTH = 256;

constexpr int DEFAULT_POLL_INTERVAL = 500;   // ms
constexpr int MIN_POLL_INTERVAL = 100;       // ms

constexpr size_t CONNECTION_HISTORY_CAPACITY = 1000;
constexpr size_t SECURITY_EVENT_CAPACITY = 1000;
constexpr size_t STATUS_SUBSCRIPTION_CAPACITY = 100;
constexpr size_t RECENT_LOG_CAPACITY = 1000;

constexpr int ANALYTICS_WINDOW_HOURS = 24;

constexpr int USB_ACCESS_RETRY_DELAY = 2000; // ms

}
