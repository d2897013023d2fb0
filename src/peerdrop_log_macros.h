/**
 * @file peerdrop_log_macros.h
 * @brief Shared logging macros for the relay and endpoint sources.
 *
 * In TESTING builds the macros embed the `this` pointer so that
 * log lines from different endpoints in one process can be distinguished.
 */

#ifndef PEERDROP_LOG_MACROS_H
#define PEERDROP_LOG_MACROS_H

#include "logger.h"

#ifdef TESTING
#define LOG_ENDPOINT_DEBUG(message) LOG_DEBUG("endpoint", "[pointer: " << this << "] " << message)
#define LOG_ENDPOINT_INFO(message)  LOG_INFO("endpoint", "[pointer: " << this << "] " << message)
#define LOG_ENDPOINT_WARN(message)  LOG_WARN("endpoint", "[pointer: " << this << "] " << message)
#define LOG_ENDPOINT_ERROR(message) LOG_ERROR("endpoint", "[pointer: " << this << "] " << message)

#define LOG_RELAY_DEBUG(message) LOG_DEBUG("relay", "[pointer: " << this << "] " << message)
#define LOG_RELAY_INFO(message)  LOG_INFO("relay", "[pointer: " << this << "] " << message)
#define LOG_RELAY_WARN(message)  LOG_WARN("relay", "[pointer: " << this << "] " << message)
#define LOG_RELAY_ERROR(message) LOG_ERROR("relay", "[pointer: " << this << "] " << message)
#else
#define LOG_ENDPOINT_DEBUG(message) LOG_DEBUG("endpoint", message)
#define LOG_ENDPOINT_INFO(message)  LOG_INFO("endpoint", message)
#define LOG_ENDPOINT_WARN(message)  LOG_WARN("endpoint", message)
#define LOG_ENDPOINT_ERROR(message) LOG_ERROR("endpoint", message)

#define LOG_RELAY_DEBUG(message) LOG_DEBUG("relay", message)
#define LOG_RELAY_INFO(message)  LOG_INFO("relay", message)
#define LOG_RELAY_WARN(message)  LOG_WARN("relay", message)
#define LOG_RELAY_ERROR(message) LOG_ERROR("relay", message)
#endif

#endif // PEERDROP_LOG_MACROS_H
