/**
 * @file duration.hpp
 * @brief Human-readable duration parsing utilities.
 *
 * Parses duration strings (e.g. "250ms", "10s", "5m") used for timeouts and
 * retry delays in the client configuration.
 */
#ifndef OCTOCLIENT_UTIL_DURATION_HPP
#define OCTOCLIENT_UTIL_DURATION_HPP

#include <chrono>
#include <string>

namespace octo {

/**
 * Parse a human-readable duration string (e.g. "250ms", "10s", "5m", "2h",
 * "1d", "1m30s") into milliseconds. Multiple units can be combined and a
 * pure number is interpreted as milliseconds.
 *
 * @param str Duration string; empty string returns zero.
 * @return Parsed duration in milliseconds.
 * @throws ConfigError if an invalid format or suffix is provided.
 */
std::chrono::milliseconds parse_duration(const std::string &str);

} // namespace octo

#endif // OCTOCLIENT_UTIL_DURATION_HPP
