/**
 * @file instance.hpp
 * @brief Process-wide shared client handle.
 */
#ifndef OCTOCLIENT_INSTANCE_HPP
#define OCTOCLIENT_INSTANCE_HPP

#include "config.hpp"
#include "github_client.hpp"
#include "http_client.hpp"
#include <memory>

namespace octo {

/**
 * Build a client from @p config and make it the process-wide instance.
 *
 * The client is fully constructed before it becomes visible; callers that
 * already hold the previous instance keep using it until they release it.
 * Concurrent calls are serialized.
 *
 * @param config Client settings.
 * @param http Optional transport, mainly for tests.
 * @return The newly installed client.
 * @throws ConfigError When @p config is invalid; the previous instance stays.
 */
std::shared_ptr<GitHubClient>
initialise(const ClientConfig &config, std::unique_ptr<HttpClient> http = nullptr);

/**
 * Current process-wide client.
 *
 * A default unauthenticated client is created on first access when
 * initialise() was never called.
 */
std::shared_ptr<GitHubClient> instance();

/// Drop the process-wide client. Intended for tests.
void reset_instance();

} // namespace octo

#endif // OCTOCLIENT_INSTANCE_HPP
