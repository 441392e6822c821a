#ifndef OCTOCLIENT_VERSION_HPP
#define OCTOCLIENT_VERSION_HPP

#ifndef OCTOCLIENT_VERSION
#define OCTOCLIENT_VERSION "0.0.0-dev"
#endif

namespace octo {

/// Version reported by `--version`.
inline constexpr const char *kVersionString = OCTOCLIENT_VERSION;

} // namespace octo

#endif // OCTOCLIENT_VERSION_HPP
