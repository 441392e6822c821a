/**
 * @file token_loader.hpp
 * @brief Secret file loader utilities.
 *
 * Declares functions for reading access tokens and key material from files
 * so secrets stay out of configuration documents and command lines.
 */
#ifndef OCTOCLIENT_TOKEN_LOADER_HPP
#define OCTOCLIENT_TOKEN_LOADER_HPP

#include <string>

namespace octo {

/**
 * Load a GitHub access token from a file.
 *
 * JSON, YAML and TOML files (by extension) must carry a `token` string.
 * Any other file is read as plain text with surrounding whitespace removed.
 *
 * @param path Filesystem path to the token file
 * @return The token
 * @throws ConfigError When the file cannot be read or holds no token
 */
std::string load_token_from_file(const std::string &path);

/**
 * Read a whole file, typically a PEM encoded private key.
 *
 * @throws ConfigError When the file cannot be opened or is empty.
 */
std::string read_secret_file(const std::string &path);

} // namespace octo

#endif // OCTOCLIENT_TOKEN_LOADER_HPP
