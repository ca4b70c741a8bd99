/**
 * @file token_loader.hpp
 * @brief Access token discovery for the forge client.
 */
#ifndef STUD_TOKEN_LOADER_HPP
#define STUD_TOKEN_LOADER_HPP

#include <optional>
#include <string>
#include <vector>

namespace stud {

/**
 * Load GitHub access tokens from a configuration file.
 *
 * Supported formats are JSON, YAML, and TOML. Files may contain a flat array
 * of tokens or an object/table with either a single `token` string or a
 * `tokens` array of strings. Empty entries are dropped.
 *
 * @param path Filesystem path to the token file
 * @return Vector of tokens discovered in the file
 * @throws std::runtime_error on unsupported formats or read errors
 */
std::vector<std::string> load_tokens_from_file(const std::string &path);

/**
 * Pick the token used for forge requests.
 *
 * Order: @p explicit_token, @p config_token, the first token of
 * @p token_file, then the `GITHUB_TOKEN` environment variable.
 *
 * @return Token or `std::nullopt` when no source provides one.
 * @throws std::runtime_error When @p token_file is set but cannot be read.
 */
std::optional<std::string> resolve_token(const std::string &explicit_token,
                                         const std::string &config_token,
                                         const std::string &token_file);

} // namespace stud

#endif // STUD_TOKEN_LOADER_HPP
