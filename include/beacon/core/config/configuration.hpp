#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>

namespace beacon::core::config {

/**
 * @brief Malformed configuration text. what() reads "<origin>:<line>: <reason>".
 */
class ConfigError : public std::runtime_error {
public:
    ConfigError(const std::string& origin, std::size_t line, const std::string& reason);

    [[nodiscard]] std::size_t line() const noexcept { return line_; }

private:
    std::size_t line_;
};

/**
 * @brief Flat key/value view of a TOML subset.
 *
 * Keys are dotted paths: "[tracing]" + "backend = ..." gives "tracing.backend",
 * and the i-th "[[logging.sinks]]" table is addressed as "logging.sinks[i]".
 * Values are scalars; quoted strings are unescaped when parsed, so every
 * stored value is the literal text the getters convert.
 */
class Configuration {
public:
    Configuration() = default;

    static Configuration load_from_file(const std::filesystem::path& path);
    static Configuration parse(std::string_view text, const std::string& origin = "<memory>");

    [[nodiscard]] bool contains(std::string_view key) const;
    [[nodiscard]] std::string get_string(std::string_view key, std::string default_value = "") const;
    // true/false, yes/no, on/off and 1/0 in any case; anything else gives the default.
    [[nodiscard]] bool get_bool(std::string_view key, bool default_value = false) const;
    // Whole-value decimal integers only; "42abc" gives the default.
    [[nodiscard]] int get_int(std::string_view key, int default_value = 0) const;

    void set(std::string key, std::string value);

private:
    std::map<std::string, std::string, std::less<>> entries_;
};

[[nodiscard]] std::string trim(std::string_view text);

}  // namespace beacon::core::config
