#include "beacon/core/config/configuration.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace beacon::core::config {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool is_bare_key(std::string_view key) {
    return !key.empty() && std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

/**
 * @brief Single pass over the text, one line at a time.
 */
class Parser {
public:
    Parser(std::string_view text, const std::string& origin)
        : text_(text), origin_(origin) {}

    void run(Configuration& out) {
        std::size_t start = 0;
        while (start <= text_.size()) {
            const auto newline = text_.find('\n', start);
            const auto end = newline == std::string_view::npos ? text_.size() : newline;
            ++line_;
            parse_line(text_.substr(start, end - start), out);
            if (newline == std::string_view::npos) {
                break;
            }
            start = newline + 1;
        }
    }

private:
    [[noreturn]] void fail(const std::string& reason) const { throw ConfigError(origin_, line_, reason); }

    void parse_line(std::string_view raw, Configuration& out) {
        const auto line = trim(raw);
        if (line.empty() || line.front() == '#') {
            return;
        }
        if (line.front() == '[') {
            parse_header(line);
            return;
        }

        const auto equals = line.find('=');
        if (equals == std::string::npos) {
            fail("expected 'key = value'");
        }
        const auto key = trim(std::string_view{line}.substr(0, equals));
        if (!is_bare_key(key)) {
            fail("invalid key '" + key + "'");
        }
        const auto value = parse_value(std::string_view{line}.substr(equals + 1));
        out.set(table_.empty() ? key : table_ + "." + key, value);
    }

    void parse_header(const std::string& line) {
        const bool array_table = line.rfind("[[", 0) == 0;
        const std::string_view closing = array_table ? "]]" : "]";
        const auto close = line.find(closing, array_table ? 2 : 1);
        if (close == std::string::npos) {
            fail("unterminated table header");
        }
        const auto rest = trim(std::string_view{line}.substr(close + closing.size()));
        if (!rest.empty() && rest.front() != '#') {
            fail("unexpected text after table header");
        }

        const std::size_t open = array_table ? 2 : 1;
        const auto name = trim(std::string_view{line}.substr(open, close - open));
        if (!is_bare_key(name)) {
            fail("invalid table name '" + name + "'");
        }
        if (array_table) {
            table_ = name + "[" + std::to_string(array_counts_[name]++) + "]";
        } else {
            table_ = name;
        }
    }

    std::string parse_value(std::string_view raw) const {
        const auto text = trim(raw);
        if (text.empty()) {
            fail("missing value");
        }
        if (text.front() == '"' || text.front() == '\'') {
            return parse_quoted(text);
        }

        // Bare scalar: number, boolean or word, optionally followed by a comment.
        const auto hash = text.find('#');
        auto value = trim(std::string_view{text}.substr(0, hash));
        if (value.empty()) {
            fail("missing value");
        }
        return value;
    }

    std::string parse_quoted(const std::string& text) const {
        const char quote = text.front();
        std::string value;
        std::size_t i = 1;
        for (; i < text.size(); ++i) {
            const char c = text[i];
            if (c == quote) {
                break;
            }
            if (c == '\\' && quote == '"' && i + 1 < text.size()) {
                const char escaped = text[++i];
                switch (escaped) {
                    case 'n': value.push_back('\n'); break;
                    case 't': value.push_back('\t'); break;
                    default: value.push_back(escaped); break;
                }
                continue;
            }
            value.push_back(c);
        }
        if (i >= text.size()) {
            fail("unterminated string");
        }

        const auto rest = trim(std::string_view{text}.substr(i + 1));
        if (!rest.empty() && rest.front() != '#') {
            fail("unexpected text after string");
        }
        return value;
    }

    std::string_view text_;
    const std::string& origin_;
    std::size_t line_{0};
    std::string table_;
    std::unordered_map<std::string, int> array_counts_;
};

}  // namespace

ConfigError::ConfigError(const std::string& origin, std::size_t line, const std::string& reason)
    : std::runtime_error(origin + ":" + std::to_string(line) + ": " + reason), line_(line) {}

Configuration Configuration::load_from_file(const std::filesystem::path& path) {
    std::ifstream input{path};
    if (!input) {
        throw std::runtime_error("Cannot open configuration file: " + path.string());
    }
    std::ostringstream content;
    content << input.rdbuf();
    return parse(content.str(), path.string());
}

Configuration Configuration::parse(std::string_view text, const std::string& origin) {
    Configuration config;
    Parser(text, origin).run(config);
    return config;
}

bool Configuration::contains(std::string_view key) const {
    return entries_.find(key) != entries_.end();
}

std::string Configuration::get_string(std::string_view key, std::string default_value) const {
    const auto it = entries_.find(key);
    return it == entries_.end() ? default_value : it->second;
}

bool Configuration::get_bool(std::string_view key, bool default_value) const {
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return default_value;
    }
    const auto value = lowercase(it->second);
    if (value == "true" || value == "yes" || value == "on" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "off" || value == "0") {
        return false;
    }
    return default_value;
}

int Configuration::get_int(std::string_view key, int default_value) const {
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return default_value;
    }
    const auto& text = it->second;
    int value = 0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return default_value;
    }
    return value;
}

void Configuration::set(std::string key, std::string value) {
    entries_.insert_or_assign(std::move(key), std::move(value));
}

std::string trim(std::string_view text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return std::string{text.substr(begin, end - begin + 1)};
}

}  // namespace beacon::core::config
