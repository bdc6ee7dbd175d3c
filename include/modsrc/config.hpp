#pragma once

#include <modsrc/log.hpp>
#include <modsrc/result.hpp>
#include <optional>
#include <string>

namespace modsrc {

enum class OutputFormat { Text, Toml };

const char* format_name(OutputFormat fmt);
Result<OutputFormat> parse_output_format(const std::string& name);

// [log] section
struct LogConfig {
    log::Level level = log::Info;
    std::optional<bool> color;  // unset: decided by isatty(stderr)
};

// [output] section
struct OutputConfig {
    OutputFormat format = OutputFormat::Text;
};

// Layered configuration: global (~/.modsrc/config.toml), then the project
// file (.modsrc.toml). Later layers override only the keys they set.
struct Config {
    LogConfig logging;
    OutputConfig output;
    // Track which fields were explicitly set (for merge)
    bool log_level_set = false;
    bool output_format_set = false;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);
};

// ~/.modsrc/config.toml, or "" when HOME is unset
std::string global_config_path();

// Project-level config file name, looked up in the working directory
inline const char* local_config_name() { return ".modsrc.toml"; }

} // namespace modsrc
