#include <modsrc/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace modsrc {

const char* format_name(OutputFormat fmt) {
    switch (fmt) {
        case OutputFormat::Text: return "text";
        case OutputFormat::Toml: return "toml";
    }
    return "unknown";
}

Result<OutputFormat> parse_output_format(const std::string& name) {
    if (name == "text") return Result<OutputFormat>::ok(OutputFormat::Text);
    if (name == "toml") return Result<OutputFormat>::ok(OutputFormat::Toml);
    return ModsrcError{ModsrcError::Config,
        "unknown output format '" + name + "'",
        "expected one of: text, toml"};
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return ModsrcError{ModsrcError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [log] section
    if (auto section = doc["log"].as_table()) {
        if (auto v = (*section)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            if (lvl.is_err()) return std::move(lvl).error();
            cfg.logging.level = lvl.value();
            cfg.log_level_set = true;
        }
        if (auto v = (*section)["color"].value<bool>()) {
            cfg.logging.color = *v;
        }
    }

    // [output] section
    if (auto section = doc["output"].as_table()) {
        if (auto v = (*section)["format"].value<std::string>()) {
            auto fmt = parse_output_format(*v);
            if (fmt.is_err()) return std::move(fmt).error();
            cfg.output.format = fmt.value();
            cfg.output_format_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return ModsrcError{ModsrcError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        auto err = std::move(cfg).error();
        err.message = path + ": " + err.message;
        return err;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        logging.level = other.logging.level;
        log_level_set = true;
    }
    if (other.logging.color.has_value()) {
        logging.color = other.logging.color;
    }
    if (other.output_format_set) {
        output.format = other.output.format;
        output_format_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                          const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.modsrc/config.toml";
}

} // namespace modsrc
