// modsrc: resolve module source references from the command line.
//
//     modsrc parse github.com/org/repo//modules/vpc?ref=v1.2.0
//     modsrc --format toml parse git::ssh://git@example.com:2222/infra.git
//     modsrc check modules.toml

#include <modsrc/config.hpp>
#include <modsrc/log.hpp>
#include <modsrc/module_list.hpp>
#include <modsrc/source.hpp>

#include <toml++/toml.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace modsrc;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

const char* kUsage =
    "usage: modsrc [options] parse <source>...\n"
    "       modsrc [options] check <modules.toml>\n"
    "\n"
    "options:\n"
    "  -v, --verbose        log debug messages\n"
    "  -q, --quiet          log errors only\n"
    "      --color          force colored log output\n"
    "      --no-color       disable colored log output\n"
    "      --format <fmt>   output format: text | toml\n"
    "      --config <file>  use <file> instead of ./.modsrc.toml\n"
    "  -h, --help           show this message\n";

struct Options {
    std::optional<log::Level> level;
    std::optional<bool> color;
    std::optional<OutputFormat> format;
    std::optional<std::string> config_path;
    std::string command;
    std::vector<std::string> args;
    bool help = false;
};

Result<Options> parse_args(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (!opts.command.empty()) {
            opts.args.push_back(std::move(arg));
            continue;
        }

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.level = log::Debug;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.level = log::Error;
        } else if (arg == "--color") {
            opts.color = true;
        } else if (arg == "--no-color") {
            opts.color = false;
        } else if (arg == "--format" || arg == "--config") {
            if (i + 1 >= argc) {
                return ModsrcError{ModsrcError::InvalidArg,
                    "option " + arg + " requires a value"};
            }
            std::string value = argv[++i];
            if (arg == "--config") {
                opts.config_path = std::move(value);
            } else {
                auto fmt = parse_output_format(value);
                if (fmt.is_err()) return std::move(fmt).error();
                opts.format = fmt.value();
            }
        } else if (!arg.empty() && arg[0] == '-') {
            return ModsrcError{ModsrcError::InvalidArg,
                "unknown option '" + arg + "'", "see modsrc --help"};
        } else {
            opts.command = std::move(arg);
        }
    }
    return Result<Options>::ok(std::move(opts));
}

Result<Config> load_config(const Options& opts) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    if (!global_path.empty() && fs::exists(global_path)) {
        auto cfg = Config::load(global_path);
        if (cfg.is_err()) return std::move(cfg).error();
        global = std::move(cfg).value();
    }

    std::optional<Config> local;
    if (opts.config_path.has_value()) {
        auto cfg = Config::load(opts.config_path.value());
        if (cfg.is_err()) return std::move(cfg).error();
        local = std::move(cfg).value();
    } else if (fs::exists(local_config_name())) {
        auto cfg = Config::load(local_config_name());
        if (cfg.is_err()) return std::move(cfg).error();
        local = std::move(cfg).value();
    }

    return Result<Config>::ok(Config::effective(global, local));
}

toml::table source_table(const Source& src) {
    return toml::table{
        {"raw", src.raw()},
        {"kind", kind_name(src.kind())},
        {"url", src.url()},
        {"path", src.path()},
        {"subdir", src.subdir()},
        {"ref", src.ref()},
    };
}

void print_text(const Source& src, const std::string& title) {
    std::cout << title << "\n"
              << "  kind:   " << kind_name(src.kind()) << "\n"
              << "  url:    " << src.url() << "\n"
              << "  path:   " << src.path() << "\n";
    if (!src.subdir().empty()) std::cout << "  subdir: " << src.subdir() << "\n";
    if (!src.ref().empty()) std::cout << "  ref:    " << src.ref() << "\n";
}

int cmd_parse(const std::vector<std::string>& sources, OutputFormat format) {
    if (sources.empty()) {
        log::error("%s", ModsrcError{ModsrcError::InvalidArg,
            "parse needs at least one source"}.format().c_str());
        return kExitUsage;
    }

    int status = kExitOk;
    toml::array out;
    for (const auto& raw : sources) {
        auto src = Source::parse(raw);
        if (src.is_err()) {
            log::error("%s", src.error().format().c_str());
            status = kExitFailed;
            continue;
        }
        log::debug("'%s' is a %s source", raw.c_str(), kind_name(src.value().kind()));

        if (format == OutputFormat::Toml) {
            out.push_back(source_table(src.value()));
        } else {
            print_text(src.value(), raw);
        }
    }

    if (format == OutputFormat::Toml && !out.empty()) {
        std::cout << toml::table{{"source", std::move(out)}} << "\n";
    }
    return status;
}

int cmd_check(const std::vector<std::string>& args, OutputFormat format) {
    if (args.size() != 1) {
        log::error("%s", ModsrcError{ModsrcError::InvalidArg,
            "check takes exactly one module list file"}.format().c_str());
        return kExitUsage;
    }

    auto list = ModuleList::load(args[0]);
    if (list.is_err()) {
        log::error("%s", list.error().format().c_str());
        return kExitFailed;
    }

    size_t failed = 0;
    toml::array out;
    for (auto& outcome : list.value().resolve_all()) {
        if (outcome.result.is_err()) {
            ++failed;
            auto err = std::move(outcome.result).error();
            err.message = "module '" + outcome.name + "': " + err.message;
            log::error("%s", err.format().c_str());
            continue;
        }

        const Source& src = outcome.result.value();
        if (format == OutputFormat::Toml) {
            auto tbl = source_table(src);
            tbl.insert("name", outcome.name);
            out.push_back(std::move(tbl));
        } else {
            print_text(src, outcome.name);
        }
    }

    if (format == OutputFormat::Toml && !out.empty()) {
        std::cout << toml::table{{"module", std::move(out)}} << "\n";
    }

    size_t total = list.value().modules.size();
    if (failed > 0) {
        log::warn("%zu of %zu module(s) failed to resolve", failed, total);
        return kExitFailed;
    }
    log::info("resolved %zu module(s)", total);
    return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
    auto parsed = parse_args(argc, argv);
    if (parsed.is_err()) {
        log::error("%s", parsed.error().format().c_str());
        return kExitUsage;
    }
    const Options& opts = parsed.value();

    if (opts.help || opts.command.empty()) {
        std::cerr << kUsage;
        return opts.help ? kExitOk : kExitUsage;
    }

    auto cfg = load_config(opts);
    if (cfg.is_err()) {
        log::error("%s", cfg.error().format().c_str());
        return kExitUsage;
    }
    const Config& config = cfg.value();

    log::set_level(opts.level.value_or(config.logging.level));
    if (opts.color.has_value()) {
        log::set_color_enabled(opts.color.value());
    } else if (config.logging.color.has_value()) {
        log::set_color_enabled(config.logging.color.value());
    }
    OutputFormat format = opts.format.value_or(config.output.format);

    if (opts.command == "parse") return cmd_parse(opts.args, format);
    if (opts.command == "check") return cmd_check(opts.args, format);

    log::error("%s", ModsrcError{ModsrcError::InvalidArg,
        "unknown command '" + opts.command + "'", "see modsrc --help"}.format().c_str());
    return kExitUsage;
}
