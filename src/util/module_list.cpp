#include <modsrc/module_list.hpp>
#include <modsrc/log.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace modsrc {

static Result<ModuleDecl> parse_module(size_t index, const toml::node& node) {
    std::string where = "module #" + std::to_string(index + 1);

    if (!node.is_table()) {
        return ModsrcError{ModsrcError::Manifest, where + " must be a table"};
    }
    const auto& tbl = *node.as_table();

    ModuleDecl decl;
    if (auto v = tbl["name"].value<std::string>()) {
        decl.name = *v;
    }
    if (decl.name.empty()) {
        return ModsrcError{ModsrcError::Manifest,
            where + " has no name",
            "add name = \"<module name>\""};
    }

    if (auto v = tbl["source"].value<std::string>()) {
        decl.source = *v;
    }
    if (decl.source.empty()) {
        return ModsrcError{ModsrcError::Manifest,
            "module '" + decl.name + "' has no source",
            "add source = \"github.com/<owner>/<repo>\""};
    }

    return Result<ModuleDecl>::ok(std::move(decl));
}

Result<ModuleList> ModuleList::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return ModsrcError{ModsrcError::Parse,
            std::string("module list TOML parse error: ") + e.what()};
    }

    ModuleList list;
    auto node = doc["module"];
    if (!node) {
        return Result<ModuleList>::ok(std::move(list));
    }

    auto arr = node.as_array();
    if (!arr) {
        return ModsrcError{ModsrcError::Manifest,
            "'module' must be an array of tables",
            "declare modules with [[module]]"};
    }

    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < arr->size(); ++i) {
        auto decl = parse_module(i, *arr->get(i));
        if (decl.is_err()) return std::move(decl).error();

        if (!seen.insert(decl.value().name).second) {
            return ModsrcError{ModsrcError::Duplicate,
                "module '" + decl.value().name + "' is declared more than once"};
        }
        list.modules.push_back(std::move(decl).value());
    }

    return Result<ModuleList>::ok(std::move(list));
}

Result<ModuleList> ModuleList::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return ModsrcError{ModsrcError::IO,
            "cannot open module list: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    log::debug("loading module list %s", path.c_str());
    auto list = ModuleList::parse(ss.str());
    if (list.is_err()) {
        auto err = std::move(list).error();
        err.message = path + ": " + err.message;
        return err;
    }
    log::debug("%zu module(s) declared in %s", list.value().modules.size(), path.c_str());
    return list;
}

Result<std::vector<ResolvedModule>> ModuleList::resolve() const {
    std::vector<ResolvedModule> resolved;
    resolved.reserve(modules.size());

    for (const auto& decl : modules) {
        auto src = Source::parse(decl.source);
        if (src.is_err()) {
            auto err = std::move(src).error();
            err.message = "module '" + decl.name + "': " + err.message;
            return err;
        }
        resolved.push_back(ResolvedModule{decl.name, std::move(src).value()});
    }

    return Result<std::vector<ResolvedModule>>::ok(std::move(resolved));
}

std::vector<ModuleOutcome> ModuleList::resolve_all() const {
    std::vector<ModuleOutcome> outcomes;
    outcomes.reserve(modules.size());
    for (const auto& decl : modules) {
        outcomes.push_back(ModuleOutcome{decl.name, Source::parse(decl.source)});
    }
    return outcomes;
}

} // namespace modsrc
