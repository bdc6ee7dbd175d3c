#pragma once

#include <modsrc/result.hpp>
#include <modsrc/source.hpp>
#include <string>
#include <vector>

namespace modsrc {

// One [[module]] entry: a name and its unparsed source string
struct ModuleDecl {
    std::string name;
    std::string source;
};

struct ResolvedModule {
    std::string name;
    Source source;
};

// Outcome for a single module when resolving everything
struct ModuleOutcome {
    std::string name;
    Result<Source> result;
};

// A TOML list of named module sources:
//
//   [[module]]
//   name = "vpc"
//   source = "github.com/org/vpc//modules/vpc?ref=v1.2.0"
//
// Entries keep their file order; names must be unique.
struct ModuleList {
    std::vector<ModuleDecl> modules;

    static Result<ModuleList> parse(const std::string& toml_str);
    static Result<ModuleList> load(const std::string& path);

    // Parse every source, stopping at the first failure
    Result<std::vector<ResolvedModule>> resolve() const;

    // Parse every source, keeping each module's own outcome
    std::vector<ModuleOutcome> resolve_all() const;
};

} // namespace modsrc
