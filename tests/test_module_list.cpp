#include <catch2/catch.hpp>
#include <modsrc/module_list.hpp>
#include "support/sandbox_git.hpp"

using namespace modsrc;

static const char* kModules = R"(
[[module]]
name = "vpc"
source = "github.com/org/vpc//modules/vpc?ref=v1.2.0"

[[module]]
name = "dns"
source = "git@github.com:org/dns.git?ref=main"

[[module]]
name = "bastion"
source = "git::ssh://git@git.example.com:2222/infra/bastion.git"
)";

// ===== Parsing =====

TEST_CASE("parse module list keeps order", "[modules]") {
    auto r = ModuleList::parse(kModules);
    REQUIRE(r.is_ok());
    const auto& mods = r.value().modules;
    REQUIRE(mods.size() == 3);
    REQUIRE(mods[0].name == "vpc");
    REQUIRE(mods[1].name == "dns");
    REQUIRE(mods[2].name == "bastion");
    REQUIRE(mods[2].source == "git::ssh://git@git.example.com:2222/infra/bastion.git");
}

TEST_CASE("parse empty module list", "[modules]") {
    auto r = ModuleList::parse("");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().modules.empty());
}

TEST_CASE("parse invalid TOML module list", "[modules]") {
    REQUIRE(ModuleList::parse("[[module]\nname = ").is_err(ModsrcError::Parse));
}

TEST_CASE("module must be an array of tables", "[modules]") {
    auto r = ModuleList::parse("module = \"github.com/org/repo\"\n");
    REQUIRE(r.is_err(ModsrcError::Manifest));
}

TEST_CASE("module entry without name", "[modules]") {
    auto r = ModuleList::parse("[[module]]\nsource = \"github.com/org/repo\"\n");
    REQUIRE(r.is_err(ModsrcError::Manifest));
    REQUIRE(r.error().message.find("module #1 has no name") != std::string::npos);
}

TEST_CASE("module entry without source", "[modules]") {
    auto r = ModuleList::parse("[[module]]\nname = \"vpc\"\n");
    REQUIRE(r.is_err(ModsrcError::Manifest));
    REQUIRE(r.error().message.find("'vpc' has no source") != std::string::npos);
}

TEST_CASE("module entry that is not a table", "[modules]") {
    auto r = ModuleList::parse("module = [\"github.com/org/repo\"]\n");
    REQUIRE(r.is_err(ModsrcError::Manifest));
    REQUIRE(r.error().message.find("must be a table") != std::string::npos);
}

TEST_CASE("duplicate module names", "[modules]") {
    auto r = ModuleList::parse(R"(
[[module]]
name = "vpc"
source = "github.com/org/vpc"

[[module]]
name = "vpc"
source = "github.com/org/vpc2"
)");
    REQUIRE(r.is_err(ModsrcError::Duplicate));
}

// ===== Resolving =====

TEST_CASE("resolve every module", "[modules]") {
    auto list = ModuleList::parse(kModules).value();
    auto r = list.resolve();
    REQUIRE(r.is_ok());
    const auto& mods = r.value();
    REQUIRE(mods.size() == 3);

    REQUIRE(mods[0].name == "vpc");
    REQUIRE(mods[0].source.url() == "https://github.com/org/vpc.git");
    REQUIRE(mods[0].source.subdir() == "/modules/vpc");
    REQUIRE(mods[0].source.ref() == "v1.2.0");

    REQUIRE(mods[1].source.kind() == SourceKind::GitSsh);
    REQUIRE(mods[1].source.path() == "github.com/org/dns");

    REQUIRE(mods[2].source.path() == "git.example.com-2222/infra/bastion");
}

TEST_CASE("resolve stops at the first bad module", "[modules]") {
    auto list = ModuleList::parse(R"(
[[module]]
name = "ok"
source = "github.com/org/ok"

[[module]]
name = "local"
source = "./modules/local"

[[module]]
name = "broken"
source = "git::https://example.com"
)").value();

    auto r = list.resolve();
    REQUIRE(r.is_err(ModsrcError::UnsupportedSource));
    REQUIRE(r.error().message.find("module 'local'") == 0);
    REQUIRE(r.error().input == "./modules/local");
}

TEST_CASE("resolve_all reports each module", "[modules]") {
    auto list = ModuleList::parse(R"(
[[module]]
name = "ok"
source = "github.com/org/ok"

[[module]]
name = "local"
source = "./modules/local"

[[module]]
name = "broken"
source = "git::https://example.com"
)").value();

    auto outcomes = list.resolve_all();
    REQUIRE(outcomes.size() == 3);
    REQUIRE(outcomes[0].result.is_ok());
    REQUIRE(outcomes[1].name == "local");
    REQUIRE(outcomes[1].result.is_err(ModsrcError::UnsupportedSource));
    REQUIRE(outcomes[2].result.is_err(ModsrcError::InvalidSource));
}

// ===== Loading =====

TEST_CASE("load module list from file", "[modules]") {
    test::TempDir td("modules");
    auto path = td.write_file("modules.toml", kModules);
    auto r = ModuleList::load(path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().modules.size() == 3);
}

TEST_CASE("load missing module list", "[modules]") {
    REQUIRE(ModuleList::load("/nonexistent/modules.toml").is_err(ModsrcError::IO));
}
