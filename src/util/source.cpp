#include <modsrc/source.hpp>
#include <modsrc/path.hpp>
#include <modsrc/url.hpp>
#include <algorithm>

namespace modsrc {

static const std::string kGitHubPrefix = "github.com";
static const std::string kGitSshPrefix = "git@";
static const std::string kGitPrefix = "git::";

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

static std::string trim_suffix(const std::string& s, const std::string& suffix) {
    if (s.size() >= suffix.size() &&
        s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return s.substr(0, s.size() - suffix.size());
    }
    return s;
}

static ModsrcError missing_path(const std::string& raw) {
    auto err = ModsrcError::source(ModsrcError::InvalidSource,
        "source '" + raw + "' is missing the path component", raw);
    err.hint = "a module source must name a repository, e.g. github.com/<owner>/<repo>";
    return err;
}

// The on-disk path of a source lives below a directory named after its
// host. Dot segments in the repository path may not climb out of it.
static Status check_source_path(const std::string& raw, const std::string& domain,
                                const std::string& path) {
    if (path.empty()) return missing_path(raw);

    bool escapes;
    if (domain.empty()) {
        escapes = path == "." || path == ".." || starts_with(path, "../");
    } else {
        std::string root = clean_path(domain);
        if (path == root) return missing_path(raw);
        escapes = !starts_with(path, root + "/");
    }

    if (escapes) {
        auto err = ModsrcError::source(ModsrcError::InvalidSource,
            "source '" + raw + "' resolves outside of " +
            (domain.empty() ? std::string("its directory") : "'" + domain + "'"), raw);
        err.hint = "remove the '..' segments from the repository path";
        return err;
    }
    return ok_status();
}

const char* kind_name(SourceKind kind) {
    switch (kind) {
        case SourceKind::GitHub: return "github";
        case SourceKind::GitSsh: return "git-ssh";
        case SourceKind::Git:    return "git";
    }
    return "unknown";
}

std::optional<SourceKind> classify(const std::string& raw) {
    if (starts_with(raw, kGitHubPrefix)) return SourceKind::GitHub;
    if (starts_with(raw, kGitSshPrefix)) return SourceKind::GitSsh;
    if (starts_with(raw, kGitPrefix)) return SourceKind::Git;
    return std::nullopt;
}

SubdirSplit split_subdir(const std::string& path) {
    auto sep = path.find("//");
    if (sep == std::string::npos) {
        return SubdirSplit{path, ""};
    }

    std::string after = path.substr(sep + 2);
    if (after.empty()) {
        return SubdirSplit{path.substr(0, sep), ""};
    }
    return SubdirSplit{path.substr(0, sep), "/" + after};
}

Result<Source> Source::parse(const std::string& raw) {
    auto kind = classify(raw);
    if (!kind.has_value()) {
        auto err = ModsrcError::source(ModsrcError::UnsupportedSource,
            "unsupported module source '" + raw + "'", raw);
        err.hint = "supported forms: github.com/<owner>/<repo>, "
                   "git@github.com:<owner>/<repo>.git, git::<url>";
        return err;
    }

    switch (kind.value()) {
        case SourceKind::GitHub: return parse_github(raw);
        case SourceKind::GitSsh: return parse_git_ssh(raw);
        case SourceKind::Git:    return parse_git(raw);
    }

    return ModsrcError::source(ModsrcError::UnsupportedSource,
        "unsupported module source '" + raw + "'", raw);
}

// github.com/org/repo[.git][//subdir][?ref=x]
// Always fetched over https, whatever the input looked like.
Result<Source> Source::parse_github(const std::string& raw) {
    auto parsed = Url::parse(raw);
    if (parsed.is_err()) {
        return ModsrcError::source(ModsrcError::InvalidSource,
            "'" + raw + "' is not a URL", raw, parsed.error().message);
    }
    Url u = std::move(parsed).value();

    if (!u.host.empty() || u.has_userinfo) {
        auto err = ModsrcError::source(ModsrcError::InvalidSource,
            "source '" + raw + "' names host '" + u.host + "' after github.com", raw);
        err.hint = "write github.com sources as github.com/<owner>/<repo>";
        return err;
    }

    Source src;
    src.kind_ = SourceKind::GitHub;
    src.raw_ = raw;
    src.ref_ = u.query_value("ref");

    auto split = split_subdir(u.path);
    src.subdir_ = std::move(split.subdir);

    u.raw_query.clear();
    u.force_query = false;
    u.fragment.clear();
    u.scheme = "https";
    u.path = trim_suffix(split.path, ".git");

    src.path_ = join_path({u.path});
    MODSRC_TRY(check_source_path(raw, raw.substr(0, raw.find_first_of("/:?#")), src.path_));

    src.url_ = u.to_string() + ".git";
    return Result<Source>::ok(std::move(src));
}

// git@github.com:org/repo.git[//subdir][?ref=x]
//
// Not a URL, but after dropping "git@" the URL parser reads the host as a
// scheme and the repository path as the opaque part, which is all we need
// to split off the query and subdir. The URL stays in scp form.
Result<Source> Source::parse_git_ssh(const std::string& raw) {
    std::string rest = raw.substr(kGitSshPrefix.size());

    auto parsed = Url::parse(rest);
    if (parsed.is_err()) {
        return ModsrcError::source(ModsrcError::InvalidSource,
            "invalid URL inside '" + raw + "'", raw, parsed.error().message);
    }
    Url u = std::move(parsed).value();

    // git@host:/abs/path parses with the path rooted instead of opaque
    if (u.opaque.empty() && u.omit_host) {
        u.opaque = u.escaped_path();
        u.path.clear();
        u.omit_host = false;
    }

    if (u.scheme.empty() || u.opaque.empty()) {
        auto err = ModsrcError::source(ModsrcError::InvalidSource,
            "'" + raw + "' is not an scp-like git reference", raw);
        err.hint = "expected git@github.com:<owner>/<repo>.git";
        return err;
    }

    Source src;
    src.kind_ = SourceKind::GitSsh;
    src.raw_ = raw;
    src.ref_ = u.query_value("ref");

    u.raw_query.clear();
    u.force_query = false;
    u.fragment.clear();

    auto split = split_subdir(u.opaque);
    src.subdir_ = std::move(split.subdir);
    u.opaque = std::move(split.path);

    auto repo = percent_decode(u.opaque, Encoding::Path);
    if (repo.is_err()) {
        return ModsrcError::source(ModsrcError::InvalidSource,
            "invalid URL inside '" + raw + "'", raw, repo.error().message);
    }
    src.path_ = trim_suffix(join_path({u.scheme, repo.value()}), ".git");
    MODSRC_TRY(check_source_path(raw, u.scheme, src.path_));

    src.url_ = kGitSshPrefix + u.to_string();
    return Result<Source>::ok(std::move(src));
}

// git::<scheme>://[user@]host[:port]/path[.git][//subdir][?ref=x]
// The scheme is kept as written so any git transport works.
Result<Source> Source::parse_git(const std::string& raw) {
    std::string rest = raw.substr(kGitPrefix.size());

    auto parsed = Url::parse(rest);
    if (parsed.is_err()) {
        return ModsrcError::source(ModsrcError::InvalidSource,
            "invalid git URL in '" + raw + "'", raw, parsed.error().message);
    }
    Url u = std::move(parsed).value();

    if (u.path.empty()) return missing_path(raw);

    Source src;
    src.kind_ = SourceKind::Git;
    src.raw_ = raw;
    src.ref_ = u.query_value("ref");

    auto split = split_subdir(u.path);
    src.subdir_ = std::move(split.subdir);
    u.path = std::move(split.path);

    // ':' from host:port is not safe inside a directory name
    std::string host = u.host;
    std::replace(host.begin(), host.end(), ':', '-');
    src.path_ = trim_suffix(join_path({host, u.path}), ".git");
    MODSRC_TRY(check_source_path(raw, host, src.path_));

    u.raw_query.clear();
    u.force_query = false;
    u.fragment.clear();

    src.url_ = u.to_string();
    return Result<Source>::ok(std::move(src));
}

bool Source::operator==(const Source& o) const {
    return kind_ == o.kind_ && raw_ == o.raw_ && url_ == o.url_ &&
           path_ == o.path_ && subdir_ == o.subdir_ && ref_ == o.ref_;
}

bool Source::operator!=(const Source& o) const {
    return !(*this == o);
}

} // namespace modsrc
