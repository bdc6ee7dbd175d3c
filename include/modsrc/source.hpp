#pragma once

#include <modsrc/result.hpp>
#include <optional>
#include <string>

namespace modsrc {

// The grammar a module source was written in
enum class SourceKind {
    GitHub,   // github.com/<owner>/<repo>[//subdir][?ref=...]
    GitSsh,   // git@github.com:<owner>/<repo>.git[//subdir][?ref=...]
    Git,      // git::<any git URL>[//subdir][?ref=...]
};

const char* kind_name(SourceKind kind);

// Classify a raw source by prefix; nullopt for unsupported grammars.
std::optional<SourceKind> classify(const std::string& raw);

struct SubdirSplit {
    std::string path;
    std::string subdir;  // "" or "/..."
};

// Split a repository path from a module sub-directory at the first "//".
// Only the first "//" is a separator; any later ones stay in the subdir.
SubdirSplit split_subdir(const std::string& path);

// A resolved module source.
//
// Parsing normalizes its input (https is forced for github.com sources,
// paths are cleaned, the ref query is moved out of the URL), so parsing
// raw() again does not necessarily yield an equal Source.
class Source {
public:
    // Parse a Git or GitHub module source. Fails with UnsupportedSource for
    // any other grammar and InvalidSource for a malformed Git/GitHub one.
    static Result<Source> parse(const std::string& raw);

    const std::string& raw() const { return raw_; }
    SourceKind kind() const { return kind_; }

    // Fetch URL, e.g. "https://github.com/org/repo.git"
    const std::string& url() const { return url_; }

    // Domain-qualified path suitable as a directory name,
    // e.g. "github.com/org/repo" or "example.com-2222/repo"
    const std::string& path() const { return path_; }

    const std::string& subdir() const { return subdir_; }
    const std::string& ref() const { return ref_; }

    bool operator==(const Source& o) const;
    bool operator!=(const Source& o) const;

private:
    static Result<Source> parse_github(const std::string& raw);
    static Result<Source> parse_git_ssh(const std::string& raw);
    static Result<Source> parse_git(const std::string& raw);

    SourceKind kind_ = SourceKind::Git;
    std::string raw_;
    std::string url_;
    std::string path_;
    std::string subdir_;
    std::string ref_;
};

} // namespace modsrc
