#pragma once

#include <modsrc/result.hpp>
#include <string>

namespace modsrc {

// Which URL component a string is being escaped for.
// Each component tolerates a different set of reserved characters.
enum class Encoding {
    Path,
    Host,
    QueryComponent,
};

// Decode %XX escapes. In QueryComponent mode '+' decodes to a space.
// Fails on a truncated or non-hex escape, and in Host mode on any
// character a host name cannot contain.
Result<std::string> percent_decode(const std::string& s, Encoding mode);

// Inverse of percent_decode() for the given component.
std::string percent_encode(const std::string& s, Encoding mode);

// A parsed URL reference:
//
//   [scheme:][//[userinfo@]host][/]path[?query][#fragment]
//   scheme:opaque[?query][#fragment]
//
// A scheme is any [A-Za-z][A-Za-z0-9+.-]* followed by ':', which is what
// lets "github.com:org/repo.git" parse as scheme "github.com" with an
// opaque part. The query is kept raw and only split into pairs by
// query_value().
struct Url {
    std::string scheme;     // lowercased
    std::string opaque;     // encoded
    std::string userinfo;   // encoded, without the trailing '@'
    std::string host;       // host or host:port
    std::string path;       // decoded
    std::string raw_query;  // encoded, without the leading '?'
    std::string fragment;   // encoded, without the leading '#'
    bool has_userinfo = false;
    bool force_query = false;  // trailing '?' with an empty query
    bool omit_host = false;    // "scheme:/path" with no "//"

    static Result<Url> parse(const std::string& raw);

    // Serialize back to a URL string. The path is re-escaped.
    std::string to_string() const;
    std::string escaped_path() const;

    // First value of the query parameter `key`, or "" if absent.
    // Malformed pairs in the query are skipped.
    std::string query_value(const std::string& key) const;

    bool has_query_value(const std::string& key) const;
};

} // namespace modsrc
