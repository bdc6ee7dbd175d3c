#include <modsrc/url.hpp>
#include <algorithm>
#include <cctype>

#include <boost/url.hpp>

namespace modsrc {

namespace urls = boost::urls;

template<typename View>
static std::string to_std(const View& v) {
    return std::string(v.data(), v.size());
}

// ---------------------------------------------------------------------------
// Escaping
// ---------------------------------------------------------------------------

// Characters each component may carry unescaped.
static constexpr urls::grammar::lut_chars kPathChars =
    urls::unreserved_chars + urls::grammar::lut_chars("$&+,/:;=@");

// sub-delims, ':' for the port, brackets for IPv6 literals
static constexpr urls::grammar::lut_chars kHostChars =
    urls::unreserved_chars + urls::grammar::lut_chars("!$&'()*+,;=:[]<>\"");

static const urls::grammar::lut_chars& allowed_chars(Encoding mode) {
    switch (mode) {
        case Encoding::Path: return kPathChars;
        case Encoding::Host: return kHostChars;
        case Encoding::QueryComponent: break;
    }
    return urls::unreserved_chars;
}

static urls::encoding_opts encoding_for(Encoding mode) {
    urls::encoding_opts opts;
    opts.space_as_plus = mode == Encoding::QueryComponent;
    return opts;
}

Result<std::string> percent_decode(const std::string& s, Encoding mode) {
    auto pct = urls::make_pct_string_view(s);
    if (!pct) {
        return ModsrcError{ModsrcError::Parse,
            "invalid URL escape in \"" + s + "\": " + pct.error().message()};
    }

    if (mode == Encoding::Host) {
        for (char c : s) {
            if (c != '%' && static_cast<unsigned char>(c) < 0x80 && !kHostChars(c)) {
                return ModsrcError{ModsrcError::Parse,
                    "invalid character \"" + std::string(1, c) + "\" in host name"};
            }
        }
    }

    return Result<std::string>::ok(pct->decode(encoding_for(mode)));
}

std::string percent_encode(const std::string& s, Encoding mode) {
    return urls::encode(s, allowed_chars(mode), encoding_for(mode));
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

static bool has_control_byte(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](char ch) {
        unsigned char c = static_cast<unsigned char>(ch);
        return c < 0x20 || c == 0x7f;
    });
}

Result<Url> Url::parse(const std::string& raw) {
    // Checked up front: the query below never goes through the URL grammar
    if (has_control_byte(raw)) {
        return ModsrcError{ModsrcError::Parse, "invalid control character in URL"};
    }

    Url u;
    std::string rest = raw;

    auto hash = rest.find('#');
    if (hash != std::string::npos) {
        std::string frag = rest.substr(hash + 1);
        MODSRC_TRY(percent_decode(frag, Encoding::Path));
        u.fragment = std::move(frag);
        rest.resize(hash);
    }

    // The query is split off by hand so that a malformed pair only costs
    // that pair, not the whole URL.
    if (!rest.empty() && rest.back() == '?' &&
        std::count(rest.begin(), rest.end(), '?') == 1) {
        u.force_query = true;
        rest.pop_back();
    } else {
        auto q = rest.find('?');
        if (q != std::string::npos) {
            u.raw_query = rest.substr(q + 1);
            rest.resize(q);
        }
    }

    auto parsed = urls::parse_uri_reference(rest);
    if (!parsed) {
        return ModsrcError{ModsrcError::Parse,
            "invalid URL \"" + rest + "\": " + parsed.error().message()};
    }
    urls::url_view view = *parsed;

    if (view.has_scheme()) {
        u.scheme = to_std(view.scheme());
        std::transform(u.scheme.begin(), u.scheme.end(), u.scheme.begin(),
                       [](unsigned char x) { return static_cast<char>(std::tolower(x)); });
    }

    if (view.has_authority()) {
        if (view.has_userinfo()) {
            u.userinfo = to_std(view.encoded_userinfo());
            u.has_userinfo = true;
        }
        auto host = percent_decode(to_std(view.encoded_host_and_port()), Encoding::Host);
        if (host.is_err()) return std::move(host).error();
        u.host = std::move(host).value();
    } else if (view.has_scheme()) {
        if (!view.is_path_absolute()) {
            // "scheme:opaque", nothing more to split
            u.opaque = to_std(view.encoded_path());
            return Result<Url>::ok(std::move(u));
        }
        u.omit_host = true;
    }

    u.path = view.path();
    return Result<Url>::ok(std::move(u));
}

// ---------------------------------------------------------------------------
// Serialization and queries
// ---------------------------------------------------------------------------

std::string Url::escaped_path() const {
    return percent_encode(path, Encoding::Path);
}

std::string Url::to_string() const {
    std::string buf;

    if (!scheme.empty()) {
        buf += scheme;
        buf += ':';
    }

    if (!opaque.empty()) {
        buf += opaque;
    } else {
        if (!scheme.empty() || !host.empty() || has_userinfo) {
            if (!(omit_host && host.empty() && !has_userinfo)) {
                if (!host.empty() || !path.empty() || has_userinfo) {
                    buf += "//";
                }
                if (has_userinfo) {
                    buf += userinfo;
                    buf += '@';
                }
                buf += percent_encode(host, Encoding::Host);
            }
        }

        std::string p = escaped_path();
        if (!p.empty() && p[0] != '/' && !host.empty()) {
            buf += '/';
        }
        if (buf.empty()) {
            // keep "a:b/c" from reading back as scheme "a"
            auto segment = p.substr(0, p.find('/'));
            if (segment.find(':') != std::string::npos) {
                buf += "./";
            }
        }
        buf += p;
    }

    if (force_query || !raw_query.empty()) {
        buf += '?';
        buf += raw_query;
    }

    if (!fragment.empty()) {
        buf += '#';
        buf += fragment;
    }

    return buf;
}

static bool find_query_value(const std::string& raw_query, const std::string& key,
                             std::string& out) {
    urls::encoding_opts form = encoding_for(Encoding::QueryComponent);

    size_t start = 0;
    while (start <= raw_query.size()) {
        auto amp = raw_query.find('&', start);
        std::string pair = raw_query.substr(start, amp == std::string::npos
                                                       ? std::string::npos
                                                       : amp - start);
        start = amp == std::string::npos ? raw_query.size() + 1 : amp + 1;

        if (pair.empty() || pair.find(';') != std::string::npos) continue;

        auto params = urls::parse_query(pair);
        if (!params) continue;

        for (auto param : *params) {
            if (param.key.decode(form) != key) continue;
            out = param.has_value ? param.value.decode(form) : std::string();
            return true;
        }
    }
    return false;
}

std::string Url::query_value(const std::string& key) const {
    std::string value;
    find_query_value(raw_query, key, value);
    return value;
}

bool Url::has_query_value(const std::string& key) const {
    std::string ignored;
    return find_query_value(raw_query, key, ignored);
}

} // namespace modsrc
