#include <modsrc/path.hpp>

namespace modsrc {

std::string clean_path(const std::string& path) {
    if (path.empty()) return ".";

    bool rooted = path[0] == '/';
    std::vector<std::string> segments;

    size_t start = 0;
    while (start <= path.size()) {
        auto slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        std::string seg = path.substr(start, slash - start);
        start = slash + 1;

        if (seg.empty() || seg == ".") continue;

        if (seg == "..") {
            if (!segments.empty() && segments.back() != "..") {
                segments.pop_back();
            } else if (!rooted) {
                segments.push_back(seg);
            }
            continue;
        }

        segments.push_back(std::move(seg));
    }

    std::string out = rooted ? "/" : "";
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) out += '/';
        out += segments[i];
    }

    return out.empty() ? "." : out;
}

std::string join_path(const std::vector<std::string>& parts) {
    std::string joined;
    for (const auto& p : parts) {
        if (p.empty()) continue;
        if (!joined.empty()) joined += '/';
        joined += p;
    }
    if (joined.empty()) return "";
    return clean_path(joined);
}

} // namespace modsrc
