#ifndef SHELLAC_UTILS_HPP
#define SHELLAC_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace shellac::utils {

inline std::size_t levenshteinDistance(std::string_view a, std::string_view b) {
    const std::size_t n = a.size();
    const std::size_t m = b.size();
    if (n == 0) return m;
    if (m == 0) return n;

    std::vector<std::size_t> prev(m + 1), cur(m + 1);
    for (std::size_t j = 0; j <= m; ++j) prev[j] = j;

    for (std::size_t i = 1; i <= n; ++i) {
        cur[0] = i;
        for (std::size_t j = 1; j <= m; ++j) {
            const std::size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
        }
        prev.swap(cur);
    }
    return prev[m];
}

inline std::vector<std::string> suggest(std::string_view input,
                                        const std::vector<std::string>& candidates,
                                        std::size_t maxResults = 3,
                                        std::size_t maxDistance = 2) {
    struct Scored {
        std::string value;
        std::size_t score;
    };

    std::vector<Scored> scored;
    scored.reserve(candidates.size());
    for (const auto& c : candidates) {
        if (c.empty()) continue;
        if (c.rfind(input, 0) == 0) {
            scored.push_back({c, 0});
            continue;
        }
        scored.push_back({c, levenshteinDistance(input, c)});
    }

    std::sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b) {
        if (a.score != b.score) return a.score < b.score;
        return a.value < b.value;
    });

    std::vector<std::string> out;
    out.reserve(maxResults);
    for (const auto& s : scored) {
        if (out.size() >= maxResults) break;
        if (s.score <= maxDistance) out.push_back(s.value);
    }
    return out;
}

inline bool startsWith(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline std::string_view trim(std::string_view s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

inline std::string replaceAll(std::string s, std::string_view from, std::string_view to) {
    if (from.empty()) return s;
    std::size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

// Shell-word splitting for the COMP_WORDS line the completion scripts export.
// Quoted words ('...' or "...") lose their quotes and have backslash escapes resolved;
// an unterminated quote degrades to a plain word.
inline std::vector<std::string> splitArgString(std::string_view line) {
    auto unescape = [](std::string_view body) {
        std::string out;
        out.reserve(body.size());
        for (std::size_t i = 0; i < body.size(); ++i) {
            const char ch = body[i];
            if (ch != '\\' || i + 1 >= body.size()) {
                out.push_back(ch);
                continue;
            }
            const char next = body[++i];
            switch (next) {
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                case 'r': out.push_back('\r'); break;
                case '\\': out.push_back('\\'); break;
                case '\'': out.push_back('\''); break;
                case '"': out.push_back('"'); break;
                default:
                    out.push_back('\\');
                    out.push_back(next);
                    break;
            }
        }
        return out;
    };

    std::vector<std::string> out;
    std::size_t i = 0;
    const std::size_t n = line.size();
    while (i < n) {
        while (i < n && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
        if (i >= n) break;

        const char quote = line[i];
        if (quote == '\'' || quote == '"') {
            std::size_t j = i + 1;
            while (j < n && line[j] != quote) {
                if (line[j] == '\\' && j + 1 < n) ++j;
                ++j;
            }
            if (j < n) {
                out.push_back(unescape(line.substr(i + 1, j - i - 1)));
                i = j + 1;
                continue;
            }
        }

        const std::size_t start = i;
        while (i < n && !std::isspace(static_cast<unsigned char>(line[i]))) ++i;
        out.emplace_back(line.substr(start, i - start));
    }
    return out;
}

// First sentence of a help text, shortened to `maxLength` characters with "..." when cut.
inline std::string makeDefaultShortHelp(std::string_view help, std::size_t maxLength = 45) {
    std::vector<std::string_view> words;
    std::size_t i = 0;
    while (i < help.size()) {
        while (i < help.size() && std::isspace(static_cast<unsigned char>(help[i]))) ++i;
        const std::size_t start = i;
        while (i < help.size() && !std::isspace(static_cast<unsigned char>(help[i]))) ++i;
        if (i > start) words.push_back(help.substr(start, i - start));
    }

    std::string result;
    std::size_t totalLength = 0;
    for (const auto word : words) {
        bool done = (word.back() == '.');
        const std::size_t newLength = result.empty() ? word.size() : word.size() + 1;
        if (totalLength + newLength > maxLength) {
            result += "...";
            done = true;
        } else {
            if (!result.empty()) result += ' ';
            result += word;
        }
        if (done) break;
        totalLength += newLength;
    }
    return result;
}

// Shell function identifier from a program name: '-' becomes '_', anything else outside [A-Za-z0-9_] is dropped.
inline std::string sanitizeIdentifier(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char ch : s) {
        if (ch == '-') out.push_back('_');
        else if (std::isalnum(ch) || ch == '_') out.push_back(static_cast<char>(ch));
    }
    return out;
}

} // namespace shellac::utils

#endif // SHELLAC_UTILS_HPP
