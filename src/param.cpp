#include "shellac/param.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {

static bool isIdentifier(std::string_view s) {
    if (s.empty()) return false;
    if (!std::isalpha(static_cast<unsigned char>(s[0])) && s[0] != '_') return false;
    return std::all_of(s.begin(), s.end(), [](char ch) { return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_'; });
}

static std::string stripWs(std::string_view s, bool left, bool right) {
    std::size_t start = 0;
    std::size_t end = s.size();
    if (left) {
        while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    }
    if (right) {
        while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    }
    return std::string(s.substr(start, end - start));
}

static std::string toParamName(std::string s) {
    for (auto& ch : s) {
        if (ch == '-') ch = '_';
        else ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return s;
}

} // namespace

namespace shellac {

std::pair<std::string, std::string> splitOpt(std::string_view opt) {
    if (opt.empty()) return {"", ""};
    const char first = opt[0];
    if (std::isalnum(static_cast<unsigned char>(first))) return {"", std::string(opt)};
    if (opt.size() > 1 && opt[1] == first) return {std::string(opt.substr(0, 2)), std::string(opt.substr(2))};
    return {std::string(1, first), std::string(opt.substr(1))};
}

Option::Option(std::vector<std::string> decls) {
    std::optional<std::string> explicitName;
    std::vector<std::pair<std::string, std::string>> possibleNames;

    for (const auto& decl : decls) {
        if (isIdentifier(decl)) {
            if (explicitName) throw std::invalid_argument("option name defined twice: " + decl);
            explicitName = decl;
            continue;
        }

        const char splitChar = (!decl.empty() && decl[0] == '/') ? ';' : '/';
        const auto pos = decl.find(splitChar);
        if (pos == std::string::npos) {
            possibleNames.push_back(splitOpt(decl));
            opts_.push_back(decl);
            continue;
        }

        const auto first = stripWs(std::string_view(decl).substr(0, pos), false, true);
        if (!first.empty()) {
            possibleNames.push_back(splitOpt(first));
            opts_.push_back(first);
        }
        const auto second = stripWs(std::string_view(decl).substr(pos + 1), true, false);
        if (!second.empty()) secondaryOpts_.push_back(second);
    }

    if (opts_.empty() && secondaryOpts_.empty()) throw std::invalid_argument("option declared without any flag spelling");
    for (const auto& o : opts_) {
        if (splitOpt(o).first.empty()) throw std::invalid_argument("invalid option spelling (missing prefix): " + o);
    }

    if (explicitName) {
        name_ = *explicitName;
    } else if (!possibleNames.empty()) {
        // Long spellings win; among equals the first declared one.
        std::stable_sort(possibleNames.begin(), possibleNames.end(), [](const auto& a, const auto& b) {
            return a.first.size() > b.first.size();
        });
        name_ = toParamName(possibleNames.front().second);
        if (!isIdentifier(name_)) throw std::invalid_argument("could not determine name for option: " + opts_.front());
    } else {
        throw std::invalid_argument("could not determine name for option");
    }

    if (!secondaryOpts_.empty()) setFlag(true);
}

Option& Option::setFlag(bool v) {
    isFlag_ = v;
    if (v) type_ = types::boolean();
    return *this;
}

Option& Option::setNargs(int n) {
    if (n < 1) throw std::invalid_argument("option " + name_ + ": nargs must be positive");
    nargs_ = n;
    return *this;
}

Option& Option::setType(ParamTypePtr type) {
    if (!type) throw std::invalid_argument("option " + name_ + ": type must not be null");
    type_ = std::move(type);
    return *this;
}

Argument::Argument(std::string name) {
    if (name.empty()) throw std::invalid_argument("argument declared without a name");
    name_ = toParamName(std::move(name));
}

Argument& Argument::setNargs(int n) {
    if (n == 0 || n < kUnbounded) throw std::invalid_argument("argument " + name_ + ": nargs must be positive or unbounded");
    nargs_ = n;
    return *this;
}

Argument& Argument::setType(ParamTypePtr type) {
    if (!type) throw std::invalid_argument("argument " + name_ + ": type must not be null");
    type_ = std::move(type);
    return *this;
}

} // namespace shellac
