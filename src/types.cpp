#include "shellac/types.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <type_traits>

namespace {

static std::string_view trimWs(std::string_view s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

static std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

static bool tryParseBool(std::string_view s, bool& out) {
    const auto t = toLower(trimWs(s));
    if (t.empty()) return false;
    if (t == "1" || t == "true" || t == "t" || t == "on" || t == "yes" || t == "y") {
        out = true;
        return true;
    }
    if (t == "0" || t == "false" || t == "f" || t == "off" || t == "no" || t == "n") {
        out = false;
        return true;
    }
    return false;
}

template <typename T>
static bool tryParseSignedInt(std::string_view s, T& out) {
    static_assert(std::numeric_limits<T>::is_integer && std::numeric_limits<T>::is_signed, "signed integer required");
    const auto t = trimWs(s);
    if (t.empty()) return false;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(tmp.c_str(), &end, 10);
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    if (v < static_cast<long long>(std::numeric_limits<T>::min()) || v > static_cast<long long>(std::numeric_limits<T>::max())) {
        return false;
    }
    out = static_cast<T>(v);
    return true;
}

template <typename T>
static bool tryParseFloat(std::string_view s, T& out) {
    static_assert(std::is_floating_point_v<T>, "floating point required");
    const auto t = trimWs(s);
    if (t.empty()) return false;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(tmp.c_str(), &end);
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    out = static_cast<T>(v);
    return true;
}

class StringType final : public shellac::ParamType {
public:
    std::string name() const override { return "text"; }
    std::optional<std::string> convert(std::string_view raw, shellac::ParamValue& out) const override {
        out = std::string(raw);
        return std::nullopt;
    }
};

class IntType final : public shellac::ParamType {
public:
    std::string name() const override { return "integer"; }
    std::optional<std::string> convert(std::string_view raw, shellac::ParamValue& out) const override {
        std::int64_t v = 0;
        if (!tryParseSignedInt<std::int64_t>(raw, v)) return "'" + std::string(raw) + "' is not a valid integer.";
        out = v;
        return std::nullopt;
    }
};

class FloatType final : public shellac::ParamType {
public:
    std::string name() const override { return "float"; }
    std::optional<std::string> convert(std::string_view raw, shellac::ParamValue& out) const override {
        double v = 0.0;
        if (!tryParseFloat<double>(raw, v)) return "'" + std::string(raw) + "' is not a valid float.";
        out = v;
        return std::nullopt;
    }
};

class BoolType final : public shellac::ParamType {
public:
    std::string name() const override { return "boolean"; }
    std::optional<std::string> convert(std::string_view raw, shellac::ParamValue& out) const override {
        bool v = false;
        if (!tryParseBool(raw, v)) return "'" + std::string(raw) + "' is not a valid boolean.";
        out = v;
        return std::nullopt;
    }
};

} // namespace

namespace shellac {

std::optional<std::string> Choice::convert(std::string_view raw, ParamValue& out) const {
    for (const auto& c : choices_) {
        const bool match = caseSensitive_ ? (c == raw) : (toLower(c) == toLower(raw));
        if (match) {
            out = c;
            return std::nullopt;
        }
    }

    std::ostringstream oss;
    oss << "invalid choice: " << raw << ". (choose from ";
    for (std::size_t i = 0; i < choices_.size(); ++i) {
        if (i) oss << ", ";
        oss << choices_[i];
    }
    oss << ")";
    return oss.str();
}

namespace types {

ParamTypePtr string() {
    static const auto instance = std::make_shared<const StringType>();
    return instance;
}

ParamTypePtr integer() {
    static const auto instance = std::make_shared<const IntType>();
    return instance;
}

ParamTypePtr floating() {
    static const auto instance = std::make_shared<const FloatType>();
    return instance;
}

ParamTypePtr boolean() {
    static const auto instance = std::make_shared<const BoolType>();
    return instance;
}

ParamTypePtr choice(std::vector<std::string> choices, bool caseSensitive) {
    return std::make_shared<const Choice>(std::move(choices), caseSensitive);
}

} // namespace types

std::string toString(const ParamValue& value) {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, double>) {
                std::ostringstream oss;
                oss << v;
                return oss.str();
            } else {
                return std::to_string(v);
            }
        },
        value);
}

} // namespace shellac
