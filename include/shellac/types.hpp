#ifndef SHELLAC_TYPES_HPP
#define SHELLAC_TYPES_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace shellac {

using ParamValue = std::variant<bool, std::int64_t, double, std::string>;
using ParamValues = std::vector<ParamValue>;

// Parameter type interface (text, integer, float, boolean, choice).
//
// Notes:
// - `convert()` is called once per raw token; multi-value parameters convert each token separately.
// - `convert()` should return an error string on failure; empty optional indicates success.
// - `choices()` is the fixed candidate set offered during completion, if the type has one.
class ParamType {
public:
    virtual ~ParamType() = default;

    // A human-readable type name (e.g. "text", "integer", "choice").
    [[nodiscard]] virtual std::string name() const = 0;
    [[nodiscard]] virtual std::optional<std::string> convert(std::string_view raw, ParamValue& out) const = 0;
    [[nodiscard]] virtual const std::vector<std::string>* choices() const { return nullptr; }
};

using ParamTypePtr = std::shared_ptr<const ParamType>;

class Choice final : public ParamType {
public:
    explicit Choice(std::vector<std::string> choices, bool caseSensitive = true)
        : choices_(std::move(choices)),
          caseSensitive_(caseSensitive) {}

    [[nodiscard]] std::string name() const override { return "choice"; }
    [[nodiscard]] std::optional<std::string> convert(std::string_view raw, ParamValue& out) const override;
    [[nodiscard]] const std::vector<std::string>* choices() const override { return &choices_; }

private:
    std::vector<std::string> choices_;
    bool caseSensitive_{true};
};

namespace types {

ParamTypePtr string();
ParamTypePtr integer();
ParamTypePtr floating();
ParamTypePtr boolean();
ParamTypePtr choice(std::vector<std::string> choices, bool caseSensitive = true);

} // namespace types

std::string toString(const ParamValue& value);

} // namespace shellac

#endif // SHELLAC_TYPES_HPP
