#pragma once

#include <plm_cfg/core/result.hpp>

#include <string>
#include <string_view>

namespace plm_cfg {

// ---------------------------------------------------------------------------
// ApiVersion: AsConnector REST API path segment, "v" followed by digits
// (e.g. "v2").
// ---------------------------------------------------------------------------
class ApiVersion {
public:
    static Result<ApiVersion, std::string> Create(std::string_view version);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const ApiVersion& other) const { return value_ == other.value_; }
    bool operator!=(const ApiVersion& other) const { return value_ != other.value_; }

private:
    explicit ApiVersion(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// PrCode: a single PR option code as given on the command line.
//
// Rules:
//   - Non-empty, max 16 characters
//   - ASCII letters, digits, '_' and '-'
// ---------------------------------------------------------------------------
class PrCode {
public:
    static Result<PrCode, std::string> Create(std::string_view code);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const PrCode& other) const { return value_ == other.value_; }
    bool operator!=(const PrCode& other) const { return value_ != other.value_; }

private:
    explicit PrCode(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

} // namespace plm_cfg
