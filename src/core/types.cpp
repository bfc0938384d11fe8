#include <plm_cfg/core/types.hpp>

#include <algorithm>
#include <cctype>

namespace plm_cfg {

namespace {

bool IsDigit(char c) {
    return c >= '0' && c <= '9';
}

bool IsPrCodeChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 ||
           c == '_' || c == '-';
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ApiVersion
// ---------------------------------------------------------------------------
Result<ApiVersion, std::string> ApiVersion::Create(std::string_view version) {
    if (version.size() < 2 || version[0] != 'v') {
        return Result<ApiVersion, std::string>::Err(
            "API version must look like 'v2', got '" + std::string(version) + "'");
    }
    auto digits = version.substr(1);
    if (!std::all_of(digits.begin(), digits.end(), IsDigit)) {
        return Result<ApiVersion, std::string>::Err(
            "API version must be 'v' followed by digits, got '" +
            std::string(version) + "'");
    }
    return Result<ApiVersion, std::string>::Ok(ApiVersion(std::string(version)));
}

// ---------------------------------------------------------------------------
// PrCode
// ---------------------------------------------------------------------------
Result<PrCode, std::string> PrCode::Create(std::string_view code) {
    if (code.empty()) {
        return Result<PrCode, std::string>::Err("PR code must not be empty");
    }
    if (code.size() > 16) {
        return Result<PrCode, std::string>::Err(
            "PR code must be at most 16 characters, got " +
            std::to_string(code.size()));
    }
    if (!std::all_of(code.begin(), code.end(), IsPrCodeChar)) {
        return Result<PrCode, std::string>::Err(
            "PR code must contain only letters, digits, '_' and '-': '" +
            std::string(code) + "'");
    }
    return Result<PrCode, std::string>::Ok(PrCode(std::string(code)));
}

} // namespace plm_cfg
