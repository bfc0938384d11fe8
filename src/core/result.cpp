#include <plm_cfg/core/result.hpp>

#include <sstream>

namespace plm_cfg {

namespace {

// Text content of the first element named tag_name, attributes allowed.
// Plain string scan so that core/ stays free of the XML library.
std::optional<std::string> ExtractXmlText(const std::string& body,
                                          const std::string& tag_name) {
    const std::string open_prefix = "<" + tag_name;
    auto tag_pos = body.find(open_prefix);
    if (tag_pos == std::string::npos) return std::nullopt;

    // <messages> must not match a search for <message.
    const size_t after_prefix = tag_pos + open_prefix.size();
    if (after_prefix >= body.size()) return std::nullopt;
    const char next = body[after_prefix];
    if (next != '>' && next != ' ' && next != '\t' && next != '\n' &&
        next != '\r') {
        return std::nullopt;
    }

    auto content_start = body.find('>', after_prefix);
    if (content_start == std::string::npos) return std::nullopt;
    ++content_start;

    const std::string close_tag = "</" + tag_name + ">";
    auto content_end = body.find(close_tag, content_start);
    if (content_end == std::string::npos) return std::nullopt;

    auto text = body.substr(content_start, content_end - content_start);
    if (text.empty()) return std::nullopt;
    return text;
}

std::optional<std::string> ExtractRemoteError(const std::string& body) {
    if (body.empty()) return std::nullopt;

    auto msg = ExtractXmlText(body, "message");
    if (msg.has_value()) return msg;

    return ExtractXmlText(body, "faultstring");
}

std::string JsonEscape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    static constexpr char kHex[] = "0123456789abcdef";
                    result += "\\u00";
                    result += kHex[(c >> 4) & 0x0f];
                    result += kHex[c & 0x0f];
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    auto remote_error = ExtractRemoteError(response_body);

    ErrorCategory category = ErrorCategory::Protocol;
    std::string message;

    switch (status_code) {
        case 400:
            message = "Bad request";
            break;
        case 404:
            category = ErrorCategory::NotFound;
            message = "Method not found, check the AsConnector API version";
            break;
        case 408:
            category = ErrorCategory::Timeout;
            message = "Request timed out";
            break;
        case 500:
            message = "AsConnector internal error";
            break;
        case 502:
        case 503:
        case 504:
            category = ErrorCategory::Connection;
            message = "AsConnector unavailable";
            break;
        default:
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }

    return Error{operation, endpoint, status_code, message, remote_error, category};
}

int Error::ExitCode() const {
    switch (category) {
        case ErrorCategory::Connection:
        case ErrorCategory::Timeout:    return 1;
        case ErrorCategory::Protocol:   return 2;
        case ErrorCategory::ParseError: return 3;
        case ErrorCategory::Config:     return 4;
        case ErrorCategory::NotFound:   return 5;
        case ErrorCategory::Internal:   break;
    }
    return 99;
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::Connection: return "connection";
        case ErrorCategory::Timeout:    return "timeout";
        case ErrorCategory::Protocol:   return "protocol";
        case ErrorCategory::ParseError: return "parse";
        case ErrorCategory::Config:     return "config";
        case ErrorCategory::NotFound:   return "not_found";
        case ErrorCategory::Internal:   break;
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!endpoint.empty()) oss << " [" << endpoint << "]";
    if (http_status) oss << " (HTTP " << *http_status << ")";
    oss << ": " << message;
    if (remote_error && !remote_error->empty()) {
        oss << " | AsConnector: " << *remote_error;
    }
    return oss.str();
}

std::string Error::ToJson() const {
    std::ostringstream oss;
    oss << R"({"error":{)";
    oss << R"("category":")" << CategoryName() << R"(",)";
    oss << R"("operation":")" << JsonEscape(operation) << R"(",)";
    if (!endpoint.empty()) {
        oss << R"("endpoint":")" << JsonEscape(endpoint) << R"(",)";
    }
    if (http_status.has_value()) {
        oss << R"("http_status":)" << *http_status << R"(,)";
    }
    oss << R"("message":")" << JsonEscape(message) << R"(",)";
    if (remote_error.has_value() && !remote_error->empty()) {
        oss << R"("remote_error":")" << JsonEscape(*remote_error) << R"(",)";
    }
    oss << R"("exit_code":)" << ExitCode();
    oss << R"(}})";
    return oss.str();
}

} // namespace plm_cfg
