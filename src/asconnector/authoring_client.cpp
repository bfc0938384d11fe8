#include <plm_cfg/asconnector/authoring_client.hpp>

#include <plm_cfg/core/log.hpp>

#include <algorithm>
#include <cctype>

namespace plm_cfg {

namespace {

constexpr std::size_t kMaxErrorBody = 500;

std::optional<int> ReadNumber(const std::string& text, std::size_t& pos) {
    const auto start = pos;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    if (pos == start || pos - start > 6) {
        return std::nullopt;
    }
    return std::stoi(text.substr(start, pos - start));
}

} // anonymous namespace

std::optional<std::pair<int, int>> ParseMajorMinor(const std::string& version) {
    std::size_t pos = 0;
    auto major = ReadNumber(version, pos);
    if (!major) {
        return std::nullopt;
    }
    int minor = 0;
    if (pos < version.size() && version[pos] == '.') {
        ++pos;
        minor = ReadNumber(version, pos).value_or(0);
    }
    return std::make_pair(*major, minor);
}

bool SupportsLookUpTable(const std::string& version) {
    auto parsed = ParseMajorMinor(version);
    return parsed && *parsed >= std::make_pair(2, 15);
}

// ---------------------------------------------------------------------------
// AuthoringClient
// ---------------------------------------------------------------------------
AuthoringClient::AuthoringClient(IAsSession& session, ApiVersion api_version, int attempts)
    : session_(session), api_version_(std::move(api_version)),
      attempts_(std::max(1, attempts)) {}

std::string AuthoringClient::PathFor(AsMethod method) const {
    return "/" + api_version_.Value() + "///" + MethodPath(method);
}

Result<HttpResponse, Error> AuthoringClient::Send(AsMethod method, const std::string& body) {
    const auto path = PathFor(method);
    const auto operation = RequestElementName(method);
    LogDebug(log_component::kAsConnector, operation + " -> " + session_.BaseUrl() + path);

    for (int attempt = 1;; ++attempt) {
        auto response = session_.Post(path, body, kAsContentType);
        if (response.IsErr()) {
            auto error = std::move(response).Error();
            error.operation = operation;
            if (attempt < attempts_ && error.IsTransient()) {
                LogWarn(log_component::kAsConnector, operation + " attempt " + std::to_string(attempt) +
                        " failed, retrying: " + error.message);
                continue;
            }
            LogError(log_component::kAsConnector, error.ToString());
            return Result<HttpResponse, Error>::Err(std::move(error));
        }

        const auto& http = response.Value();
        if (http.status_code < 200 || http.status_code >= 300) {
            auto error = Error::FromHttpStatus(operation, path, http.status_code, http.body);
            if (!error.remote_error.has_value() && !http.body.empty()) {
                error.remote_error = http.body.substr(0, kMaxErrorBody);
            }
            LogError(log_component::kAsConnector, error.ToString());
            return Result<HttpResponse, Error>::Err(std::move(error));
        }
        return response;
    }
}

Result<std::string, Error> AuthoringClient::GetVersionInfo() {
    auto response = Send(AsMethod::GetVersionInfo, BuildEmptyRequest(AsMethod::GetVersionInfo));
    if (response.IsErr()) {
        return Result<std::string, Error>::Err(response.Error());
    }
    auto version = ParseVersionInfo(response.Value().body);
    if (version.IsOk()) {
        LogInfo(log_component::kAsConnector, "Connected to AsConnector " + version.Value());
    }
    return version;
}

Result<void, Error> AuthoringClient::SetVisible(const std::vector<SceneNode>& nodes,
                                                bool visible) {
    auto response = Send(AsMethod::NodeSetVisible, BuildSetVisibleRequest(nodes, visible));
    if (response.IsErr()) {
        return Result<void, Error>::Err(response.Error());
    }
    return CheckReturnEchoes(response.Value().body, AsMethod::NodeSetVisible,
                             visible ? "true" : "false");
}

Result<void, Error> AuthoringClient::ConnectMaterialsToTargets(
    const std::vector<MaterialAssignment>& assignments,
    const ConnectOptions& options) {
    auto response = Send(AsMethod::MaterialConnectToTargets,
                         BuildConnectToTargetsRequest(assignments, options));
    if (response.IsErr()) {
        return Result<void, Error>::Err(response.Error());
    }
    return CheckReturnEchoes(response.Value().body, AsMethod::MaterialConnectToTargets, "true");
}

Result<std::vector<std::string>, Error> AuthoringClient::GetAllTargetNames() {
    auto response = Send(AsMethod::TargetGetAllNames,
                         BuildEmptyRequest(AsMethod::TargetGetAllNames));
    if (response.IsErr()) {
        return Result<std::vector<std::string>, Error>::Err(response.Error());
    }
    return ParseTargetNames(response.Value().body);
}

Result<std::vector<SceneNode>, Error> AuthoringClient::GetSceneStructure(
    const std::vector<NodeType>& types) {
    auto response = Send(AsMethod::SceneGetStructure,
                         BuildSceneStructureRequest(SceneRootNode(), types));
    if (response.IsErr()) {
        return Result<std::vector<SceneNode>, Error>::Err(response.Error());
    }
    return ParseSceneStructure(response.Value().body);
}

Result<std::string, Error> AuthoringClient::GetActiveScene() {
    auto response = Send(AsMethod::SceneGetActive, BuildEmptyRequest(AsMethod::SceneGetActive));
    if (response.IsErr()) {
        return Result<std::string, Error>::Err(response.Error());
    }
    return ParseActiveScene(response.Value().body);
}

Result<std::vector<std::string>, Error> AuthoringClient::GetAllScenes() {
    auto response = Send(AsMethod::SceneGetAll, BuildEmptyRequest(AsMethod::SceneGetAll));
    if (response.IsErr()) {
        return Result<std::vector<std::string>, Error>::Err(response.Error());
    }
    return ParseSceneNames(response.Value().body);
}

Result<void, Error> AuthoringClient::SetActiveScene(const std::string& scene_name) {
    auto response = Send(AsMethod::SceneSetActive, BuildSceneSetActiveRequest(scene_name));
    if (response.IsErr()) {
        return Result<void, Error>::Err(response.Error());
    }
    return CheckReturnEchoes(response.Value().body, AsMethod::SceneSetActive, "true");
}

} // namespace plm_cfg
