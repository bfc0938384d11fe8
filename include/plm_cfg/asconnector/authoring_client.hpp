#pragma once

#include <plm_cfg/asconnector/as_protocol.hpp>
#include <plm_cfg/asconnector/i_as_session.hpp>
#include <plm_cfg/core/result.hpp>
#include <plm_cfg/core/types.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace plm_cfg {

// "2.15.0.3" -> {2, 15}. nullopt if the string does not start with digits.
[[nodiscard]] std::optional<std::pair<int, int>> ParseMajorMinor(const std::string& version);

// AsConnector 2.15 introduced the useLookUpTable connect parameter.
[[nodiscard]] bool SupportsLookUpTable(const std::string& version);

// ---------------------------------------------------------------------------
// AuthoringClient: typed operations of the AsConnector REST API.
//
// Every call POSTs one XML request to /<api>///<method> and validates the
// response: transport failures and non-2xx statuses are errors, and a 2xx
// response is still checked against the expected <returnVal> echoes.
// Transport failures are retried up to `attempts` times.
// ---------------------------------------------------------------------------
class AuthoringClient {
public:
    AuthoringClient(IAsSession& session, ApiVersion api_version, int attempts = 1);

    [[nodiscard]] Result<std::string, Error> GetVersionInfo();

    // Every node must echo `visible`.
    [[nodiscard]] Result<void, Error> SetVisible(const std::vector<SceneNode>& nodes,
                                                 bool visible);

    // Every pair must echo true.
    [[nodiscard]] Result<void, Error> ConnectMaterialsToTargets(
        const std::vector<MaterialAssignment>& assignments,
        const ConnectOptions& options);

    [[nodiscard]] Result<std::vector<std::string>, Error> GetAllTargetNames();

    // Structure below the scene root. Empty `types` returns all node types.
    [[nodiscard]] Result<std::vector<SceneNode>, Error> GetSceneStructure(
        const std::vector<NodeType>& types = {});

    [[nodiscard]] Result<std::string, Error> GetActiveScene();
    [[nodiscard]] Result<std::vector<std::string>, Error> GetAllScenes();
    [[nodiscard]] Result<void, Error> SetActiveScene(const std::string& scene_name);

    // "/v2///node/set/visible"
    [[nodiscard]] std::string PathFor(AsMethod method) const;

    [[nodiscard]] const ApiVersion& Api() const noexcept { return api_version_; }

private:
    // POST with retries; non-2xx becomes an Error carrying the body.
    Result<HttpResponse, Error> Send(AsMethod method, const std::string& body);

    IAsSession& session_;
    ApiVersion api_version_;
    int attempts_;
};

} // namespace plm_cfg
