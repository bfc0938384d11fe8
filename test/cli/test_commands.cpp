#include <catch2/catch_test_macros.hpp>

#include <plm_cfg/cli/commands.hpp>
#include <plm_cfg/cli/report_json.hpp>

#include "mocks/mock_as_session.hpp"
#include "test_paths.hpp"

#include <nlohmann/json.hpp>

#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace plm_cfg;
using namespace plm_cfg::testing;

namespace {

constexpr const char* kConfiguration = "+1ZA+C1A+N1L+GPB";

PlmXmlDocument LoadSedan() {
    auto result = PlmXmlDocument::FromFile(TestDataPath("sedan.plmxml"));
    REQUIRE(result.IsOk());
    return std::move(result).Value();
}

AppConfig MakeConfig(const std::string& configuration = kConfiguration) {
    AppConfig config;
    config.document = TestDataPath("sedan.plmxml");
    config.configuration = configuration;
    return config;
}

std::string TargetNamesBody(const std::vector<std::string>& names) {
    std::string inner;
    for (const auto& name : names) {
        inner += "<string>" + name + "</string>";
    }
    return ReturnValBody({inner});
}

// Responses for a full apply of kConfiguration with every target in scene.
void EnqueueApply(MockAsSession& mock) {
    mock.EnqueueXml(ReturnValBody({"2.16"}));
    mock.EnqueueXml(ReturnValBody({"true"}));
    mock.EnqueueXml(ReturnValBody({"false", "false"}));
    mock.EnqueueXml(TargetNamesBody({"E_Paint", "E_Seat", "E_Rim", "E_Interior"}));
    mock.EnqueueXml(ReturnValBody({"true", "true", "true"}));
}

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // anonymous namespace

// ===========================================================================
// Command table
// ===========================================================================

TEST_CASE("ParseCommand: known words", "[cli][commands]") {
    for (auto command : {Command::Resolve, Command::Conflicts, Command::Tree,
                         Command::Apply, Command::Validate, Command::Scene}) {
        auto parsed = ParseCommand(CommandName(command));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == command);
    }
    CHECK_FALSE(ParseCommand("deploy").has_value());
    CHECK_FALSE(ParseCommand("").has_value());
    CHECK_FALSE(ParseCommand("Resolve").has_value());
}

TEST_CASE("Command requirements", "[cli][commands]") {
    CHECK(CommandNeedsDocument(Command::Resolve));
    CHECK(CommandNeedsDocument(Command::Validate));
    CHECK_FALSE(CommandNeedsDocument(Command::Scene));

    CHECK_FALSE(CommandNeedsConnection(Command::Resolve));
    CHECK_FALSE(CommandNeedsConnection(Command::Conflicts));
    CHECK_FALSE(CommandNeedsConnection(Command::Tree));
    CHECK(CommandNeedsConnection(Command::Apply));
    CHECK(CommandNeedsConnection(Command::Scene));
}

// ===========================================================================
// resolve
// ===========================================================================

TEST_CASE("RunResolve: tables, conflict warning and status", "[cli][commands]") {
    auto doc = LoadSedan();
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    CHECK(RunResolve(MakeConfig(), doc, fmt) == kExitSuccess);

    auto output = out.str();
    CHECK(Contains(output, "inst_rim_alloy"));
    CHECK(Contains(output, "LeatherSport"));
    CHECK(Contains(output, "unchanged"));
    CHECK(Contains(output, "conflict"));
    CHECK(Contains(output, "3 material targets to update"));
    CHECK(Contains(err.str(), "Warning: Conflicting variants: E_Rim variants:"));
}

TEST_CASE("RunResolve: quiet prints only the status", "[cli][commands]") {
    auto doc = LoadSedan();
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    auto config = MakeConfig();
    config.quiet = true;
    CHECK(RunResolve(config, doc, fmt) == kExitSuccess);
    CHECK(out.str().rfind("3 material targets to update", 0) == 0);
}

TEST_CASE("RunResolve: JSON document", "[cli][commands]") {
    auto doc = LoadSedan();
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(true, false, out, err);

    CHECK(RunResolve(MakeConfig(), doc, fmt) == kExitSuccess);

    auto j = nlohmann::json::parse(out.str());
    CHECK(j["stats"]["nodes"] == 6);
    CHECK(j["result"]["configuration"] == kConfiguration);
    CHECK(j["result"]["target_variants"]["E_Seat"] == "LeatherSport");
    CHECK(j["result"]["target_variants"]["E_Interior"].is_null());
    CHECK(j["result"]["visible_nodes"] == nlohmann::json::array({"inst_rim_alloy"}));
    CHECK(j["result"]["diagnostics"]["conflicts"].size() == 1);
    CHECK(err.str().empty());
}

TEST_CASE("RunResolve: PR codes when no configuration string", "[cli][commands]") {
    auto doc = LoadSedan();
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(true, false, out, err);

    auto config = MakeConfig("");
    config.pr_codes = {PrCode::Create("2ZA").Value(), PrCode::Create("C0A").Value()};
    CHECK(RunResolve(config, doc, fmt) == kExitSuccess);

    auto j = nlohmann::json::parse(out.str());
    CHECK(j["result"]["configuration"] == "+2ZA+C0A");
    CHECK(j["result"]["target_variants"]["E_Paint"] == "Blue");
}

TEST_CASE("RunResolve: missing configuration is a config error", "[cli][commands]") {
    auto doc = LoadSedan();
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    CHECK(RunResolve(MakeConfig(""), doc, fmt) == 4);
    CHECK(Contains(err.str(), "Missing configuration"));
    CHECK(out.str().empty());
}

// ===========================================================================
// conflicts / tree
// ===========================================================================

TEST_CASE("RunConflicts: table of overlapping variants", "[cli][commands]") {
    auto doc = LoadSedan();
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    CHECK(RunConflicts(doc, fmt) == kExitSuccess);
    CHECK(Contains(out.str(), "E_Rim"));
    CHECK(Contains(out.str(), "Sport - GPB; is also matching C0A+GPB;"));
}

TEST_CASE("RunConflicts: JSON with warnings", "[cli][commands]") {
    auto doc = LoadSedan();
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(true, false, out, err);

    CHECK(RunConflicts(doc, fmt) == kExitSuccess);
    auto j = nlohmann::json::parse(out.str());
    REQUIRE(j["conflicts"].size() == 1);
    CHECK(j["conflicts"][0]["target"] == "E_Rim");
    CHECK(j["warnings"].empty());
}

TEST_CASE("RunTree: structure with visibility overlay", "[cli][commands]") {
    auto doc = LoadSedan();
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    CHECK(RunTree(MakeConfig(), doc, fmt) == kExitSuccess);

    auto output = out.str();
    CHECK(Contains(output, "Sedan (inst_root, UNKNOWN)\n"));
    CHECK(Contains(output, "|-- Body (inst_body, UNKNOWN)\n"));
    CHECK(Contains(output, "+-- Wheels (inst_wheels, UNKNOWN)\n"));
    CHECK(Contains(output, "    |-- Rim_Steel (inst_rim_steel, UNKNOWN) [C0A;] hidden"));
    CHECK(Contains(output, "    +-- Rim_Alloy (inst_rim_alloy, UNKNOWN) [C1A/C2A;] visible"));
    CHECK(Contains(output, "Sunroof (inst_sunroof, UNKNOWN) [3FU+1ZA;] hidden\n"));
    CHECK(Contains(output, "Material targets: 4"));
}

TEST_CASE("RunTree: without configuration there is no overlay", "[cli][commands]") {
    auto doc = LoadSedan();
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    CHECK(RunTree(MakeConfig(""), doc, fmt) == kExitSuccess);
    CHECK(Contains(out.str(), "Rim_Alloy (inst_rim_alloy, UNKNOWN) [C1A/C2A;]\n"));
    CHECK_FALSE(Contains(out.str(), " visible"));
}

TEST_CASE("RunTree: JSON roots and children", "[cli][commands]") {
    auto doc = LoadSedan();
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(true, false, out, err);

    CHECK(RunTree(MakeConfig(""), doc, fmt) == kExitSuccess);
    auto j = nlohmann::json::parse(out.str());
    REQUIRE(j["roots"].size() == 2);
    CHECK(j["roots"][0]["id"] == "inst_root");
    CHECK(j["roots"][0]["children"][1]["children"][0]["linc_id"] == "L-201");
    CHECK_FALSE(j.contains("visible_nodes"));
}

// ===========================================================================
// apply / validate
// ===========================================================================

TEST_CASE("RunApply: successful run", "[cli][commands][apply]") {
    auto doc = LoadSedan();
    MockAsSession mock;
    EnqueueApply(mock);
    AuthoringClient client(mock, ApiVersion::Create("v2").Value());
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    CHECK(RunApply(MakeConfig(), doc, client, fmt) == kExitSuccess);
    CHECK(Contains(out.str(), "materials"));
    CHECK(Contains(out.str(), "1 shown, 2 hidden, 3 materials connected"));
    CHECK(mock.PostCallCount() == 5);
}

TEST_CASE("RunApply: no connection exits with 1", "[cli][commands][apply]") {
    auto doc = LoadSedan();
    MockAsSession mock;
    mock.EnqueueTransportError(ErrorCategory::Connection);
    AuthoringClient client(mock, ApiVersion::Create("v2").Value());
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(true, false, out, err);

    CHECK(RunApply(MakeConfig(), doc, client, fmt) == kExitConnection);
    auto j = nlohmann::json::parse(out.str());
    CHECK(j["report"]["connected"] == false);
    CHECK(j["report"]["steps"].size() == 1);
}

TEST_CASE("RunApply: failed step exits with 6", "[cli][commands][apply]") {
    auto doc = LoadSedan();
    MockAsSession mock;
    mock.EnqueueXml(ReturnValBody({"2.16"}));
    mock.EnqueueXml(ReturnValBody({"true"}));
    mock.EnqueueXml(ReturnValBody({"false", "false"}));
    mock.EnqueuePost(Result<HttpResponse, Error>::Ok(HttpResponse{500, {}, ""}));
    AuthoringClient client(mock, ApiVersion::Create("v2").Value());
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    CHECK(RunApply(MakeConfig(), doc, client, fmt) == kExitIncomplete);
    CHECK(Contains(err.str(), "Apply incomplete"));
}

TEST_CASE("RunApply: scene validation after apply", "[cli][commands][apply]") {
    auto doc = LoadSedan();
    MockAsSession mock;
    EnqueueApply(mock);
    mock.EnqueueXml(ReturnValBody({"<NodeInfo><LincId>L-201</LincId></NodeInfo>"
                                   "<NodeInfo><LincId>L-202</LincId></NodeInfo>"}));
    mock.EnqueueXml(TargetNamesBody({"E_Paint", "E_Seat", "E_Rim", "E_Interior"}));
    AuthoringClient client(mock, ApiVersion::Create("v2").Value());
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(true, false, out, err);

    auto config = MakeConfig();
    config.validate_scene = true;
    CHECK(RunApply(config, doc, client, fmt) == kExitIncomplete);

    auto j = nlohmann::json::parse(out.str());
    CHECK(j["report"]["success"] == true);
    CHECK(j["validation"]["valid"] == false);
    CHECK(j["validation"]["missing_nodes"] == nlohmann::json::array({"inst_sunroof"}));
}

TEST_CASE("RunValidate: matching scene", "[cli][commands]") {
    auto doc = LoadSedan();
    MockAsSession mock;
    mock.EnqueueXml(ReturnValBody({"<NodeInfo><LincId>L-201</LincId></NodeInfo>"
                                   "<NodeInfo><LincId>L-202</LincId></NodeInfo>"
                                   "<NodeInfo><LincId>L-300</LincId></NodeInfo>"}));
    mock.EnqueueXml(TargetNamesBody({"E_Paint"}));
    AuthoringClient client(mock, ApiVersion::Create("v2").Value());
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    auto config = MakeConfig();
    config.material.dummy = "MAT_DUMMY";
    CHECK(RunValidate(config, doc, client, fmt) == kExitSuccess);
    CHECK(Contains(out.str(), "Missing targets: 3"));
    CHECK(Contains(out.str(), "Material dummy: not found"));
    CHECK(Contains(out.str(), "Scene matches"));
}

TEST_CASE("RunValidate: request failure exit code", "[cli][commands]") {
    auto doc = LoadSedan();
    MockAsSession mock;
    mock.EnqueuePost(Result<HttpResponse, Error>::Ok(HttpResponse{404, {}, ""}));
    AuthoringClient client(mock, ApiVersion::Create("v2").Value());
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    CHECK(RunValidate(MakeConfig(), doc, client, fmt) == 5);
    CHECK(Contains(err.str(), "SceneGetStructureRequest"));
}

// ===========================================================================
// scene
// ===========================================================================

TEST_CASE("RunScene: active, all and set", "[cli][commands][scene]") {
    MockAsSession mock;
    mock.EnqueueXml(ReturnValBody({"Exterior Day"}));
    mock.EnqueueXml(ReturnValBody({"<Scene><Name>Exterior Day</Name></Scene>"
                                   "<Scene><Name>Studio</Name></Scene>"}));
    mock.EnqueueXml(ReturnValBody({"true"}));
    AuthoringClient client(mock, ApiVersion::Create("v2").Value());
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(true, false, out, err);

    auto config = MakeConfig();
    config.scene_name = "Studio";

    CHECK(RunScene("active", config, client, fmt) == kExitSuccess);
    CHECK(RunScene("all", config, client, fmt) == kExitSuccess);
    CHECK(RunScene("set", config, client, fmt) == kExitSuccess);

    std::istringstream lines(out.str());
    std::string line;
    std::getline(lines, line);
    CHECK(nlohmann::json::parse(line)["active_scene"] == "Exterior Day");
    std::getline(lines, line);
    CHECK(nlohmann::json::parse(line)["scenes"].size() == 2);
    std::getline(lines, line);
    CHECK(nlohmann::json::parse(line)["success"] == true);
}

TEST_CASE("RunScene: usage errors send nothing", "[cli][commands][scene]") {
    MockAsSession mock;
    AuthoringClient client(mock, ApiVersion::Create("v2").Value());
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    CHECK(RunScene("set", MakeConfig(), client, fmt) == 4);
    CHECK(Contains(err.str(), "--scene"));
    CHECK(RunScene("delete", MakeConfig(), client, fmt) == 4);
    CHECK(Contains(err.str(), "Unknown scene action 'delete'"));
    CHECK(mock.PostCallCount() == 0);
}

// ===========================================================================
// Usage
// ===========================================================================

TEST_CASE("PrintUsage: lists commands without color codes", "[cli][commands]") {
    std::ostringstream out;
    PrintUsage(out, false);
    auto text = out.str();
    for (const auto* word : {"resolve", "conflicts", "tree", "apply", "validate", "scene"}) {
        CHECK(Contains(text, word));
    }
    CHECK(Contains(text, "127.0.0.1:1234"));
    CHECK_FALSE(Contains(text, "\033["));
}
