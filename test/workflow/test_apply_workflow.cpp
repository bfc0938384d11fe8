#include <catch2/catch_test_macros.hpp>

#include <plm_cfg/workflow/apply_workflow.hpp>

#include "mocks/mock_as_session.hpp"
#include "test_paths.hpp"

#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace plm_cfg;
using namespace plm_cfg::testing;

namespace {

PlmXmlDocument LoadSedan() {
    auto result = PlmXmlDocument::FromFile(TestDataPath("sedan.plmxml"));
    REQUIRE(result.IsOk());
    return std::move(result).Value();
}

PlmXmlDocument FromXml(const std::string& instances) {
    auto result = PlmXmlDocument::FromString(
        "<PLMXML><ProductDef><InstanceGraph>" + instances +
        "</InstanceGraph></ProductDef></PLMXML>");
    REQUIRE(result.IsOk());
    return std::move(result).Value();
}

std::string TargetNamesBody(const std::vector<std::string>& names) {
    std::string inner;
    for (const auto& name : names) {
        inner += "<string>" + name + "</string>";
    }
    return ReturnValBody({inner});
}

Result<HttpResponse, Error> HttpStatus(int status, std::string body = "") {
    return Result<HttpResponse, Error>::Ok(HttpResponse{status, {}, std::move(body)});
}

bool BodyContains(const MockAsSession& mock, size_t call, const std::string& text) {
    return mock.PostCalls().at(call).body.find(text) != std::string::npos;
}

constexpr const char* kConfiguration = "+1ZA+C1A+N1L+GPB";

} // anonymous namespace

// ===========================================================================
// Full sequence
// ===========================================================================

TEST_CASE("ApplyWorkflow: full run skips targets missing in scene", "[workflow][apply]") {
    auto doc = LoadSedan();
    auto result = ConfigurationResolver(doc).Resolve(kConfiguration);

    MockAsSession mock;
    mock.EnqueueXml(ReturnValBody({"2.15.0"}));
    mock.EnqueueXml(ReturnValBody({"true"}));
    mock.EnqueueXml(ReturnValBody({"false", "false"}));
    mock.EnqueueXml(TargetNamesBody({"E_Paint", "E_Seat"}));
    mock.EnqueueXml(ReturnValBody({"true", "true"}));
    AuthoringClient client(mock, ApiVersion::Create("v2").Value());

    ApplyWorkflow workflow(client, doc);
    auto report = workflow.Run(result);

    CHECK(report.success);
    CHECK(report.connected);
    CHECK(report.version == "2.15.0");
    CHECK(report.errors.empty());
    CHECK(report.missing_targets == std::set<std::string>{"E_Rim"});
    REQUIRE(report.connected_materials.size() == 2);
    CHECK(report.connected_materials[0] == MaterialAssignment{"Red", "E_Paint"});
    CHECK(report.connected_materials[1] == MaterialAssignment{"LeatherSport", "E_Seat"});
    CHECK(report.summary ==
          "1 shown, 2 hidden, 2 materials connected, 1 targets missing in scene");

    REQUIRE(report.steps.size() == 6);
    CHECK(report.steps[0].step_name == "connect");
    CHECK(report.steps[1].step_name == "show");
    CHECK(report.steps[2].step_name == "hide");
    CHECK(report.steps[3].step_name == "discover_targets");
    CHECK(report.FindStep("material_dummy")->outcome == StepOutcome::Skipped);
    CHECK(report.FindStep("materials")->outcome == StepOutcome::Completed);
    CHECK(report.FindStep("nope") == nullptr);

    REQUIRE(mock.PostCallCount() == 5);
    CHECK(mock.PostCalls()[1].path == "/v2///node/set/visible");
    CHECK(BodyContains(mock, 1, "<LincId>L-202</LincId>"));
    CHECK(BodyContains(mock, 2, "<LincId>L-201</LincId>"));
    CHECK(BodyContains(mock, 2, "<LincId>L-300</LincId>"));
    CHECK_FALSE(BodyContains(mock, 4, "E_Rim"));
    CHECK(BodyContains(mock, 4, "<useLookUpTable>false</useLookUpTable>"));
}

TEST_CASE("ApplyWorkflow: target absent from scene is never sent", "[workflow][apply]") {
    auto doc = FromXml(
        "<ProductInstance id=\"N1\" name=\"N1\"><UserData>"
        "<UserValue title=\"LINC_ID\" value=\"L1\"/>"
        "<UserValue title=\"PR_TAGS\" value=\"AB\"/></UserData></ProductInstance>"
        "<ProductInstance id=\"looks\" name=\"LookLibrary\"><UserData>"
        "<UserValue title=\"Mat1\" value=\"Mat1~ [V1~ AB ~ first]\"/>"
        "<UserValue title=\"E_Foo\" value=\"E_Foo~ [F1~ AB ~ foo]\"/>"
        "</UserData></ProductInstance>");
    auto result = ConfigurationResolver(doc).Resolve("+AB");
    REQUIRE(result.ActiveTargets().count("E_Foo") == 1);

    MockAsSession mock;
    mock.EnqueueXml(ReturnValBody({"2.15.0"}));
    mock.EnqueueXml(ReturnValBody({"true"}));
    mock.EnqueueXml(TargetNamesBody({"Mat1"}));
    mock.EnqueueXml(ReturnValBody({"true"}));
    AuthoringClient client(mock, ApiVersion::Create("v2").Value());

    auto report = ApplyWorkflow(client, doc).Run(result);

    CHECK(report.success);
    CHECK(report.missing_targets == std::set<std::string>{"E_Foo"});
    REQUIRE(report.connected_materials.size() == 1);
    CHECK(report.connected_materials[0] == MaterialAssignment{"V1", "Mat1"});
    CHECK(report.FindStep("hide")->outcome == StepOutcome::Skipped);

    REQUIRE(mock.PostCallCount() == 4);
    CHECK(mock.PostCalls()[3].path == "/v2///material/connecttotargets");
    CHECK(BodyContains(mock, 3, "<string>Mat1</string>"));
    CHECK_FALSE(BodyContains(mock, 3, "E_Foo"));
    CHECK_FALSE(BodyContains(mock, 3, "F1"));
}

TEST_CASE("ApplyWorkflow: older AsConnector gets no look-up table flag", "[workflow][apply]") {
    auto doc = LoadSedan();
    auto result = ConfigurationResolver(doc).Resolve("+1ZA");

    MockAsSession mock;
    mock.EnqueueXml(ReturnValBody({"2.14.2"}));
    mock.EnqueueXml(ReturnValBody({"false", "false", "false"}));
    mock.EnqueueXml(TargetNamesBody({"E_Paint"}));
    mock.EnqueueXml(ReturnValBody({"true"}));
    AuthoringClient client(mock, ApiVersion::Create("v2").Value());

    auto report = ApplyWorkflow(client, doc).Run(result);
    CHECK(report.success);
    CHECK(report.FindStep("show")->outcome == StepOutcome::Skipped);
    REQUIRE(mock.PostCallCount() == 4);
    CHECK_FALSE(BodyContains(mock, 3, "useLookUpTable"));
}

TEST_CASE("ApplyWorkflow: material dummy goes to every scene target first", "[workflow][apply]") {
    auto doc = LoadSedan();
    auto result = ConfigurationResolver(doc).Resolve(kConfiguration);

    MockAsSession mock;
    mock.EnqueueXml(ReturnValBody({"2.16"}));
    mock.EnqueueXml(ReturnValBody({"true"}));
    mock.EnqueueXml(ReturnValBody({"false", "false"}));
    mock.EnqueueXml(TargetNamesBody({"E_Paint", "E_Seat", "E_Rim", "E_Interior", "E_Other"}));
    mock.EnqueueXml(ReturnValBody({"true", "true", "true", "true"}));
    mock.EnqueueXml(ReturnValBody({"true", "true", "true"}));
    AuthoringClient client(mock, ApiVersion::Create("v2").Value());

    ApplyOptions options;
    options.material_dummy = "MAT_DUMMY";
    options.use_copy_method = true;
    auto report = ApplyWorkflow(client, doc, options).Run(result);

    CHECK(report.success);
    CHECK(report.missing_targets.empty());
    CHECK(report.connected_materials.size() == 3);
    CHECK(report.FindStep("material_dummy")->outcome == StepOutcome::Completed);

    REQUIRE(mock.PostCallCount() == 6);
    CHECK(BodyContains(mock, 4, "<string>MAT_DUMMY</string>"));
    CHECK(BodyContains(mock, 4, "<string>E_Interior</string>"));
    CHECK_FALSE(BodyContains(mock, 4, "E_Other"));
    CHECK(BodyContains(mock, 4, "<useCopyMethod>true</useCopyMethod>"));
    CHECK(BodyContains(mock, 5, "<string>Sport</string>"));
}

TEST_CASE("ApplyWorkflow: failed material dummy is not fatal", "[workflow][apply]") {
    auto doc = LoadSedan();
    auto result = ConfigurationResolver(doc).Resolve("+2ZA");

    MockAsSession mock;
    mock.EnqueueXml(ReturnValBody({"2.16"}));
    mock.EnqueueXml(ReturnValBody({"false", "false", "false"}));
    mock.EnqueueXml(TargetNamesBody({"E_Paint"}));
    mock.EnqueuePost(HttpStatus(500, "<fault><message>dummy locked</message></fault>"));
    mock.EnqueueXml(ReturnValBody({"true"}));
    AuthoringClient client(mock, ApiVersion::Create("v2").Value());

    ApplyOptions options;
    options.material_dummy = "MAT_DUMMY";
    auto report = ApplyWorkflow(client, doc, options).Run(result);

    CHECK(report.success);
    CHECK(report.FindStep("material_dummy")->outcome == StepOutcome::Failed);
    CHECK(report.FindStep("materials")->outcome == StepOutcome::Completed);
    CHECK(report.connected_materials == std::vector<MaterialAssignment>{{"Blue", "E_Paint"}});
}

// ===========================================================================
// Failures
// ===========================================================================

TEST_CASE("ApplyWorkflow: unreachable AsConnector changes nothing", "[workflow][apply][errors]") {
    auto doc = LoadSedan();
    auto result = ConfigurationResolver(doc).Resolve(kConfiguration);

    MockAsSession mock;
    mock.EnqueueTransportError(ErrorCategory::Connection);
    AuthoringClient client(mock, ApiVersion::Create("v2").Value());

    auto report = ApplyWorkflow(client, doc).Run(result);
    CHECK_FALSE(report.success);
    CHECK_FALSE(report.connected);
    REQUIRE(report.steps.size() == 1);
    CHECK(report.steps[0].outcome == StepOutcome::Failed);
    REQUIRE(report.errors.size() == 1);
    CHECK(report.errors[0].find("Could not connect") == 0);
    CHECK(mock.PostCallCount() == 1);
}

TEST_CASE("ApplyWorkflow: failed batch is recorded and the run continues", "[workflow][apply][errors]") {
    auto doc = LoadSedan();
    auto result = ConfigurationResolver(doc).Resolve(kConfiguration);

    MockAsSession mock;
    mock.EnqueueXml(ReturnValBody({"2.16"}));
    mock.EnqueueXml(ReturnValBody({"true"}));
    mock.EnqueuePost(HttpStatus(404));
    mock.EnqueueXml(TargetNamesBody({"E_Paint", "E_Seat", "E_Rim"}));
    mock.EnqueueXml(ReturnValBody({"true", "true", "true"}));
    AuthoringClient client(mock, ApiVersion::Create("v2").Value());

    auto report = ApplyWorkflow(client, doc).Run(result);
    CHECK_FALSE(report.success);
    CHECK(report.FindStep("hide")->outcome == StepOutcome::Failed);
    CHECK(report.FindStep("materials")->outcome == StepOutcome::Completed);
    CHECK(report.errors.size() == 1);
    CHECK(report.summary.find("1 errors") != std::string::npos);
    CHECK(mock.PostCallCount() == 5);
}

TEST_CASE("ApplyWorkflow: echo mismatch counts as failure", "[workflow][apply][errors]") {
    auto doc = LoadSedan();
    auto result = ConfigurationResolver(doc).Resolve("+1ZA");

    MockAsSession mock;
    mock.EnqueueXml(ReturnValBody({"2.16"}));
    mock.EnqueueXml(ReturnValBody({"false", "true", "false"}));
    mock.EnqueueXml(TargetNamesBody({"E_Paint"}));
    mock.EnqueueXml(ReturnValBody({"false"}));
    AuthoringClient client(mock, ApiVersion::Create("v2").Value());

    auto report = ApplyWorkflow(client, doc).Run(result);
    CHECK_FALSE(report.success);
    CHECK(report.FindStep("hide")->outcome == StepOutcome::Failed);
    CHECK(report.FindStep("materials")->outcome == StepOutcome::Failed);
    CHECK(report.connected_materials.empty());
    CHECK(report.errors.size() == 2);
}

TEST_CASE("ApplyWorkflow: target discovery failure blocks materials", "[workflow][apply][errors]") {
    auto doc = LoadSedan();
    auto result = ConfigurationResolver(doc).Resolve("+1ZA");

    MockAsSession mock;
    mock.EnqueueXml(ReturnValBody({"2.16"}));
    mock.EnqueueXml(ReturnValBody({"false", "false", "false"}));
    mock.EnqueuePost(HttpStatus(500));
    AuthoringClient client(mock, ApiVersion::Create("v2").Value());

    ApplyOptions options;
    options.material_dummy = "MAT_DUMMY";
    auto report = ApplyWorkflow(client, doc, options).Run(result);

    CHECK_FALSE(report.success);
    CHECK(report.FindStep("discover_targets")->outcome == StepOutcome::Failed);
    CHECK(report.FindStep("material_dummy")->outcome == StepOutcome::Skipped);
    CHECK(report.FindStep("materials")->outcome == StepOutcome::Failed);
    CHECK(report.errors.size() == 2);
    CHECK(mock.PostCallCount() == 3);
}

// ===========================================================================
// ValidateSceneVsPlmXml
// ===========================================================================

TEST_CASE("ValidateSceneVsPlmXml: missing nodes, targets and dummy", "[workflow][validate]") {
    auto doc = LoadSedan();

    MockAsSession mock;
    mock.EnqueueXml(ReturnValBody({
        "<NodeInfo><AsId>1</AsId><LincId>L-201</LincId><Name>Rim_Steel</Name>"
        "<NodeInfoType>SHAPE</NodeInfoType></NodeInfo>"
        "<NodeInfo><AsId>2</AsId><LincId>L-202</LincId><Name>Rim_Alloy</Name>"
        "<NodeInfoType>SHAPE</NodeInfoType></NodeInfo>"
        "<NodeInfo><AsId>3</AsId><LincId>None</LincId><Name>MAT_DUMMY.csb</Name>"
        "<NodeInfoType>GROUP</NodeInfoType></NodeInfo>"}));
    mock.EnqueueXml(TargetNamesBody({"E_Paint", "E_Seat"}));
    AuthoringClient client(mock, ApiVersion::Create("v2").Value());

    auto validation = ValidateSceneVsPlmXml(client, doc, "MAT_DUMMY");
    REQUIRE(validation.IsOk());
    const auto& v = validation.Value();

    CHECK(v.scene_node_count == 3);
    CHECK(v.missing_nodes == std::vector<std::string>{"inst_sunroof"});
    CHECK(v.missing_targets == std::set<std::string>{"E_Interior", "E_Rim"});
    REQUIRE(v.material_dummy.has_value());
    CHECK(v.material_dummy->as_id == "3");
    CHECK_FALSE(v.IsValid());
}

TEST_CASE("ValidateSceneVsPlmXml: complete scene is valid", "[workflow][validate]") {
    auto doc = LoadSedan();

    MockAsSession mock;
    mock.EnqueueXml(ReturnValBody({
        "<NodeInfo><LincId>L-201</LincId></NodeInfo>"
        "<NodeInfo><LincId>L-202</LincId></NodeInfo>"
        "<NodeInfo><LincId>L-300</LincId></NodeInfo>"}));
    mock.EnqueueXml(TargetNamesBody({"E_Rim"}));
    AuthoringClient client(mock, ApiVersion::Create("v2").Value());

    auto validation = ValidateSceneVsPlmXml(client, doc);
    REQUIRE(validation.IsOk());
    CHECK(validation.Value().IsValid());
    CHECK(validation.Value().missing_targets.size() == 3);
    CHECK_FALSE(validation.Value().material_dummy.has_value());
}

TEST_CASE("ValidateSceneVsPlmXml: structure request failure", "[workflow][validate][errors]") {
    auto doc = LoadSedan();
    MockAsSession mock;
    mock.EnqueuePost(HttpStatus(503));
    AuthoringClient client(mock, ApiVersion::Create("v2").Value());

    auto validation = ValidateSceneVsPlmXml(client, doc);
    REQUIRE(validation.IsErr());
    CHECK(validation.Error().category == ErrorCategory::Connection);
    CHECK(mock.PostCallCount() == 1);
}
