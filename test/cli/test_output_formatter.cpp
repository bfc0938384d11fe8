#include <catch2/catch_test_macros.hpp>

#include <plm_cfg/cli/output_formatter.hpp>

#include <sstream>
#include <string>

using namespace plm_cfg;

namespace {

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // anonymous namespace

// ===========================================================================
// PrintTable
// ===========================================================================

TEST_CASE("OutputFormatter: padded table with separator", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    fmt.PrintTable({"Target", "Variant"}, {
        {"E_Paint", "Red"},
        {"E_Seat", "LeatherSport"},
    });

    CHECK(out.str() ==
          "Target   Variant     \n"
          "-------  ------------\n"
          "E_Paint  Red         \n"
          "E_Seat   LeatherSport\n");
    CHECK(err.str().empty());
}

TEST_CASE("OutputFormatter: table with no rows prints header only", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    fmt.PrintTable({"Node", "State"}, {});
    CHECK(out.str() == "Node  State\n----  -----\n");
}

TEST_CASE("OutputFormatter: table in JSON mode", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(true, false, out, err);

    fmt.PrintTable({"target", "variant"}, {{"E_Paint", "Red"}, {"E_Seat"}});
    CHECK(out.str() ==
          "[{\"target\":\"E_Paint\",\"variant\":\"Red\"},{\"target\":\"E_Seat\"}]\n");
}

TEST_CASE("OutputFormatter: color table uses FTXUI box-drawing", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, true, out, err);

    fmt.PrintTable({"Target", "Variant"}, {{"E_Paint", "Red"}, {"E_Seat"}});

    auto output = out.str();
    CHECK(Contains(output, "Target"));
    CHECK(Contains(output, "E_Paint"));
    CHECK(Contains(output, "\xe2\x94"));
}

// ===========================================================================
// PrintDetail
// ===========================================================================

TEST_CASE("OutputFormatter: detail tree in plain mode", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    DetailSection root{"", {{"document", "sedan.plmxml"}}};
    DetailSection looks{"Looks", {{"targets", "4"}, {"variants", "8"}}};
    fmt.PrintDetail("Document", {root, looks});

    CHECK(out.str() ==
          "Document\n"
          "|-- document: sedan.plmxml\n"
          "+-- Looks\n"
          "    |-- targets: 4\n"
          "    +-- variants: 8\n");
}

TEST_CASE("OutputFormatter: detail skips empty sections", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    DetailSection root{"", {{"nodes", "6"}}};
    DetailSection empty{"Conflicts", {}};
    fmt.PrintDetail("Stats", {root, empty});

    CHECK(out.str() == "Stats\n+-- nodes: 6\n");
}

TEST_CASE("OutputFormatter: detail in JSON mode nests sections", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(true, false, out, err);

    DetailSection root{"", {{"nodes", "6"}}};
    DetailSection looks{"looks", {{"targets", "4"}}};
    fmt.PrintDetail("stats", {root, looks});

    CHECK(out.str() == "{\"stats\":{\"looks\":{\"targets\":\"4\"},\"nodes\":\"6\"}}\n");
}

// ===========================================================================
// PrintTree
// ===========================================================================

TEST_CASE("OutputFormatter: nested tree in plain mode", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    TreeItem rim_steel{"Rim_Steel", "[hidden]", true, {}};
    TreeItem rim_alloy{"Rim_Alloy", "[visible]", false, {}};
    TreeItem wheels{"Wheels", "", false, {rim_steel, rim_alloy}};
    TreeItem body{"Body", "", false, {}};
    TreeItem sedan{"Sedan", "(inst_root)", false, {wheels, body}};

    fmt.PrintTree({sedan});

    CHECK(out.str() ==
          "Sedan (inst_root)\n"
          "|-- Wheels\n"
          "|   |-- Rim_Steel [hidden]\n"
          "|   +-- Rim_Alloy [visible]\n"
          "+-- Body\n");
}

TEST_CASE("OutputFormatter: color tree dims hidden nodes", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, true, out, err);

    TreeItem hidden{"Sunroof", "[hidden]", true, {}};
    TreeItem root{"Sedan", "", false, {hidden}};
    fmt.PrintTree({root});

    auto output = out.str();
    CHECK(Contains(output, "└── "));
    CHECK(Contains(output, "\033[90mSunroof\033[0m"));
    CHECK(Contains(output, "\033[36m[hidden]"));
}

// ===========================================================================
// PrintError / PrintWarning / PrintSuccess
// ===========================================================================

TEST_CASE("OutputFormatter: PrintError plain mode", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    Error e{"NodeSetVisibleRequest", "/v2///node/set/visible", 500, "HTTP 500",
            std::string("scene locked"), ErrorCategory::Protocol};
    fmt.PrintError(e);

    CHECK(out.str().empty());
    CHECK(err.str() ==
          "Error: NodeSetVisibleRequest [/v2///node/set/visible] (HTTP 500)\n"
          "  HTTP 500\n"
          "  AsConnector: scene locked\n");
}

TEST_CASE("OutputFormatter: PrintError JSON mode", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(true, false, out, err);

    Error e{"ParsePlmXml", "sedan.plmxml", std::nullopt, "Malformed PLM-XML",
            std::nullopt, ErrorCategory::ParseError};
    fmt.PrintError(e);

    CHECK(out.str().empty());
    CHECK(Contains(err.str(), "\"category\":\"parse\""));
    CHECK(Contains(err.str(), "\"exit_code\":3"));
}

TEST_CASE("OutputFormatter: color error has red ANSI codes", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, true, out, err);

    Error e{"GetVersionInfoRequest", "/v2///getversioninfo", 404, "Not found",
            std::string("unknown api"), ErrorCategory::NotFound};
    fmt.PrintError(e);

    auto output = err.str();
    CHECK(Contains(output, "\033[1;31m"));
    CHECK(Contains(output, "HTTP 404"));
    CHECK(Contains(output, "AsConnector: "));
    CHECK(Contains(output, "unknown api"));
}

TEST_CASE("OutputFormatter: warnings go to stderr, not in JSON mode", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter plain(false, false, out, err);
    plain.PrintWarning("E_Rim variants: Sport - GPB; is also matching C0A+GPB;");
    CHECK(err.str() == "Warning: E_Rim variants: Sport - GPB; is also matching C0A+GPB;\n");

    std::ostringstream json_out;
    std::ostringstream json_err;
    OutputFormatter json(true, false, json_out, json_err);
    json.PrintWarning("ignored");
    CHECK(json_out.str().empty());
    CHECK(json_err.str().empty());
}

TEST_CASE("OutputFormatter: PrintSuccess per mode", "[cli][formatter]") {
    std::ostringstream plain_out;
    std::ostringstream err;
    OutputFormatter(false, false, plain_out, err).PrintSuccess("3 materials connected");
    CHECK(plain_out.str() == "3 materials connected\n");

    std::ostringstream color_out;
    OutputFormatter(false, true, color_out, err).PrintSuccess("done");
    CHECK(Contains(color_out.str(), "\033[1;32mOK"));

    std::ostringstream json_out;
    OutputFormatter(true, false, json_out, err).PrintSuccess("done");
    CHECK(json_out.str() == "{\"message\":\"done\",\"success\":true}\n");
}

TEST_CASE("OutputFormatter: JSON mode overrides color mode", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(true, true, out, err);

    CHECK(fmt.IsJsonMode());
    CHECK_FALSE(fmt.IsColorMode());

    fmt.PrintTable({"target"}, {{"E_Paint"}});
    CHECK_FALSE(Contains(out.str(), "\033["));
}

TEST_CASE("OutputFormatter: PrintJson writes one line", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(true, false, out, err);
    fmt.PrintJson("{\"a\":1}");
    CHECK(out.str() == "{\"a\":1}\n");
}
