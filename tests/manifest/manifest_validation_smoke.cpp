#include "manifest/validator.hpp"

#include "../common/assertions.hpp"

#include <iostream>
#include <string>

namespace {

using modlist::manifest::ValidateManifestText;
using modlist::manifest::ValidationReport;
using modlist::tests::common::ContainsIssue;
using modlist::tests::common::Fail;
using modlist::tests::common::FailWithReport;

ValidationReport ValidateOrFail(const std::string& json_text) {
  ValidationReport report;
  std::string error;
  if (!ValidateManifestText(json_text, report, error)) {
    Fail("ValidateManifestText failed unexpectedly: " + error);
  }
  return report;
}

void ExpectValid(const std::string& json_text, std::string_view context) {
  const ValidationReport report = ValidateOrFail(json_text);
  if (!report.valid || !report.issues.empty()) {
    FailWithReport("expected valid manifest: " + std::string(context), report);
  }
}

void ExpectIssue(const std::string& json_text, std::string_view path, std::string_view message,
                 std::string_view context) {
  const ValidationReport report = ValidateOrFail(json_text);
  if (report.valid) {
    FailWithReport("expected invalid manifest: " + std::string(context), report);
  }
  if (!ContainsIssue(report, path, message)) {
    FailWithReport("missing issue at " + std::string(path) + ": " + std::string(context), report);
  }
}

} // namespace

int main() {
  ExpectValid(R"json({"version": "1.20.1", "mods": []})json", "empty mod list");

  ExpectValid(R"json(
{
  "version": "1.20.1",
  "mods": [
    {"name": "Sodium", "source": "https://example.com/sodium.jar"}
  ]
}
)json",
              "optional version/file omitted");

  ExpectValid(R"json(
{
  "version": "1.20.1",
  "mods": [
    {
      "name": "SeedcrackerX",
      "source": "https://github.com/19MisterX98/SeedcrackerX",
      "version": "1.20.1",
      "file": "seedcrackerX-2.14.4+1.20.1.jar",
      "notes": "extra members are allowed"
    }
  ],
  "loader": "fabric"
}
)json",
              "all fields plus additional properties");

  ExpectIssue(R"json({"mods": []})json", "version", "is required", "missing version");
  ExpectIssue(R"json({"version": "1.20.1"})json", "mods", "is required", "missing mods");
  ExpectIssue(R"json({"version": 1.2, "mods": []})json", "version", "must be a string",
              "numeric version");
  ExpectIssue(R"json({"version": "1.20.1", "mods": {}})json", "mods", "must be an array",
              "mods object");
  ExpectIssue(R"json(["1.20.1"])json", "$", "must be an object", "array root");

  ExpectIssue(R"json({"version": "1.20.1", "mods": [{"source": "https://example.com/a.jar"}]})json",
              "mods[0].name", "is required", "missing name");
  ExpectIssue(R"json({"version": "1.20.1", "mods": [{"name": "Sodium"}]})json", "mods[0].source",
              "is required", "missing source");
  ExpectIssue(R"json({"version": "1.20.1", "mods": [{"name": "Sodium", "source": "not-a-uri"}]})json",
              "mods[0].source", "must be a valid URI", "source without scheme");
  ExpectIssue(
      R"json({"version": "1.20.1", "mods": [{"name": "Sodium", "source": "https://x.com/a b.jar"}]})json",
      "mods[0].source", "must be a valid URI", "source with space");
  ExpectIssue(R"json({"version": "1.20.1", "mods": [{"name": "Sodium", "source": 5}]})json",
              "mods[0].source", "must be a string", "numeric source");
  ExpectIssue(R"json({"version": "1.20.1", "mods": ["Sodium"]})json", "mods[0]",
              "must be an object", "string entry");
  ExpectIssue(
      R"json({"version": "1.20.1", "mods": [{"name": "A", "source": "https://x.com/a", "file": 1}]})json",
      "mods[0].file", "must be a string", "numeric file");
  ExpectIssue(
      R"json({"version": "1.20.1", "mods": [{"name": "A", "source": "https://x.com/a", "version": null}]})json",
      "mods[0].version", "must be a string", "null mod version");

  {
    // Every violation is reported, not only the first one.
    const ValidationReport report = ValidateOrFail(R"json(
{
  "version": "1.20.1",
  "mods": [
    {"name": "Ok", "source": "https://example.com/ok.jar"},
    {"source": "ftp//broken"},
    {"name": 3, "source": "https://example.com/x.jar"}
  ]
}
)json");
    if (report.valid || report.issues.size() != 3U) {
      FailWithReport("expected exactly three issues", report);
    }
    if (!ContainsIssue(report, "mods[1].name", "is required") ||
        !ContainsIssue(report, "mods[1].source", "missing scheme") ||
        !ContainsIssue(report, "mods[2].name", "must be a string")) {
      FailWithReport("missing per-entry issues", report);
    }
  }

  {
    const ValidationReport report = ValidateOrFail("{\n  \"version\": \"1.20.1\",\n  \"mods\": [\n");
    if (report.valid || !ContainsIssue(report, "$", "parse error at line")) {
      FailWithReport("expected actionable parse error", report);
    }
  }

  {
    // Pathologically nested input is an ordinary parse issue.
    const ValidationReport report = ValidateOrFail(
        "{\"version\":\"1\",\"mods\":[" + std::string(200000, '[') + "]}");
    if (report.valid || report.issues.size() != 1U ||
        !ContainsIssue(report, "$", "maximum nesting depth exceeded")) {
      FailWithReport("expected nesting depth issue", report);
    }
  }

  {
    ValidationReport report;
    modlist::manifest::ValidateManifestContents("", report);
    if (report.valid || !ContainsIssue(report, "$", "manifest file is empty")) {
      FailWithReport("expected empty contents issue", report);
    }
    modlist::manifest::ValidateManifestContents(R"({"version":"1.20.1","mods":[]})", report);
    if (!report.valid || !report.issues.empty()) {
      FailWithReport("expected file contents to validate", report);
    }
  }

  std::cout << "manifest_validation_smoke: ok\n";
  return 0;
}
