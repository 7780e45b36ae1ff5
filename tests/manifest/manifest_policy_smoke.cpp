#include "manifest/validator.hpp"

#include "../common/assertions.hpp"

#include <iostream>
#include <string>

namespace {

using modlist::manifest::PolicyLevel;
using modlist::manifest::ValidateManifestText;
using modlist::manifest::ValidationOptions;
using modlist::manifest::ValidationReport;
using modlist::tests::common::ContainsIssue;
using modlist::tests::common::ContainsWarning;
using modlist::tests::common::Fail;
using modlist::tests::common::FailWithReport;

constexpr const char* kManifest = R"json(
{
  "version": "1.20.1",
  "mods": [
    {"name": "SeedcrackerX", "source": "https://github.com/19MisterX98/SeedcrackerX", "version": "1.20"},
    {"name": "Sodium", "source": "https://example.com/sodium.jar", "version": "1.20.1"},
    {"name": "SeedcrackerX", "source": "https://example.com/fork.jar", "file": ""},
    {"name": "", "source": "https://example.com/unnamed.jar"}
  ]
}
)json";

ValidationReport ValidateWith(const ValidationOptions& options) {
  ValidationReport report;
  std::string error;
  if (!ValidateManifestText(kManifest, report, error, options)) {
    Fail("ValidateManifestText failed unexpectedly: " + error);
  }
  return report;
}

} // namespace

int main() {
  {
    const ValidationReport report = ValidateWith(ValidationOptions{});
    if (!report.valid) {
      FailWithReport("default policy must keep schema-valid manifest valid", report);
    }
    if (!ContainsWarning(report, "mods[2].name", "duplicates mods[0].name ('SeedcrackerX')")) {
      FailWithReport("missing duplicate-name warning", report);
    }
    if (!ContainsWarning(report, "mods[0].version",
                         "'1.20' differs from manifest version '1.20.1'")) {
      FailWithReport("missing version-mismatch warning", report);
    }
    if (ContainsWarning(report, "mods[1].version", "differs")) {
      FailWithReport("matching mod version must not warn", report);
    }
    if (!ContainsWarning(report, "mods[2].file", "is empty") ||
        !ContainsWarning(report, "mods[3].name", "is empty")) {
      FailWithReport("missing empty-string warnings", report);
    }
  }

  {
    ValidationOptions options;
    options.duplicate_names = PolicyLevel::kError;
    options.version_mismatch = PolicyLevel::kError;
    const ValidationReport report = ValidateWith(options);
    if (report.valid) {
      FailWithReport("strict policy must reject duplicates and mismatches", report);
    }
    if (!ContainsIssue(report, "mods[2].name", "duplicates") ||
        !ContainsIssue(report, "mods[0].version", "differs from manifest version")) {
      FailWithReport("strict policy findings must land in issues", report);
    }
    if (ContainsWarning(report, "mods[2].name", "duplicates")) {
      FailWithReport("strict findings must not also be warnings", report);
    }
  }

  {
    ValidationOptions options;
    options.duplicate_names = PolicyLevel::kIgnore;
    options.version_mismatch = PolicyLevel::kIgnore;
    const ValidationReport report = ValidateWith(options);
    if (!report.valid) {
      FailWithReport("ignore policy must keep manifest valid", report);
    }
    if (ContainsWarning(report, "mods[2].name", "duplicates") ||
        ContainsWarning(report, "mods[0].version", "differs")) {
      FailWithReport("ignore policy must drop policy findings", report);
    }
  }

  std::cout << "manifest_policy_smoke: ok\n";
  return 0;
}
