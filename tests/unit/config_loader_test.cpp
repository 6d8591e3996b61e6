#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/compliance/compliance_settings.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "signoff_reporter_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)signoff::config::ConfigLoader::LoadFromString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
database:
  sqlite:
    path: "C:\\signoff\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = signoff::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\signoff\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().has_wal_mode());
  assert(config.database().sqlite().wal_mode());
}

void TestWalModeIsUnsetWhenOmitted() {
  auto config = signoff::config::ConfigLoader::LoadFromString(R"(database:
  sqlite:
    path: "/tmp/signoff.db"
)");
  assert(!config.database().sqlite().has_wal_mode());
}

void TestQuotedNumbersStayStrings() {
  auto config = signoff::config::ConfigLoader::LoadFromString(R"(server:
  bind_address: "50051"
)");
  assert(config.server().bind_address() == "50051");
}

void TestComplianceSectionOverridesDefaults() {
  auto config = signoff::config::ConfigLoader::LoadFromString(R"(compliance:
  org_domain: example.org
  deferred_method_id: 9
  overdue_after_days: 45
  low_risk_max_days: 30
  med_risk_max_days: 60
  qualification_grace_days: 15
reports:
  retained_runs: 3
  refresh_interval_sec: 600
  export:
    directory: /tmp/reports
)");

  const auto settings = signoff::compliance::ComplianceSettings::FromConfig(config.compliance());
  assert(settings.org_domain == "example.org");
  assert(settings.deferred_method_id == 9);
  assert(settings.overdue_after_days == 45);
  assert(settings.low_risk_max_days == 30);
  assert(settings.med_risk_max_days == 60);
  assert(settings.qualification_grace_days == 15);
  // unset fields keep defaults
  assert(settings.history_grace_months == 1);
  assert(settings.risk_min_age_months == 3);

  assert(config.reports().retained_runs() == 3);
  assert(config.reports().refresh_interval_sec() == 600);
  assert(config.reports().export_().directory() == "/tmp/reports");
}

void TestEmptyConfigUsesDefaults() {
  auto       config   = signoff::config::ConfigLoader::LoadFromString("");
  const auto settings = signoff::compliance::ComplianceSettings::FromConfig(config.compliance());
  assert(settings.org_domain == "cisco.com");
  assert(settings.deferred_method_id == 7);
  assert(settings.overdue_after_days == 90);
  assert(settings.low_risk_max_days == 60);
  assert(settings.med_risk_max_days == 90);
  assert(!config.database().has_sqlite());
  assert(!config.reports().has_retained_runs());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)signoff::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestSemanticValidation() {
  assert(Rejects("compliance:\n  org_domain: \"user@cisco.com\"\n"));
  assert(Rejects("compliance:\n  low_risk_max_days: 100\n  med_risk_max_days: 90\n"));
  assert(Rejects("compliance:\n  history_grace_months: -1\n"));
  assert(Rejects("reports:\n  retained_runs: 0\n"));
  assert(Rejects("database:\n  sqlite:\n    wal_mode: true\n"));
  assert(!Rejects("compliance:\n  low_risk_max_days: 90\n  med_risk_max_days: 90\n"));
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestWalModeIsUnsetWhenOmitted();
  TestQuotedNumbersStayStrings();
  TestComplianceSectionOverridesDefaults();
  TestEmptyConfigUsesDefaults();
  TestUnknownFieldsAreRejected();
  TestSemanticValidation();

  std::cout << "signoff_reporter_unit_config_loader: pass\n";
  return 0;
}
