#include "fixture_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <optional>
#include <stdexcept>

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace signoff::seed {

using namespace signoff::db::model;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& prefix) {
  if (result) {
    return;
  }
  throw std::runtime_error(prefix + ": " + std::string(db::ErrorCodeName(result.code)) + ": " + result.message);
}

template <typename T>
T Get(const YAML::Node& node, const char* key, T fallback = T{}) {
  const auto value = node[key];
  if (!value || value.IsNull()) return fallback;
  try {
    return value.as<T>();
  } catch (const YAML::Exception& e) {
    throw util::InvalidArgument(std::string("fixture field '") + key + "': " + e.what());
  }
}

template <typename T>
T Require(const YAML::Node& node, const char* key) {
  if (!node[key] || node[key].IsNull()) {
    throw util::InvalidArgument(std::string("fixture field '") + key + "' is required");
  }
  return Get<T>(node, key);
}

std::optional<util::Date> GetDate(const YAML::Node& node, const char* key) {
  const auto text = Get<std::string>(node, key);
  if (text.empty()) return std::nullopt;
  auto date = util::ParseDate(text);
  if (!date) {
    throw util::InvalidArgument(std::string("fixture field '") + key + "' is not a YYYY-MM-DD date: " + text);
  }
  return date;
}

util::TimePoint RequireTimestamp(const YAML::Node& node, const char* key) {
  const auto text = Require<std::string>(node, key);
  auto       tp   = util::ParseTimestamp(text);
  if (!tp) {
    throw util::InvalidArgument(std::string("fixture field '") + key + "' is not a timestamp: " + text);
  }
  return *tp;
}

template <typename Fn>
std::size_t ForEachEntry(const YAML::Node& root, const char* section, Fn&& fn) {
  const auto list = root[section];
  if (!list) return 0;
  if (!list.IsSequence()) {
    throw util::InvalidArgument(std::string("fixture section '") + section + "' must be a list");
  }
  for (const auto& entry : list) {
    fn(entry);
  }
  return list.size();
}

} // namespace

FixtureStats FixtureLoader::LoadFile(db::Repository& repository, const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load fixture " + path + ": " + e.what());
  }
  return Load(repository, root);
}

FixtureStats FixtureLoader::LoadString(db::Repository& repository, const std::string& yaml_text) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse fixture: " + std::string(e.what()));
  }
  return Load(repository, root);
}

FixtureStats FixtureLoader::Load(db::Repository& repository, const YAML::Node& root) {
  if (root.IsNull()) return {};
  if (!root.IsMap()) {
    throw util::InvalidArgument("fixture root must be a map");
  }

  FixtureStats stats;
  auto         tx = repository.Begin();

  stats.contracts = ForEachEntry(root, "contracts", [&](const YAML::Node& n) {
    BookingContractRecord record;
    record.booking_contract        = Require<std::string>(n, "booking_contract");
    record.agreement_start_date    = GetDate(n, "agreement_start_date");
    record.agreement_end_date      = GetDate(n, "agreement_end_date");
    record.is_deleted              = Get<bool>(n, "is_deleted");
    record.account_name            = Get<std::string>(n, "account_name");
    record.booking_country         = Get<std::string>(n, "booking_country");
    record.booked_theater_id       = Get<std::int64_t>(n, "booked_theater_id");
    record.sold_as_service_type_id = Get<std::int64_t>(n, "sold_as_service_type_id");
    record.buying_program_type_id  = Get<std::int64_t>(n, "buying_program_type_id");
    record.sold_as_pricing_type_id = Get<std::int64_t>(n, "sold_as_pricing_type_id");
    record.sold_as_sw_allocation   = Get<double>(n, "sold_as_sw_allocation");
    record.sold_as_hw_allocation   = Get<double>(n, "sold_as_hw_allocation");
    ThrowIfDbError(repository.InsertContract(*tx, record), "insert contract " + record.booking_contract);
  });

  stats.signoffs = ForEachEntry(root, "signoffs", [&](const YAML::Node& n) {
    SignoffRecord record;
    record.signoff_id              = Require<std::int64_t>(n, "signoff_id");
    record.booking_contract        = Require<std::string>(n, "booking_contract");
    record.dc_user_id              = Get<std::int64_t>(n, "dc_user_id");
    record.create_dtm              = RequireTimestamp(n, "create_dtm");
    record.signoff_method_id       = Get<std::int64_t>(n, "signoff_method_id");
    record.sign_off_identity_id    = Get<std::int64_t>(n, "sign_off_identity_id");
    record.defer_signoff_reason_id = Get<std::int64_t>(n, "defer_signoff_reason_id");
    record.dc_engagement_id        = Get<std::int64_t>(n, "dc_engagement_id");
    record.signoff_event_id        = Get<std::int64_t>(n, "signoff_event_id");
    record.notes                   = Get<std::string>(n, "notes");
    record.is_deleted              = Get<bool>(n, "is_deleted");
    ThrowIfDbError(repository.InsertSignoff(*tx, record), "insert signoff " + std::to_string(record.signoff_id));
  });

  stats.responsible_users = ForEachEntry(root, "responsible_users", [&](const YAML::Node& n) {
    ResponsibleUserRecord record;
    record.booking_contract = Require<std::string>(n, "booking_contract");
    record.dc_user_id       = Require<std::int64_t>(n, "dc_user_id");
    record.is_deleted       = Get<bool>(n, "is_deleted");
    ThrowIfDbError(repository.InsertResponsibleUser(*tx, record), "insert responsible user for " + record.booking_contract);
  });

  stats.users = ForEachEntry(root, "users", [&](const YAML::Node& n) {
    UserRecord record;
    record.user_id    = Require<std::int64_t>(n, "user_id");
    record.user_title = Get<std::string>(n, "user_title");
    record.cco_id     = Get<std::string>(n, "cco_id");
    record.is_deleted = Get<bool>(n, "is_deleted");
    ThrowIfDbError(repository.InsertUser(*tx, record), "insert user " + std::to_string(record.user_id));
  });

  stats.org_hierarchy = ForEachEntry(root, "org_hierarchy", [&](const YAML::Node& n) {
    OrgHierarchyRecord record;
    record.emp_cco_id = Require<std::string>(n, "emp_cco_id");
    if (n["emp_cco_id_masked"] && !n["emp_cco_id_masked"].IsNull()) {
      record.emp_cco_id_masked = Get<std::string>(n, "emp_cco_id_masked");
    }
    record.emp_name           = Get<std::string>(n, "emp_name");
    record.level6_worker_name = Get<std::string>(n, "level6_worker_name");
    record.level7_worker_name = Get<std::string>(n, "level7_worker_name");
    record.level8_worker_name = Get<std::string>(n, "level8_worker_name");
    record.level9_worker_name = Get<std::string>(n, "level9_worker_name");
    record.mgr_name           = Get<std::string>(n, "mgr_name");
    record.theater            = Get<std::string>(n, "theater");
    ThrowIfDbError(repository.InsertOrgHierarchy(*tx, record), "insert org hierarchy " + record.emp_cco_id);
  });

  stats.calendar_dates = ForEachEntry(root, "calendar", [&](const YAML::Node& n) {
    CalendarDateRecord record;
    const auto         date = GetDate(n, "date");
    if (!date) {
      throw util::InvalidArgument("fixture field 'date' is required");
    }
    record.date                       = *date;
    record.fiscal_qtr_sorted_name     = Get<std::string>(n, "fiscal_qtr_sorted_name");
    record.fiscal_mth_sorted_name     = Get<std::string>(n, "fiscal_mth_sorted_name");
    record.cal_week_sorted_short_name = Get<std::string>(n, "cal_week_sorted_short_name");
    ThrowIfDbError(repository.InsertCalendarDate(*tx, record), "insert calendar date " + util::FormatDate(record.date));
  });

  if (const auto dimensions = root["dimensions"]) {
    if (!dimensions.IsMap()) {
      throw util::InvalidArgument("fixture section 'dimensions' must be a map of kind to {id: name}");
    }
    for (const auto& kind_entry : dimensions) {
      const auto kind_name = kind_entry.first.as<std::string>();
      const auto kind      = ParseDimensionKind(kind_name);
      if (!kind) {
        throw util::InvalidArgument("unknown dimension kind: " + kind_name);
      }
      if (!kind_entry.second.IsMap()) {
        throw util::InvalidArgument("dimension '" + kind_name + "' must be a map of id to name");
      }
      for (const auto& row : kind_entry.second) {
        DimensionRecord record;
        record.kind = *kind;
        try {
          record.id   = row.first.as<std::int64_t>();
          record.name = row.second.as<std::string>();
        } catch (const YAML::Exception& e) {
          throw util::InvalidArgument("dimension '" + kind_name + "': " + e.what());
        }
        ThrowIfDbError(repository.InsertDimension(*tx, record), "insert " + kind_name + " " + std::to_string(record.id));
        ++stats.dimensions;
      }
    }
  }

  tx->Commit();
  return stats;
}

} // namespace signoff::seed
