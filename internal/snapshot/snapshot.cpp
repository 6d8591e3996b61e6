#include "snapshot.hpp"

namespace signoff::snapshot {

namespace {

template <typename Value>
const std::vector<Value>& EmptyVector() {
  static const std::vector<Value> empty;
  return empty;
}

} // namespace

Snapshot::Snapshot(db::model::SnapshotTables tables) : tables_(std::move(tables)) {
  std::unordered_map<std::string, std::size_t> position;
  contracts_.reserve(tables_.contracts.size());
  for (auto& contract : tables_.contracts) {
    auto [it, inserted] = position.emplace(contract.booking_contract, contracts_.size());
    if (inserted) {
      contracts_.push_back(std::move(contract));
      continue;
    }
    ++duplicate_contract_rows_;
    auto& kept = contracts_[it->second];
    if (kept.is_deleted && !contract.is_deleted) {
      kept = std::move(contract);
    }
  }
  // the deduplicated copy is the only one read from here on
  tables_.contracts.clear();

  for (const auto& signoff : tables_.signoffs) {
    contracts_with_any_signoff_.insert(signoff.booking_contract);
    if (!signoff.is_deleted) {
      live_signoffs_[signoff.booking_contract].push_back(&signoff);
    }
  }

  for (const auto& assignment : tables_.responsible_users) {
    if (!assignment.is_deleted) {
      responsible_users_[assignment.booking_contract].push_back(assignment.dc_user_id);
    }
  }

  for (const auto& dimension : tables_.dimensions) {
    dimensions_.emplace(std::make_pair(dimension.kind, dimension.id), dimension.name);
  }

  for (const auto& user : tables_.users) {
    users_.emplace(user.user_id, &user);
  }

  for (const auto& day : tables_.calendar) {
    calendar_.emplace(day.date, &day);
  }
}

const std::vector<const db::model::SignoffRecord*>& Snapshot::LiveSignoffs(const std::string& booking_contract) const {
  auto it = live_signoffs_.find(booking_contract);
  if (it == live_signoffs_.end()) return EmptyVector<const db::model::SignoffRecord*>();
  return it->second;
}

const std::vector<std::int64_t>& Snapshot::ResponsibleUsers(const std::string& booking_contract) const {
  auto it = responsible_users_.find(booking_contract);
  if (it == responsible_users_.end()) return EmptyVector<std::int64_t>();
  return it->second;
}

std::optional<std::string_view> Snapshot::DimensionName(db::model::DimensionKind kind, std::int64_t id) const {
  auto it = dimensions_.find({kind, id});
  if (it == dimensions_.end()) return std::nullopt;
  return it->second;
}

const db::model::CalendarDateRecord* Snapshot::FindCalendarDate(util::Date date) const {
  auto it = calendar_.find(date);
  return it == calendar_.end() ? nullptr : it->second;
}

const db::model::UserRecord* Snapshot::FindUser(std::int64_t user_id) const {
  auto it = users_.find(user_id);
  return it == users_.end() ? nullptr : it->second;
}

} // namespace signoff::snapshot
