#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

#include "internal/db/model/dimension_record.hpp"

namespace signoff::compliance {

inline constexpr std::string_view kDuplicateContract       = "duplicate_contract";
inline constexpr std::string_view kInvalidAgreementDates   = "invalid_agreement_dates";
inline constexpr std::string_view kMissingUser             = "missing_user";
inline constexpr std::string_view kMissingDate             = "missing_date";

/*
  Per-pipeline, per-run counters of rows that were silently excluded.
  Counting never changes what a pipeline emits.
*/
class DropCounters {
 public:
  void Add(std::string_view reason, std::uint64_t count = 1) {
    if (count == 0) return;
    counts_[std::string(reason)] += count;
  }

  void AddMissing(db::model::DimensionKind kind, std::uint64_t count = 1) {
    Add("missing_" + std::string(db::model::DimensionKindName(kind)), count);
  }

  std::uint64_t Get(std::string_view reason) const {
    auto it = counts_.find(std::string(reason));
    return it == counts_.end() ? 0 : it->second;
  }

  std::uint64_t Total() const {
    std::uint64_t total = 0;
    for (const auto& [_, count] : counts_) total += count;
    return total;
  }

  const std::map<std::string, std::uint64_t>& All() const {
    return counts_;
  }

 private:
  std::map<std::string, std::uint64_t> counts_;
};

} // namespace signoff::compliance
