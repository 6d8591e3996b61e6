#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace signoff::db::model {

enum class DimensionKind {
  SignoffMethod,
  SignOffIdentity,
  DeferSignoffReason,
  SignoffEventType,
  Engagement,
  ServiceType,
  BuyingProgram,
  Theater,
  PricingModel,
};

inline constexpr std::array<DimensionKind, 9> kAllDimensionKinds = {
    DimensionKind::SignoffMethod, DimensionKind::SignOffIdentity, DimensionKind::DeferSignoffReason,
    DimensionKind::SignoffEventType, DimensionKind::Engagement, DimensionKind::ServiceType,
    DimensionKind::BuyingProgram, DimensionKind::Theater, DimensionKind::PricingModel,
};

struct DimensionRecord {
  DimensionKind kind = DimensionKind::SignoffMethod;
  std::int64_t  id   = 0;
  std::string   name;
};

// Stable name used as the `kind` column value and in drop counter reasons.
inline std::string_view DimensionKindName(DimensionKind kind) {
  switch (kind) {
    case DimensionKind::SignoffMethod:
      return "signoff_method";
    case DimensionKind::SignOffIdentity:
      return "sign_off_identity";
    case DimensionKind::DeferSignoffReason:
      return "defer_signoff_reason";
    case DimensionKind::SignoffEventType:
      return "signoff_event_type";
    case DimensionKind::Engagement:
      return "engagement";
    case DimensionKind::ServiceType:
      return "service_type";
    case DimensionKind::BuyingProgram:
      return "buying_program";
    case DimensionKind::Theater:
      return "theater";
    case DimensionKind::PricingModel:
      return "pricing_model";
  }
  return "unknown";
}

inline std::optional<DimensionKind> ParseDimensionKind(std::string_view name) {
  for (auto kind : kAllDimensionKinds) {
    if (DimensionKindName(kind) == name) return kind;
  }
  return std::nullopt;
}

} // namespace signoff::db::model
