#include "compliance_settings.hpp"

#include "config/config.pb.h"

namespace signoff::compliance {

ComplianceSettings ComplianceSettings::FromConfig(const signoff::runtime::config::ComplianceConfig& config) {
  ComplianceSettings settings;
  if (config.has_org_domain()) settings.org_domain = config.org_domain();
  if (config.has_deferred_method_id()) settings.deferred_method_id = config.deferred_method_id();
  if (config.has_overdue_after_days()) settings.overdue_after_days = config.overdue_after_days();
  if (config.has_low_risk_max_days()) settings.low_risk_max_days = config.low_risk_max_days();
  if (config.has_med_risk_max_days()) settings.med_risk_max_days = config.med_risk_max_days();
  if (config.has_history_grace_months()) settings.history_grace_months = config.history_grace_months();
  if (config.has_qualification_grace_days()) settings.qualification_grace_days = config.qualification_grace_days();
  if (config.has_risk_min_age_months()) settings.risk_min_age_months = config.risk_min_age_months();
  return settings;
}

} // namespace signoff::compliance
