#pragma once

// Small data set loaded through FixtureLoader by the service and
// repository tests. Evaluated at 2024-06-15T00:00:00Z:
//   history            C1 x2, C2, C3 placeholder
//   qualification      C1, C2
//   never signed off   C3
//   risk               C1 (alice), C2 (sentinel)
namespace signoff::testing {

inline constexpr const char* kSampleFixture = R"(
dimensions:
  signoff_method: {1: Portal, 7: Deferred}
  sign_off_identity: {1: Customer}
  defer_signoff_reason: {1: "None"}
  signoff_event_type: {1: Renewal}
  engagement: {1: Onboarding}
  service_type: {1: Support}
  buying_program: {1: Enterprise Agreement}
  theater: {1: Americas}
  pricing_model: {1: Subscription}

contracts:
  - booking_contract: C1
    agreement_start_date: 2024-01-01
    agreement_end_date: 2024-12-31
    account_name: Acme
    booking_country: US
    booked_theater_id: 1
    sold_as_service_type_id: 1
    buying_program_type_id: 1
    sold_as_pricing_type_id: 1
    sold_as_sw_allocation: 0.4
    sold_as_hw_allocation: 0.6
  - booking_contract: C2
    agreement_start_date: 2024-01-01
    agreement_end_date: 2024-12-31
    account_name: Globex
    booking_country: DE
    booked_theater_id: 1
    sold_as_service_type_id: 1
    buying_program_type_id: 1
    sold_as_pricing_type_id: 1
  - booking_contract: C3
    agreement_start_date: 2024-01-01
    agreement_end_date: 2024-12-31
    account_name: Initech
    booking_country: US
    booked_theater_id: 1
    sold_as_service_type_id: 1
    buying_program_type_id: 1
    sold_as_pricing_type_id: 1

signoffs:
  - {signoff_id: 1, booking_contract: C1, dc_user_id: 10, create_dtm: "2024-03-01T09:00:00Z", signoff_method_id: 1,
     sign_off_identity_id: 1, defer_signoff_reason_id: 1, dc_engagement_id: 1, signoff_event_id: 1, notes: first}
  - {signoff_id: 2, booking_contract: C1, dc_user_id: 10, create_dtm: "2024-05-20T09:00:00Z", signoff_method_id: 1,
     sign_off_identity_id: 1, defer_signoff_reason_id: 1, dc_engagement_id: 1, signoff_event_id: 1, notes: second}
  - {signoff_id: 3, booking_contract: C2, dc_user_id: 10, create_dtm: "2024-06-01T09:00:00Z", signoff_method_id: 1,
     sign_off_identity_id: 1, defer_signoff_reason_id: 1, dc_engagement_id: 1, signoff_event_id: 1, notes: only}

responsible_users:
  - {booking_contract: C1, dc_user_id: 10}

users:
  - {user_id: 10, user_title: Engineer, cco_id: alice@cisco.com}

org_hierarchy:
  - emp_cco_id: alice
    emp_cco_id_masked: M-10
    emp_name: Alice
    level6_worker_name: VP Alice
    level7_worker_name: Director
    level8_worker_name: Manager
    level9_worker_name: Lead
    mgr_name: Bob
    theater: Americas

calendar:
  - {date: 2024-03-01, fiscal_qtr_sorted_name: FY2024 Q3, fiscal_mth_sorted_name: FY2024 M08, cal_week_sorted_short_name: 2024 W09}
  - {date: 2024-05-20, fiscal_qtr_sorted_name: FY2024 Q4, fiscal_mth_sorted_name: FY2024 M10, cal_week_sorted_short_name: 2024 W21}
  - {date: 2024-06-01, fiscal_qtr_sorted_name: FY2024 Q4, fiscal_mth_sorted_name: FY2024 M11, cal_week_sorted_short_name: 2024 W22}
)";

} // namespace signoff::testing
