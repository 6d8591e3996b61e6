#include "arrow_report_exporter.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <arrow/ipc/writer.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/report/report_set.hpp"
#include "internal/util/time.hpp"

namespace signoff::exporter {

using namespace signoff::compliance;

namespace {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return *result;
}

void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

void AppendValue(arrow::TimestampBuilder& builder, util::TimePoint value) {
  Unwrap(builder.Append(util::ToUnixMillis(value)));
}

template <typename Builder, typename T>
void AppendValue(Builder& builder, const T& value) {
  Unwrap(builder.Append(value));
}

template <typename Builder, typename T>
void AppendValue(Builder& builder, const std::optional<T>& value) {
  if (value) {
    AppendValue(builder, *value);
  } else {
    Unwrap(builder.AppendNull());
  }
}

/*
  Column-at-a-time record batch builder over one report's rows.
*/
template <typename Row>
class BatchBuilder {
 public:
  explicit BatchBuilder(const std::vector<Row>& rows) : rows_(rows) {
  }

  template <typename Fn>
  BatchBuilder& Utf8(const std::string& name, Fn get) {
    arrow::StringBuilder builder;
    return Add(name, arrow::utf8(), builder, get);
  }

  template <typename Fn>
  BatchBuilder& Int64(const std::string& name, Fn get) {
    arrow::Int64Builder builder;
    return Add(name, arrow::int64(), builder, get);
  }

  template <typename Fn>
  BatchBuilder& Float64(const std::string& name, Fn get) {
    arrow::DoubleBuilder builder;
    return Add(name, arrow::float64(), builder, get);
  }

  template <typename Fn>
  BatchBuilder& Bool(const std::string& name, Fn get) {
    arrow::BooleanBuilder builder;
    return Add(name, arrow::boolean(), builder, get);
  }

  template <typename Fn>
  BatchBuilder& Timestamp(const std::string& name, Fn get) {
    auto                    type = arrow::timestamp(arrow::TimeUnit::MILLI, "UTC");
    arrow::TimestampBuilder builder(type, arrow::default_memory_pool());
    return Add(name, type, builder, get);
  }

  std::shared_ptr<arrow::RecordBatch> Finish() const {
    return arrow::RecordBatch::Make(arrow::schema(fields_), static_cast<int64_t>(rows_.size()), arrays_);
  }

 private:
  template <typename Builder, typename Fn>
  BatchBuilder& Add(const std::string& name, const std::shared_ptr<arrow::DataType>& type, Builder& builder, Fn& get) {
    Unwrap(builder.Reserve(static_cast<int64_t>(rows_.size())));
    for (const auto& row : rows_) {
      AppendValue(builder, get(row));
    }
    std::shared_ptr<arrow::Array> array;
    Unwrap(builder.Finish(&array));
    fields_.push_back(arrow::field(name, type));
    arrays_.push_back(std::move(array));
    return *this;
  }

  const std::vector<Row>&                     rows_;
  std::vector<std::shared_ptr<arrow::Field>>  fields_;
  std::vector<std::shared_ptr<arrow::Array>>  arrays_;
};

template <typename Row>
void AddContractLabels(BatchBuilder<Row>& batch) {
  batch.Utf8("sold_as_service_name", [](const Row& r) { return r.contract.sold_as_service_name; })
      .Utf8("booking_country", [](const Row& r) { return r.contract.booking_country; })
      .Utf8("buying_program_name", [](const Row& r) { return r.contract.buying_program_name; })
      .Utf8("pricing_model_name", [](const Row& r) { return r.contract.pricing_model_name; })
      .Utf8("booked_theater", [](const Row& r) { return r.contract.booked_theater; });
}

template <typename Row>
void AddOrgAttribution(BatchBuilder<Row>& batch) {
  batch.Utf8("level6_worker_name", [](const Row& r) { return r.org.level6_worker_name; })
      .Utf8("level7_worker_name", [](const Row& r) { return r.org.level7_worker_name; })
      .Utf8("level8_worker_name", [](const Row& r) { return r.org.level8_worker_name; })
      .Utf8("level9_worker_name", [](const Row& r) { return r.org.level9_worker_name; })
      .Utf8("emp_cco_id_masked", [](const Row& r) { return r.org.emp_cco_id_masked; })
      .Utf8("mgr_name", [](const Row& r) { return r.org.mgr_name; })
      .Utf8("theater", [](const Row& r) { return r.org.theater; });
}

template <typename Row>
void AddAccountColumns(BatchBuilder<Row>& batch) {
  batch.Utf8("account_name", [](const Row& r) { return r.contract.account_name; })
      .Float64("sold_as_sw_allocation", [](const Row& r) { return r.contract.sold_as_sw_allocation; })
      .Float64("sold_as_hw_allocation", [](const Row& r) { return r.contract.sold_as_hw_allocation; });
}

// Signoff-side columns are null on the placeholder row of a contract
// without events.
template <typename Fn>
auto FromSignoff(Fn get) {
  return [get](const HistoryRow& r) -> std::optional<std::invoke_result_t<Fn&, const HistoryRow&>> {
    if (!r.has_signoff) return std::nullopt;
    return get(r);
  };
}

std::shared_ptr<arrow::RecordBatch> HistoryBatch(const std::vector<HistoryRow>& rows) {
  BatchBuilder<HistoryRow> batch(rows);
  AddContractLabels(batch);
  batch.Utf8("reference_booking_contract", [](const HistoryRow& r) { return r.contract.booking_contract; })
      .Utf8("notes", FromSignoff([](const HistoryRow& r) { return r.notes; }))
      .Utf8("sign_off_identity", FromSignoff([](const HistoryRow& r) { return r.sign_off_identity; }))
      .Utf8("signoff_method", FromSignoff([](const HistoryRow& r) { return r.signoff_method; }))
      .Utf8("defer_signoff_reason", FromSignoff([](const HistoryRow& r) { return r.defer_signoff_reason; }))
      .Utf8("engagement_name", FromSignoff([](const HistoryRow& r) { return r.engagement_name; }))
      .Int64("dc_engagement_id", FromSignoff([](const HistoryRow& r) { return r.dc_engagement_id; }))
      .Utf8("booking_contract", FromSignoff([](const HistoryRow& r) { return r.contract.booking_contract; }))
      .Utf8("user_title", FromSignoff([](const HistoryRow& r) { return r.user_title; }))
      .Utf8("fiscal_qtr_sorted_name", FromSignoff([](const HistoryRow& r) { return r.fiscal_qtr_sorted_name; }))
      .Utf8("fiscal_mth_sorted_name", FromSignoff([](const HistoryRow& r) { return r.fiscal_mth_sorted_name; }))
      .Utf8("cal_week_sorted_short_name", FromSignoff([](const HistoryRow& r) { return r.cal_week_sorted_short_name; }))
      .Timestamp("create_dtm", [](const HistoryRow& r) { return r.create_dtm; })
      .Int64("signoff_days_ago", FromSignoff([](const HistoryRow& r) { return r.signoff_days_ago; }))
      .Int64("dc_user_id", FromSignoff([](const HistoryRow& r) { return r.dc_user_id; }))
      .Timestamp("signoff_create_dtm", [](const HistoryRow& r) { return r.create_dtm; })
      .Bool("is_last_signoff", [](const HistoryRow& r) { return r.is_last_signoff; });
  AddOrgAttribution(batch);
  AddAccountColumns(batch);
  return batch.Finish();
}

std::shared_ptr<arrow::RecordBatch> QualificationBatch(const std::vector<QualificationRow>& rows) {
  BatchBuilder<QualificationRow> batch(rows);
  batch.Utf8("booking_contract", [](const QualificationRow& r) { return r.booking_contract; })
      .Utf8("ibv_method", [](const QualificationRow& r) { return r.ibv_method; })
      .Utf8("ibv_identity", [](const QualificationRow& r) { return r.ibv_identity; })
      .Utf8("ibv_event", [](const QualificationRow& r) { return r.ibv_event; })
      .Utf8("notes", [](const QualificationRow& r) { return r.notes; })
      .Utf8("qualified_ibv", [](const QualificationRow& r) { return r.qualified_ibv; })
      .Int64("days_since_last_signoff_event", [](const QualificationRow& r) { return r.days_since_last_signoff_event; })
      .Timestamp("last_signoff_date", [](const QualificationRow& r) { return r.last_signoff_date; });
  return batch.Finish();
}

template <typename Row>
void AddNeverSignedOffColumns(BatchBuilder<Row>& batch) {
  batch.Utf8("booking_contract", [](const Row& r) { return r.contract.booking_contract; });
  AddContractLabels(batch);
  AddOrgAttribution(batch);
  AddAccountColumns(batch);
}

std::shared_ptr<arrow::RecordBatch> NeverSignedOffBatch(const std::vector<NeverSignedOffRow>& rows) {
  BatchBuilder<NeverSignedOffRow> batch(rows);
  AddNeverSignedOffColumns(batch);
  return batch.Finish();
}

std::shared_ptr<arrow::RecordBatch> RiskBatch(const std::vector<RiskRow>& rows) {
  BatchBuilder<RiskRow> batch(rows);
  AddNeverSignedOffColumns(batch);
  batch.Int64("signoff_days_ago", [](const RiskRow& r) { return r.signoff_days_ago; })
      .Utf8("signoff_risk", [](const RiskRow& r) { return r.signoff_risk; })
      .Timestamp("last_signoff_date", [](const RiskRow& r) { return r.last_signoff_date; });
  return batch.Finish();
}

/*
  Atomic write:
      write tmp → close → rename
*/
void WriteIpcFile(const std::filesystem::path& final_path, const std::shared_ptr<arrow::RecordBatch>& batch) {
  const auto tmp_path = final_path.string() + ".tmp";
  {
    auto out    = Unwrap(arrow::io::FileOutputStream::Open(tmp_path));
    auto writer = Unwrap(arrow::ipc::MakeFileWriter(out, batch->schema()));
    Unwrap(writer->WriteRecordBatch(*batch));
    Unwrap(writer->Close());
    Unwrap(out->Close());
  }
  std::filesystem::rename(tmp_path, final_path);
}

} // namespace

ArrowReportExporter::ArrowReportExporter(std::filesystem::path root) : root_(std::move(root)) {
  std::filesystem::create_directories(root_);
}

void ArrowReportExporter::Export(const signoff::reports::ReportSet& reports) {
  const auto dir = root_ / reports.run_id;
  std::filesystem::create_directories(dir);

  const auto& tables = reports.tables;
  WriteIpcFile(dir / "history.arrow", HistoryBatch(tables.history.rows));
  WriteIpcFile(dir / "qualification.arrow", QualificationBatch(tables.qualification.rows));
  WriteIpcFile(dir / "never_signed_off.arrow", NeverSignedOffBatch(tables.never_signed_off.rows));
  WriteIpcFile(dir / "risk.arrow", RiskBatch(tables.risk.rows));

  SIGNOFF_LOG_INFO("Exported report set", {signoff::observability::StringField("directory", dir.string())});
}

} // namespace signoff::exporter
