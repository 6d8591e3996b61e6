#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace signoff::db {
class Repository;
}

namespace signoff::reports {
class ReportStore;
class RunCoordinator;
class ReportScheduler;
} // namespace signoff::reports

namespace signoff::service {
class ReportService;
}

namespace signoff::factory {

/*
  Application

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>            repository;
  std::shared_ptr<reports::ReportStore>      store;
  std::shared_ptr<reports::RunCoordinator>   coordinator;
  std::shared_ptr<service::ReportService>    report_service;
  std::shared_ptr<reports::ReportScheduler>  scheduler; // null when refresh_interval_sec is 0

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  BuildRepository

  Opens the configured backend and creates the input tables when missing.
  Memory when no database section is given.
*/
std::shared_ptr<db::Repository> BuildRepository(const signoff::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const signoff::runtime::config::RuntimeConfig& config);

} // namespace signoff::factory
