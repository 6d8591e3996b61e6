#pragma once

#include <cstddef>
#include <memory>

namespace signoff::reports {
class RunCoordinator;
class ReportStore;
} // namespace signoff::reports

namespace signoff::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<signoff::reports::RunCoordinator> coordinator;
  std::shared_ptr<signoff::reports::ReportStore>    store;

  std::size_t default_page_size = 100;
  std::size_t max_page_size     = 1000;
};

} // namespace signoff::service
