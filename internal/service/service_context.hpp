#pragma once

#include <cstdint>
#include <memory>

namespace beacon::ingest {
class IngestGate;
}
namespace beacon::db {
class Repository;
}

namespace beacon::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<beacon::ingest::IngestGate> gate;
  std::shared_ptr<beacon::db::Repository>     repository;

  // capacity assumed by ranking when a server reports none
  std::int64_t default_capacity = 70;
};

} // namespace beacon::service
