#pragma once

#include <memory>

namespace buildq::db {
class Repository;
}
namespace buildq::jobs {
class Queue;
}

namespace buildq::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<buildq::db::Repository> repository;
  std::shared_ptr<buildq::jobs::Queue>    queue;
};

} // namespace buildq::service
