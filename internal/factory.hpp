#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/jobs/queue.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/runtime/container_runtime.hpp"
#include "internal/service/cicd_service.hpp"

namespace buildq::factory {

/*
  Application

  Owns all long-lived components. The queue is built with its handlers
  registered but not started; the caller decides when to Start/Stop.
*/
struct Application {
  std::shared_ptr<db::Repository>              repository;
  std::shared_ptr<runtime::ContainerRuntime>   runtime;
  std::shared_ptr<observability::MetricsSink>  metrics;
  std::shared_ptr<jobs::Queue>                 queue;
  std::shared_ptr<service::CicdService>        cicd;
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete store and runtime types.
*/
Application Build(const buildq::runtime::config::RuntimeConfig& config);

// Same graph with a caller-supplied container runtime (tests, dry runs).
Application Build(const buildq::runtime::config::RuntimeConfig& config, std::shared_ptr<runtime::ContainerRuntime> container_runtime);

std::shared_ptr<db::Repository> BuildRepository(const buildq::runtime::config::RuntimeConfig& config);

} // namespace buildq::factory
