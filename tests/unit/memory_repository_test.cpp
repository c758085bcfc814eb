#include "internal/db/memory/memory_repository.hpp"

#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

#include "repository_contract.hpp"

namespace {

using buildq::db::ErrorCode;
using buildq::db::memory::MemoryRepository;

void TestContract() {
  {
    MemoryRepository repo;
    buildq::testing::CheckServices(repo);
  }
  {
    MemoryRepository repo;
    buildq::testing::CheckBuilds(repo);
  }
  {
    MemoryRepository repo;
    buildq::testing::CheckDeployments(repo);
  }
}

void TestIdsStartAtOne() {
  MemoryRepository repo;
  auto             service = buildq::testing::AddService(repo, "first");
  assert(service.id == 1);
}

void TestExplicitIdIsKept() {
  MemoryRepository repo;

  buildq::db::model::ServiceRecord service;
  service.id   = 10;
  service.name = "pinned";
  auto r       = repo.CreateService(service);
  assert(r);
  assert(service.id == 10);

  // Counter moves past the explicit id.
  auto next = buildq::testing::AddService(repo, "next");
  assert(next.id == 11);

  buildq::db::model::ServiceRecord dup;
  dup.id   = 10;
  dup.name = "dup";
  r        = repo.CreateService(dup);
  assert(r.code == ErrorCode::AlreadyExists);
  assert(repo.GetService(10)->name == "pinned");
}

void TestConcurrentInsertsGetDistinctIds() {
  MemoryRepository repo;
  auto             service = buildq::testing::AddService(repo, "busy");

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 50; ++i) buildq::testing::AddBuild(repo, service.id, "main");
    });
  }
  for (auto& t : threads) t.join();

  auto builds = repo.ListBuilds(service.id);
  assert(builds.size() == 200);
  for (std::size_t i = 1; i < builds.size(); ++i) assert(builds[i - 1].id > builds[i].id);
}

} // namespace

int main() {
  TestContract();
  TestIdsStartAtOne();
  TestExplicitIdIsKept();
  TestConcurrentInsertsGetDistinctIds();

  std::cout << "buildq_unit_memory_repository: pass\n";
  return 0;
}
