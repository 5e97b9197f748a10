#include <catch2/catch.hpp>

#include "vidcap/task_queue.hpp"

#include <atomic>
#include <thread>
#include <string>
#include <vector>

using namespace vidcap;

static RenderTask make_task(int id) {
  RenderTask t;
  t.job_id = id;
  t.project.folder = "/projects/p" + std::to_string(id);
  return t;
}

TEST_CASE("Queued projects come out in submission order", "[task_queue]") {
  TaskQueue queue;
  queue.submit(make_task(0));
  queue.submit(make_task(1));
  queue.close();

  REQUIRE(queue.pending() == 2);

  RenderTask t;
  REQUIRE(queue.take(t));
  REQUIRE(t.job_id == 0);
  REQUIRE(queue.take(t));
  REQUIRE(t.job_id == 1);
  REQUIRE(t.project.folder == "/projects/p1");
  REQUIRE_FALSE(queue.take(t));
  REQUIRE(queue.pending() == 0);
}

TEST_CASE("Closing wakes idle workers", "[task_queue]") {
  TaskQueue queue;
  std::atomic<int> exited{0};

  std::vector<std::thread> workers;
  for (int i = 0; i < 3; ++i) {
    workers.emplace_back([&] {
      RenderTask t;
      while (queue.take(t)) {
      }
      ++exited;
    });
  }
  queue.close();
  for (auto &w : workers)
    w.join();

  REQUIRE(exited.load() == 3);
}

TEST_CASE("Every project is taken exactly once across workers",
          "[task_queue]") {
  TaskQueue queue;
  for (int i = 0; i < 40; ++i)
    queue.submit(make_task(i));
  queue.close();

  ResultCollector collector(40);
  std::vector<std::thread> workers;
  for (int w = 0; w < 4; ++w) {
    workers.emplace_back([&] {
      RenderTask t;
      while (queue.take(t)) {
        RenderResult r;
        r.folder = t.project.folder;
        r.success = (t.job_id % 5 != 0);
        collector.add(std::move(r));
      }
    });
  }
  for (auto &w : workers)
    w.join();

  REQUIRE(collector.failures() == 8);
  auto results = collector.extract();
  REQUIRE(results.size() == 40);
  std::vector<bool> seen(40, false);
  for (const auto &r : results) {
    int id = std::stoi(r.folder.substr(std::string("/projects/p").size()));
    REQUIRE_FALSE(seen[id]);
    seen[id] = true;
  }
}

TEST_CASE("Collector counts finished projects", "[task_queue]") {
  ResultCollector collector(2);
  RenderResult ok;
  ok.success = true;
  RenderResult bad;
  bad.success = false;

  REQUIRE(collector.add(ok) == 1);
  REQUIRE(collector.add(bad) == 2);
  REQUIRE(collector.failures() == 1);
  REQUIRE(collector.extract().size() == 2);
}
