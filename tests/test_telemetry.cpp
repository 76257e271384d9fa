#include <catch2/catch.hpp>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include "discovery/market_discovery.hpp"
#include "net/block_watcher.hpp"
#include "node_connection/rpc_client.hpp"
#include "telemetry/structured_logger.hpp"
#include "fakes.hpp"

using namespace testing_fakes;
using json = nlohmann::json;

TEST_CASE("Discovery emits structured events", "[telemetry]") {
  auto path = std::filesystem::temp_directory_path() / "pairgraph_events_test.jsonl";
  std::filesystem::remove(path);
  StructuredLogger::Instance().Initialize(path.string());

  FakePairLookup lookup;
  InMemoryPairStore store;
  FakeReserveQuery reserves;
  lookup.registry[Factory(1)] = {{kWeth, Token(1), Pool(1)}, {Token(2), Token(3), Pool(2)}};
  DiscoveryConfig cfg;
  cfg.pivot_token = kWeth;
  MarketDiscovery discovery(lookup, store, reserves, std::make_shared<RecordingSwapEncoder>(), cfg);
  discovery.DiscoverAllMarkets({Factory(1)});
  StructuredLogger::Instance().Shutdown();

  std::vector<json> events;
  std::ifstream in(path);
  std::string line;
  while (std::getline(in, line)) events.push_back(json::parse(line));
  std::filesystem::remove(path);

  REQUIRE(events.size() == 2);
  REQUIRE(events[0]["event"].get<std::string>() == "factory_discovered");
  REQUIRE(events[0]["factory"].get<std::string>() == Factory(1));
  REQUIRE(events[0]["accepted"].get<int>() == 1);
  REQUIRE(events[0]["skipped_not_pivot"].get<int>() == 1);
  REQUIRE(events[0].contains("ts"));
  REQUIRE(events[1]["event"].get<std::string>() == "graph_built");
  REQUIRE(events[1]["candidates"].get<int>() == 0);
}

TEST_CASE("Block watcher reports each new block once", "[telemetry]") {
  FakeHttpClient http;
  http.response.body = R"({"jsonrpc":"2.0","id":1,"result":"0x10"})";
  RpcClient rpc(http, "http://node.local:8545");

  std::mutex mutex;
  std::condition_variable cv;
  std::vector<unsigned long long> blocks;
  BlockWatcher watcher(rpc, [&](unsigned long long bn) {
    std::lock_guard<std::mutex> lock(mutex);
    blocks.push_back(bn);
    cv.notify_all();
  }, std::chrono::milliseconds(5));

  watcher.Start();
  {
    std::unique_lock<std::mutex> lock(mutex);
    REQUIRE(cv.wait_for(lock, std::chrono::seconds(5), [&]{ return !blocks.empty(); }));
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  watcher.Stop();

  REQUIRE(watcher.LastBlock() == 16);
  std::lock_guard<std::mutex> lock(mutex);
  REQUIRE(blocks == std::vector<unsigned long long>{16});
  REQUIRE(http.bodies.size() > 1);
}

TEST_CASE("A failed bootstrap sync is reported as an event", "[telemetry]") {
  auto path = std::filesystem::temp_directory_path() / "pairgraph_sync_events_test.jsonl";
  std::filesystem::remove(path);
  StructuredLogger::Instance().Initialize(path.string());

  FakePairLookup lookup;
  InMemoryPairStore store;
  FakeReserveQuery reserves;
  reserves.fail = true;
  lookup.registry[Factory(1)] = {{kWeth, Token(1), Pool(1)}, {Token(1), kWeth, Pool(2)}};
  DiscoveryConfig cfg;
  cfg.pivot_token = kWeth;
  MarketDiscovery discovery(lookup, store, reserves, std::make_shared<RecordingSwapEncoder>(), cfg);
  GroupedMarkets grouped = discovery.DiscoverAllMarkets({Factory(1)});
  StructuredLogger::Instance().Shutdown();

  std::vector<json> events;
  std::ifstream in(path);
  std::string line;
  while (std::getline(in, line)) events.push_back(json::parse(line));
  std::filesystem::remove(path);

  REQUIRE(grouped.sync_error);
  REQUIRE(events.size() == 2);
  REQUIRE(events[1]["event"].get<std::string>() == "graph_sync_failed");
  REQUIRE(events[1]["candidates"].get<int>() == 2);
}
