#include <catch2/catch.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include "common/config_manager.hpp"
#include "config/markets_config.hpp"
#include "constants/mainnet.hpp"
#include "fakes.hpp"

using namespace testing_fakes;

namespace {
  // Writes `contents` to a scratch .env file and loads it.
  void LoadEnv(const std::string& contents) {
    auto path = std::filesystem::temp_directory_path() / "pairgraph_config_test.env";
    {
      std::ofstream out(path);
      out << contents;
    }
    ConfigManager::Initialize(path.string());
    std::filesystem::remove(path);
  }
}

TEST_CASE("Env file parsing", "[config]") {
  LoadEnv(
    "# node\n"
    "RPC_URL=http://localhost:8545\n"
    "export RPC_AUTH_HEADER=\"x-api-key: abc\"\n"
    "  BLOCK_POLL_MS = 250  \n"
    "FACTORY_ADDRESSES= 0xaa , ,0xbb,\n"
    "LOG_STDERR=no\n"
    "MAX_CONCURRENCY=lots\n"
    "not a key value line\n");

  REQUIRE(ConfigManager::Get("RPC_URL") == std::string("http://localhost:8545"));
  REQUIRE(ConfigManager::Get("RPC_AUTH_HEADER") == std::string("x-api-key: abc"));
  REQUIRE(ConfigManager::GetU64Or("BLOCK_POLL_MS", 1) == 250);
  REQUIRE(ConfigManager::GetListOr("FACTORY_ADDRESSES", {}) == std::vector<std::string>{"0xaa", "0xbb"});
  REQUIRE_FALSE(ConfigManager::GetBoolOr("LOG_STDERR", true));
  REQUIRE(ConfigManager::GetIntOr("MAX_CONCURRENCY", 3) == 3);
  REQUIRE_FALSE(ConfigManager::Get("PAIRGRAPH_UNSET_KEY"));
  REQUIRE_THROWS_AS(ConfigManager::GetOrThrow("PAIRGRAPH_UNSET_KEY"), std::runtime_error);

  SECTION("Set overrides file values") {
    ConfigManager::Set("BLOCK_POLL_MS", "900");
    REQUIRE(ConfigManager::GetU64Or("BLOCK_POLL_MS", 1) == 900);
  }
}

TEST_CASE("Market configuration defaults to mainnet", "[config]") {
  LoadEnv("RPC_URL=http://localhost:8545\n");
  MarketsConfig cfg = LoadMarketsConfig();

  REQUIRE(cfg.rpc_url == "http://localhost:8545");
  REQUIRE_FALSE(cfg.auth_header);
  REQUIRE(cfg.query_contract == MainnetConstants::UNISWAP_QUERY);
  REQUIRE(cfg.factories == MainnetConstants::DefaultFactories());
  REQUIRE(cfg.discovery.pivot_token == MainnetConstants::WETH);
  REQUIRE(cfg.discovery.batch_size == 1000);
  REQUIRE(cfg.discovery.batch_count_limit == 100);
  REQUIRE(cfg.discovery.liquidity_floor == Ether(5));
  REQUIRE(cfg.discovery.denylist.size() == MainnetConstants::DefaultTokenDenylist().size());
  REQUIRE(cfg.discovery.max_concurrency >= 1);
}

TEST_CASE("Market configuration overrides", "[config]") {
  LoadEnv(
    "RPC_URL=http://localhost:8545\n"
    "PIVOT_TOKEN=0xC02AAA39B223FE8D0A0E5C4F27EAD9083C756CC2\n"
    "FACTORY_ADDRESSES=" + Factory(1) + "," + Factory(2) + "\n"
    "TOKEN_DENYLIST=" + Token(3) + "\n"
    "LIQUIDITY_FLOOR_WEI=1_000_000\n"
    "DISCOVERY_BATCH_SIZE=250\n"
    "MAX_CONCURRENCY=-2\n");
  MarketsConfig cfg = LoadMarketsConfig();

  REQUIRE(cfg.discovery.pivot_token == kWeth);
  REQUIRE(cfg.factories == std::vector<std::string>{Factory(1), Factory(2)});
  REQUIRE(cfg.discovery.denylist.size() == 1);
  REQUIRE(cfg.discovery.denylist.count(Token(3)) == 1);
  REQUIRE(cfg.discovery.liquidity_floor == 1000000);
  REQUIRE(cfg.discovery.batch_size == 250);
  REQUIRE(cfg.discovery.max_concurrency == 1);
}

TEST_CASE("Invalid market configuration is rejected", "[config]") {
  SECTION("Missing node URL") {
    LoadEnv("PIVOT_TOKEN=" + kWeth + "\n");
    REQUIRE_THROWS_AS(LoadMarketsConfig(), std::runtime_error);
  }

  SECTION("Malformed factory address") {
    LoadEnv("RPC_URL=http://localhost:8545\nFACTORY_ADDRESSES=0x1234\n");
    REQUIRE_THROWS_AS(LoadMarketsConfig(), std::runtime_error);
  }

  SECTION("Malformed liquidity floor") {
    LoadEnv("RPC_URL=http://localhost:8545\nLIQUIDITY_FLOOR_WEI=5e18\n");
    REQUIRE_THROWS_AS(LoadMarketsConfig(), std::runtime_error);
  }

  SECTION("Zero batch size") {
    LoadEnv("RPC_URL=http://localhost:8545\nDISCOVERY_BATCH_SIZE=0\n");
    REQUIRE_THROWS_AS(LoadMarketsConfig(), std::runtime_error);
  }
}
