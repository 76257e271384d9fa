#include "lookup/uniswap_query.hpp"
#include "node_connection/rpc_client.hpp"
#include "encoding/abi.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"

UniswapQueryClient::UniswapQueryClient(RpcClient& rpc, const std::string& query_contract)
  : rpc_(rpc),
    query_contract_(NormalizeAddress(query_contract)),
    pairs_selector_(Abi::Selector("getPairsByIndexRange(address,uint256,uint256)")),
    reserves_selector_(Abi::Selector("getReservesByPairs(address[])")) {}

std::string UniswapQueryClient::EncodeGetPairsByIndexRange(const std::string& factory,
                                                           unsigned long long start,
                                                           unsigned long long stop) const {
  return pairs_selector_ + Abi::EncodeAddress(factory) + Abi::EncodeUint256(Amount(start)) + Abi::EncodeUint256(Amount(stop));
}

std::string UniswapQueryClient::EncodeGetReservesByPairs(const std::vector<std::string>& pair_addresses) const {
  // Single dynamic argument: offset word then the array tail.
  return reserves_selector_ + Abi::EncodeUint256(Amount(32)) + Abi::EncodeAddressArray(pair_addresses);
}

std::vector<RawPair> UniswapQueryClient::DecodePairs(const std::string& result_hex) {
  std::vector<RawPair> out;
  for (const auto& row : Abi::DecodeFixedRowArray(result_hex, 3)) {
    out.push_back({Abi::DecodeAddress(row[0], 0), Abi::DecodeAddress(row[1], 0), Abi::DecodeAddress(row[2], 0)});
  }
  return out;
}

std::vector<OrderedBalances> UniswapQueryClient::DecodeReserves(const std::string& result_hex) {
  std::vector<OrderedBalances> out;
  // Third column is blockTimestampLast.
  for (const auto& row : Abi::DecodeFixedRowArray(result_hex, 3)) {
    out.push_back({Abi::DecodeUint256(row[0], 0), Abi::DecodeUint256(row[1], 0)});
  }
  return out;
}

std::vector<RawPair> UniswapQueryClient::GetPairsByIndexRange(const std::string& factory,
                                                              unsigned long long start,
                                                              unsigned long long stop) {
  auto data = EncodeGetPairsByIndexRange(factory, start, stop);
  auto result = rpc_.EthCall(query_contract_, data);
  auto pairs = DecodePairs(result);
  LOG_DEBUG("getPairsByIndexRange " + factory + " [" + std::to_string(start) + "," + std::to_string(stop) +
            ") -> " + std::to_string(pairs.size()));
  return pairs;
}

std::vector<OrderedBalances> UniswapQueryClient::GetReservesByPairs(const std::vector<std::string>& pair_addresses) {
  if (pair_addresses.empty()) return {};
  auto data = EncodeGetReservesByPairs(pair_addresses);
  auto result = rpc_.EthCall(query_contract_, data);
  return DecodeReserves(result);
}
