#pragma once
#include <string>
#include "lookup/pair_lookup.hpp"

class RpcClient;

// Reads the UniswapFlashQuery helper contract:
//   getPairsByIndexRange(address factory, uint256 start, uint256 stop) returns (address[3][])
//   getReservesByPairs(address[] pairs) returns (uint256[3][])
class UniswapQueryClient : public PairLookup, public ReserveQuery {
public:
  UniswapQueryClient(RpcClient& rpc, const std::string& query_contract);

  std::vector<RawPair> GetPairsByIndexRange(const std::string& factory,
                                            unsigned long long start,
                                            unsigned long long stop) override;
  std::vector<OrderedBalances> GetReservesByPairs(const std::vector<std::string>& pair_addresses) override;

  // Calldata builders and result decoders, exposed for tests.
  std::string EncodeGetPairsByIndexRange(const std::string& factory, unsigned long long start, unsigned long long stop) const;
  std::string EncodeGetReservesByPairs(const std::vector<std::string>& pair_addresses) const;
  static std::vector<RawPair> DecodePairs(const std::string& result_hex);
  static std::vector<OrderedBalances> DecodeReserves(const std::string& result_hex);

private:
  RpcClient& rpc_;
  std::string query_contract_;
  std::string pairs_selector_;
  std::string reserves_selector_;
};
