#pragma once
#include <optional>
#include <string>
#include "utils/hex.hpp"

namespace ERC20 {
  // transfer(address,uint256) -> 0xa9059cbb
  Bytes TransferCalldata(const std::string& to, unsigned long long amount);
  // balanceOf(address) -> 0x70a08231
  Bytes BalanceOfCalldata(const std::string& owner);

  struct Transfer { std::string to; unsigned long long amount = 0; };
  // Parses transfer calldata; nullopt if `data` is not a well-formed transfer call.
  std::optional<Transfer> DecodeTransfer(const Bytes& data);
  // Parses balanceOf calldata; nullopt if `data` is not a balanceOf call.
  std::optional<std::string> DecodeBalanceOf(const Bytes& data);
}
