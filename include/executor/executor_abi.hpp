#pragma once
#include <string>
#include <vector>
#include "executor/executor_types.hpp"

// ABI of the batch executor contract: request hashes signed by admins and
// callers, and calldata for its entry points.
namespace ExecutorABI {
  extern const char* const kExecuteBatchSignature;          // executeBatch((address,uint256,bytes)[],uint256,uint256,bytes)
  extern const char* const kExecuteBatchUnsignedSignature;  // executeBatch((address,uint256,bytes)[])
  extern const char* const kSetAdminSignature;              // setAdmin(address,uint256,uint256,bytes)
  extern const char* const kUpdateCallersSignature;         // updateCallers(address[],bool[],uint256,uint256,bytes)
  extern const char* const kInitializeSignature;            // initialize(address)

  // (address,uint256,bytes)[] as a standalone dynamic value (length word first).
  Bytes EncodeCalls(const Batch& calls);

  // keccak256(abi.encode(calls, nonce, deadline))
  Bytes BatchHash(const Batch& calls, unsigned long long nonce, unsigned long long deadline);
  // keccak256(abi.encode(newAdmin, nonce, deadline))
  Bytes AdminChangeHash(const std::string& new_admin, unsigned long long nonce, unsigned long long deadline);
  // keccak256(abi.encode(callers, isAdding, nonce, deadline))
  Bytes CallerUpdateHash(const std::vector<std::string>& callers, const std::vector<bool>& is_adding,
                         unsigned long long nonce, unsigned long long deadline);

  Bytes BuildExecuteBatchCalldata(const SignedBatch& batch);
  Bytes BuildExecuteBatchUnsignedCalldata(const Batch& calls);
  Bytes BuildSetAdminCalldata(const AdminChange& change);
  Bytes BuildUpdateCallersCalldata(const CallerUpdate& update);
  Bytes BuildInitializeCalldata(const std::string& admin);
}
