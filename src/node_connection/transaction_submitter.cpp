#include "node_connection/transaction_submitter.hpp"
#include "node_connection/rpc_client.hpp"
#include "eip7702/set_code_transaction.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

std::string TransactionSubmitter::Submit(const std::string& raw_tx_hex) {
  auto local_hash = Hex::FromBytes(Eip7702::TransactionHash(Hex::ToBytes(raw_tx_hex)));
  Logger::Info("submitting tx " + local_hash + " to " + rpc_.Endpoint());
  std::string tx_hash;
  try {
    tx_hash = rpc_.EthSendRawTransaction(raw_tx_hex);
  } catch (const SubmissionError& e) {
    Logger::Error("submission of " + local_hash + " rejected: " + e.what());
    throw;
  }
  if (ToLowerHex(tx_hash) != local_hash)
    Logger::Warning("node reported hash " + tx_hash + ", expected " + local_hash);
  return tx_hash;
}
