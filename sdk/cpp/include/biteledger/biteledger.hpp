#pragma once

/**
 * biteledger SDK
 *
 * Ledger runtime and contract framework:
 * - Ledger: deploys instances and runs atomic invocations
 * - Env / ContractStorage: what an entry point sees of the transaction
 * - EntryPointRouter: command and query dispatch for contracts
 * - Amount: checked 128-bit token quantities
 * - ContractClient: typed in-process access to an instance
 * - LedgerClient: gRPC access to a ledger node
 */

#include "amount.hpp"
#include "client.hpp"
#include "contract.hpp"
#include "contract_client.hpp"
#include "errors.hpp"
#include "helpers.hpp"
#include "ledger.hpp"
#include "logging.hpp"
#include "router.hpp"
#include "storage.hpp"
#include "transaction.hpp"
#include "validation.hpp"
