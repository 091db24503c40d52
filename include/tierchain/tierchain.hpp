#pragma once

// High-level Tierchain facade
// Composes ledger, storage, registry and validation modules

#include "tierchain/common/config.hpp"
#include "tierchain/common/error.hpp"
#include "tierchain/ledger/ledger.hpp"
#include "tierchain/registry/chain_registry.hpp"
#include "tierchain/registry/worker_pool.hpp"
#include "tierchain/storage/journal_store.hpp"
#include "tierchain/storage/records.hpp"
#include "tierchain/validation/validation_service.hpp"
