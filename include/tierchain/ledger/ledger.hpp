#pragma once

#include "attendance.hpp"
#include "block.hpp"
#include "chain.hpp"
#include "entity_chain.hpp"
#include "hash.hpp"
#include "payload.hpp"
#include "serializer.hpp"

namespace tierchain::ledger {
    // Aggregates ledger headers under tierchain::ledger
}
