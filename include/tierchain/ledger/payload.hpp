#pragma once

#include <chrono>
#include <datapod/datapod.hpp>
#include <string>
#include <vector>

#include "serializer.hpp"

namespace tierchain::ledger {

    enum class EntityKind : dp::u8 {
        Root = 0,
        Group = 1,
        Leaf = 2,
    };

    enum class PayloadKind : dp::u8 {
        Create = 0,
        Update = 1,
        Delete = 2,
        Record = 3,
    };

    /// "root", "group", "leaf"; doubles as the create label of that level
    std::string entityKindToString(EntityKind kind);
    dp::Result<EntityKind, dp::Error> parseEntityKind(const std::string &label);

    /// Persisted `type` label of a payload entry
    std::string payloadLabel(PayloadKind kind, EntityKind entity);
    dp::Result<PayloadKind, dp::Error> parsePayloadLabel(const std::string &label);

    inline dp::i64 currentTimeMillis() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    /// One entry of a block payload. Carries its own timestamp, independent of the block's
    struct PayloadEntry {
        PayloadKind kind{PayloadKind::Create};
        std::string type{};
        Fields data{};
        dp::i64 timestamp{0};

        PayloadEntry() = default;
        PayloadEntry(PayloadKind k, std::string label, Fields d, dp::i64 ts)
            : kind(k), type(std::move(label)), data(std::move(d)), timestamp(ts) {}

        static PayloadEntry create(EntityKind entity, Fields data);
        static PayloadEntry update(Fields patch);
        static PayloadEntry remove();
        static PayloadEntry record(Fields data);

        /// {"type":..,"data":{..},"timestamp":..}
        std::string toCanonical() const;
    };

    /// Canonical JSON array of the entries, the form fed to the block hash
    std::string canonicalize(const std::vector<PayloadEntry> &payload);

} // namespace tierchain::ledger
