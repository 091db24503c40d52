#include <tierchain/common/error.hpp>
#include <tierchain/ledger/payload.hpp>

#include <sstream>

namespace tierchain::ledger {

    std::string entityKindToString(EntityKind kind) {
        switch (kind) {
        case EntityKind::Root:
            return "root";
        case EntityKind::Group:
            return "group";
        case EntityKind::Leaf:
            return "leaf";
        default:
            return "unknown";
        }
    }

    dp::Result<EntityKind, dp::Error> parseEntityKind(const std::string &label) {
        if (label == "root")
            return dp::Result<EntityKind, dp::Error>::ok(EntityKind::Root);
        if (label == "group")
            return dp::Result<EntityKind, dp::Error>::ok(EntityKind::Group);
        if (label == "leaf")
            return dp::Result<EntityKind, dp::Error>::ok(EntityKind::Leaf);
        return dp::Result<EntityKind, dp::Error>::err(input_error("Unknown entity kind: " + label));
    }

    std::string payloadLabel(PayloadKind kind, EntityKind entity) {
        switch (kind) {
        case PayloadKind::Create:
            return entityKindToString(entity);
        case PayloadKind::Update:
            return "update";
        case PayloadKind::Delete:
            return "delete";
        case PayloadKind::Record:
            return "attendance";
        default:
            return "unknown";
        }
    }

    dp::Result<PayloadKind, dp::Error> parsePayloadLabel(const std::string &label) {
        if (label == "update")
            return dp::Result<PayloadKind, dp::Error>::ok(PayloadKind::Update);
        if (label == "delete")
            return dp::Result<PayloadKind, dp::Error>::ok(PayloadKind::Delete);
        if (label == "attendance" || label == "record")
            return dp::Result<PayloadKind, dp::Error>::ok(PayloadKind::Record);
        if (parseEntityKind(label).is_ok())
            return dp::Result<PayloadKind, dp::Error>::ok(PayloadKind::Create);
        return dp::Result<PayloadKind, dp::Error>::err(input_error("Unknown payload type: " + label));
    }

    PayloadEntry PayloadEntry::create(EntityKind entity, Fields data) {
        return PayloadEntry(PayloadKind::Create, payloadLabel(PayloadKind::Create, entity), std::move(data),
                            currentTimeMillis());
    }

    PayloadEntry PayloadEntry::update(Fields patch) {
        return PayloadEntry(PayloadKind::Update, "update", std::move(patch), currentTimeMillis());
    }

    PayloadEntry PayloadEntry::remove() {
        dp::i64 now = currentTimeMillis();
        Fields data{{"status", "deleted"}, {"deletedAt", std::to_string(now)}};
        return PayloadEntry(PayloadKind::Delete, "delete", std::move(data), now);
    }

    PayloadEntry PayloadEntry::record(Fields data) {
        return PayloadEntry(PayloadKind::Record, "attendance", std::move(data), currentTimeMillis());
    }

    std::string PayloadEntry::toCanonical() const {
        std::stringstream ss;
        ss << "{\"type\":" << JsonSerializer::quote(type) << ",\"data\":" << JsonSerializer::serializeFields(data)
           << ",\"timestamp\":" << timestamp << '}';
        return ss.str();
    }

    std::string canonicalize(const std::vector<PayloadEntry> &payload) {
        std::stringstream ss;
        ss << '[';
        for (size_t i = 0; i < payload.size(); ++i) {
            if (i > 0)
                ss << ',';
            ss << payload[i].toCanonical();
        }
        ss << ']';
        return ss.str();
    }

} // namespace tierchain::ledger
