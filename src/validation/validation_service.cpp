#include <tierchain/common/error.hpp>
#include <tierchain/validation/validation_service.hpp>

#include <iostream>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace tierchain::validation {

    using ledger::EntityChain;
    using ledger::EntityKind;
    using ledger::JsonSerializer;

    namespace {

        std::string describe(const EntityChain &entity) {
            return ledger::entityKindToString(entity.kind()) + " " + entity.id();
        }

        ValidationResult beginReport(const EntityChain &entity) {
            ValidationResult result;
            result.kind = entity.kind();
            result.entity_id = entity.id();
            result.entity_name = entity.displayName();
            result.stage = ValidationStage::Unchecked;
            return result;
        }

        /// Hash, link and proof-of-work checks on the entity's own blocks
        void checkOwnChain(const EntityChain &entity, ValidationResult &result) {
            const auto &chain = entity.chain();
            result.details.chain_length = chain.length();
            if (chain.empty()) {
                result.details.chain_failure = ledger::ChainFailure::Empty;
                result.errors.push_back("Chain is empty");
                return;
            }

            bool integrity = true;
            bool pow = true;
            for (size_t i = 0; i < chain.blocks_.size(); ++i) {
                const auto &block = chain.blocks_[i];
                if (block.index_ != static_cast<dp::u64>(i) || !block.isValid() ||
                    (i > 0 && block.previous_hash_ != chain.blocks_[i - 1].hash_))
                    integrity = false;
                if (!block.meetsDifficulty(chain.difficulty())) {
                    pow = false;
                    result.errors.push_back("Block " + std::to_string(i) + " doesn't satisfy Proof of Work");
                }
            }

            result.details.chain_integrity = integrity;
            result.details.proof_of_work = pow;
            if (!integrity) {
                auto verification = chain.verify();
                result.details.chain_failure = verification.failure;
                result.errors.push_back("Chain integrity check failed: " + verification.reason);
            }

            const auto &genesis = chain.genesis();
            result.details.genesis_valid =
                genesis.isValid() && genesis.previous_hash_ == entity.expectedGenesisPrevHash();
            if (!result.details.genesis_valid)
                result.errors.push_back("Genesis block is invalid");

            result.stage = ValidationStage::ChainChecked;
        }

        /// Record entries, and how many of them no longer parse
        std::pair<size_t, size_t> countRecords(const EntityChain &entity) {
            size_t count = 0;
            size_t unreadable = 0;
            for (const auto &block : entity.chain().blocks_) {
                for (const auto &entry : block.payload_) {
                    if (entry.kind != ledger::PayloadKind::Record)
                        continue;
                    count++;
                    if (!ledger::AttendanceRecord::fromPayload(entry, block.index_).is_ok())
                        unreadable++;
                }
            }
            return {count, unreadable};
        }

        bool anchoredIn(const EntityChain &parent, const std::string &hash) {
            for (const auto &block : parent.chain().blocks_) {
                if (block.hash_ == hash)
                    return true;
            }
            return false;
        }

        void finish(ValidationResult &result) {
            result.is_valid = result.errors.empty();
            result.stage = result.is_valid ? ValidationStage::Valid : ValidationStage::Invalid;
        }

        void tally(const ValidationResult &result, LevelSummary &summary, std::vector<std::string> &invalid) {
            summary.total++;
            if (result.is_valid)
                summary.valid++;
            else
                invalid.push_back(result.entity_id);
        }

        std::string summaryJson(const LevelSummary &summary) {
            std::stringstream ss;
            ss << "{\"total\":" << summary.total << ",\"valid\":" << summary.valid << "}";
            return ss.str();
        }

    } // namespace

    std::string validationStageToString(ValidationStage stage) {
        switch (stage) {
        case ValidationStage::Unchecked:
            return "unchecked";
        case ValidationStage::ChainChecked:
            return "chain_checked";
        case ValidationStage::ParentLinkChecked:
            return "parent_link_checked";
        case ValidationStage::Valid:
            return "valid";
        case ValidationStage::Invalid:
            return "invalid";
        default:
            return "unknown";
        }
    }

    // ===========================================
    // JSON rendering
    // ===========================================

    std::string ValidationResult::toJson() const {
        std::stringstream ss;
        ss << "{\"isValid\":" << JsonSerializer::boolean(is_valid)
           << ",\"kind\":" << JsonSerializer::quote(ledger::entityKindToString(kind))
           << ",\"entityId\":" << JsonSerializer::quote(entity_id)
           << ",\"entityName\":" << JsonSerializer::quote(entity_name)
           << ",\"stage\":" << JsonSerializer::quote(validationStageToString(stage))
           << ",\"errors\":" << JsonSerializer::serializeStrings(errors)
           << ",\"warnings\":" << JsonSerializer::serializeStrings(warnings) << ",\"details\":{"
           << "\"chainLength\":" << details.chain_length
           << ",\"genesisValid\":" << JsonSerializer::boolean(details.genesis_valid)
           << ",\"chainIntegrity\":" << JsonSerializer::boolean(details.chain_integrity)
           << ",\"chainFailure\":" << JsonSerializer::quote(ledger::chainFailureToString(details.chain_failure))
           << ",\"proofOfWork\":" << JsonSerializer::boolean(details.proof_of_work) << ",\"parentLink\":"
           << (details.parent_link.has_value() ? JsonSerializer::boolean(*details.parent_link) : "null") << "}}";
        return ss.str();
    }

    std::string SystemValidationResult::toJson() const {
        std::stringstream ss;
        ss << "{\"isValid\":" << JsonSerializer::boolean(is_valid) << ",\"summary\":{\"roots\":" << summaryJson(roots)
           << ",\"groups\":" << summaryJson(groups) << ",\"leaves\":" << summaryJson(leaves) << "}"
           << ",\"invalidRoots\":" << JsonSerializer::serializeStrings(invalid_roots)
           << ",\"invalidGroups\":" << JsonSerializer::serializeStrings(invalid_groups)
           << ",\"invalidLeaves\":" << JsonSerializer::serializeStrings(invalid_leaves) << ",\"details\":[";
        for (size_t i = 0; i < details.size(); ++i) {
            if (i > 0)
                ss << ",";
            ss << details[i].toJson();
        }
        ss << "]}";
        return ss.str();
    }

    dp::Result<void, dp::Error> ValidationService::require(const ValidationResult &result) {
        if (result.is_valid)
            return dp::Result<void, dp::Error>::ok();

        std::string message = ledger::entityKindToString(result.kind) + " " + result.entity_id + " is invalid";
        for (size_t i = 0; i < result.errors.size(); ++i)
            message += (i == 0 ? ": " : "; ") + result.errors[i];
        return dp::Result<void, dp::Error>::err(integrity_failure(message));
    }

    // ===========================================
    // Detached checks
    // ===========================================

    ValidationResult ValidationService::checkRoot(const ledger::RootChain &root) {
        ValidationResult result = beginReport(root);
        checkOwnChain(root, result);
        finish(result);
        return result;
    }

    ValidationResult ValidationService::checkChild(const EntityChain &child, const EntityChain *parent,
                                                   const ValidationResult *parent_result) {
        ValidationResult result = beginReport(child);
        checkOwnChain(child, result);

        if (parent == nullptr) {
            result.details.parent_link = false;
            result.errors.push_back("Parent " + child.parentId() + " not found");
        } else {
            std::string current = parent->chain().empty() ? std::string() : parent->latestHash();
            bool linked = child.validateParentLink(current) && child.parentLinkHash().has_value() &&
                          anchoredIn(*parent, *child.parentLinkHash());
            result.details.parent_link = linked;
            if (!linked)
                result.errors.push_back("Parent link validation failed");
            else if (child.parentHasGrown(current))
                result.warnings.push_back("Parent chain has been extended since creation");
            if (result.stage == ValidationStage::ChainChecked)
                result.stage = ValidationStage::ParentLinkChecked;

            if (parent_result != nullptr && !parent_result->is_valid) {
                result.errors.push_back("Parent chain invalid: " + describe(*parent));
                result.warnings.push_back("Chain depends on invalid parent - hierarchy broken");
            }
        }

        if (child.kind() == EntityKind::Leaf) {
            auto [count, unreadable] = countRecords(child);
            result.warnings.push_back(std::to_string(count) + " attendance records found");
            if (unreadable > 0)
                result.warnings.push_back(std::to_string(unreadable) + " attendance records are unreadable");
        }

        finish(result);
        return result;
    }

    // ===========================================
    // Registry-backed validation
    // ===========================================

    dp::Result<ValidationResult, dp::Error> ValidationService::validateRoot(const std::string &id) const {
        auto root = registry_.getRoot(id);
        if (!root.is_ok())
            return dp::Result<ValidationResult, dp::Error>::err(root.error());
        return dp::Result<ValidationResult, dp::Error>::ok(checkRoot(root.value()));
    }

    dp::Result<ValidationResult, dp::Error> ValidationService::validateGroup(const std::string &id) const {
        auto group = registry_.getGroup(id);
        if (!group.is_ok())
            return dp::Result<ValidationResult, dp::Error>::err(group.error());

        auto root = registry_.getRoot(group.value().rootId());
        if (!root.is_ok())
            return dp::Result<ValidationResult, dp::Error>::ok(checkChild(group.value(), nullptr, nullptr));

        const ledger::RootChain parent = root.value();
        auto root_result = checkRoot(parent);
        return dp::Result<ValidationResult, dp::Error>::ok(checkChild(group.value(), &parent, &root_result));
    }

    dp::Result<ValidationResult, dp::Error> ValidationService::validateLeaf(const std::string &id) const {
        auto leaf = registry_.getLeaf(id);
        if (!leaf.is_ok())
            return dp::Result<ValidationResult, dp::Error>::err(leaf.error());

        auto group = registry_.getGroup(leaf.value().groupId());
        if (!group.is_ok())
            return dp::Result<ValidationResult, dp::Error>::ok(checkChild(leaf.value(), nullptr, nullptr));

        const ledger::GroupChain parent = group.value();
        auto group_result = validateGroup(parent.id());
        if (!group_result.is_ok())
            return group_result;
        const ValidationResult parent_result = group_result.value();
        return dp::Result<ValidationResult, dp::Error>::ok(checkChild(leaf.value(), &parent, &parent_result));
    }

    SystemValidationResult ValidationService::validateSystem() const {
        SystemValidationResult system;

        auto roots = registry_.listRoots();
        auto groups = registry_.listGroups();
        auto leaves = registry_.listLeaves();

        std::unordered_map<std::string, size_t> root_at;
        std::unordered_map<std::string, size_t> group_at;
        std::vector<ValidationResult> root_results;
        std::vector<ValidationResult> group_results;

        for (size_t i = 0; i < roots.size(); ++i) {
            root_at[roots[i].id()] = i;
            root_results.push_back(checkRoot(roots[i]));
            tally(root_results.back(), system.roots, system.invalid_roots);
        }

        for (size_t i = 0; i < groups.size(); ++i) {
            group_at[groups[i].id()] = i;
            auto it = root_at.find(groups[i].rootId());
            if (it == root_at.end())
                group_results.push_back(checkChild(groups[i], nullptr, nullptr));
            else
                group_results.push_back(checkChild(groups[i], &roots[it->second], &root_results[it->second]));
            tally(group_results.back(), system.groups, system.invalid_groups);
        }

        std::vector<ValidationResult> leaf_results;
        for (const auto &leaf : leaves) {
            auto it = group_at.find(leaf.groupId());
            if (it == group_at.end())
                leaf_results.push_back(checkChild(leaf, nullptr, nullptr));
            else
                leaf_results.push_back(checkChild(leaf, &groups[it->second], &group_results[it->second]));
            tally(leaf_results.back(), system.leaves, system.invalid_leaves);
        }

        system.details.insert(system.details.end(), root_results.begin(), root_results.end());
        system.details.insert(system.details.end(), group_results.begin(), group_results.end());
        system.details.insert(system.details.end(), leaf_results.begin(), leaf_results.end());
        system.is_valid = system.invalid_roots.empty() && system.invalid_groups.empty() && system.invalid_leaves.empty();

        if (verbose_) {
            std::cout << "System validation " << (system.is_valid ? "passed" : "FAILED") << " - Roots: "
                      << system.roots.valid << "/" << system.roots.total << ", Groups: " << system.groups.valid << "/"
                      << system.groups.total << ", Leaves: " << system.leaves.valid << "/" << system.leaves.total
                      << std::endl;
        }
        return system;
    }

} // namespace tierchain::validation
