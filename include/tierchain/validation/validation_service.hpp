#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <string>
#include <vector>

#include <tierchain/registry/chain_registry.hpp>

namespace tierchain::validation {

    enum class ValidationStage : dp::u8 {
        Unchecked = 0,
        ChainChecked = 1,
        ParentLinkChecked = 2,
        Valid = 3,
        Invalid = 4,
    };

    std::string validationStageToString(ValidationStage stage);

    struct ValidationDetails {
        size_t chain_length = 0;
        bool genesis_valid = false;
        bool chain_integrity = false;
        ledger::ChainFailure chain_failure = ledger::ChainFailure::None; // First failure found by verify()
        bool proof_of_work = false;
        std::optional<bool> parent_link; // Roots have no parent link
    };

    /// Report for one entity. Valid only if its own chain and every ancestor chain are valid
    struct ValidationResult {
        bool is_valid = false;
        ledger::EntityKind kind = ledger::EntityKind::Root;
        std::string entity_id;
        std::string entity_name;
        ValidationStage stage = ValidationStage::Unchecked;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
        ValidationDetails details;

        std::string toJson() const;
    };

    struct LevelSummary {
        size_t total = 0;
        size_t valid = 0;
    };

    struct SystemValidationResult {
        bool is_valid = true;
        LevelSummary roots;
        LevelSummary groups;
        LevelSummary leaves;
        std::vector<std::string> invalid_roots;
        std::vector<std::string> invalid_groups;
        std::vector<std::string> invalid_leaves;
        std::vector<ValidationResult> details;

        std::string toJson() const;
    };

    // ===========================================
    // ValidationService - cascading integrity checks
    // ===========================================

    /// Never repairs anything. Proof of work is checked at each chain's own difficulty
    class ValidationService {
      public:
        explicit ValidationService(const registry::ChainRegistry &registry, bool verbose = true)
            : registry_(registry), verbose_(verbose) {}

        /// not_found when the entity is unknown; integrity problems are reported in the result
        dp::Result<ValidationResult, dp::Error> validateRoot(const std::string &id) const;
        dp::Result<ValidationResult, dp::Error> validateGroup(const std::string &id) const;
        dp::Result<ValidationResult, dp::Error> validateLeaf(const std::string &id) const;

        SystemValidationResult validateSystem() const;

        /// integrity_failure carrying every error of an invalid report
        static dp::Result<void, dp::Error> require(const ValidationResult &result);

        // Checks on detached chains; a missing parent is passed as nullptr
        static ValidationResult checkRoot(const ledger::RootChain &root);
        static ValidationResult checkChild(const ledger::EntityChain &child, const ledger::EntityChain *parent,
                                           const ValidationResult *parent_result);

      private:
        const registry::ChainRegistry &registry_;
        bool verbose_;
    };

} // namespace tierchain::validation
