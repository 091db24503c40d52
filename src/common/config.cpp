#include <tierchain/common/config.hpp>

#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace tierchain {

    namespace {

        /// Rejects values outside [min, max] before they are narrowed into an option field
        dp::Result<long long, dp::Error> parseInteger(const char *name, const char *raw, long long min,
                                                      long long max) {
            std::string value(raw);
            long long parsed = 0;
            try {
                size_t consumed = 0;
                parsed = std::stoll(value, &consumed);
                if (consumed != value.size())
                    return dp::Result<long long, dp::Error>::err(
                        input_error(std::string(name) + " is not an integer: " + value));
            } catch (const std::exception &) {
                return dp::Result<long long, dp::Error>::err(
                    input_error(std::string(name) + " is not an integer: " + value));
            }
            if (parsed < min || parsed > max) {
                return dp::Result<long long, dp::Error>::err(input_error(
                    std::string(name) + " must be between " + std::to_string(min) + " and " + std::to_string(max) +
                    ", got " + value));
            }
            return dp::Result<long long, dp::Error>::ok(parsed);
        }

    } // namespace

    dp::Result<void, dp::Error> LedgerOptions::validate() const {
        if (difficulty < 0 || difficulty > MAX_DIFFICULTY) {
            return dp::Result<void, dp::Error>::err(input_error(
                "Mining difficulty must be between 0 and " + std::to_string(MAX_DIFFICULTY) + ", got " +
                std::to_string(difficulty)));
        }
        if (mining_workers == 0)
            return dp::Result<void, dp::Error>::err(input_error("At least one mining worker is required"));
        if (compaction_threshold == 0)
            return dp::Result<void, dp::Error>::err(input_error("Compaction threshold must be positive"));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<LedgerOptions, dp::Error> LedgerOptions::fromEnvironment() {
        LedgerOptions options;

        if (const char *raw = std::getenv("TIERCHAIN_DIFFICULTY")) {
            auto parsed = parseInteger("TIERCHAIN_DIFFICULTY", raw, 0, MAX_DIFFICULTY);
            if (!parsed.is_ok())
                return dp::Result<LedgerOptions, dp::Error>::err(parsed.error());
            options.difficulty = static_cast<dp::i32>(parsed.value());
        }
        if (const char *raw = std::getenv("TIERCHAIN_STORAGE_PATH")) {
            options.storage_path = raw;
        }
        if (const char *raw = std::getenv("TIERCHAIN_MINING_WORKERS")) {
            auto parsed = parseInteger("TIERCHAIN_MINING_WORKERS", raw, 1, std::numeric_limits<dp::u32>::max());
            if (!parsed.is_ok())
                return dp::Result<LedgerOptions, dp::Error>::err(parsed.error());
            options.mining_workers = static_cast<dp::u32>(parsed.value());
        }
        if (const char *raw = std::getenv("TIERCHAIN_COMPACTION_THRESHOLD")) {
            auto parsed =
                parseInteger("TIERCHAIN_COMPACTION_THRESHOLD", raw, 1, std::numeric_limits<dp::u32>::max());
            if (!parsed.is_ok())
                return dp::Result<LedgerOptions, dp::Error>::err(parsed.error());
            options.compaction_threshold = static_cast<dp::u32>(parsed.value());
        }
        if (const char *raw = std::getenv("TIERCHAIN_VERBOSE")) {
            std::string value(raw);
            options.verbose = !(value == "0" || value == "false" || value == "off");
        }

        auto valid = options.validate();
        if (!valid.is_ok())
            return dp::Result<LedgerOptions, dp::Error>::err(valid.error());
        return dp::Result<LedgerOptions, dp::Error>::ok(options);
    }

} // namespace tierchain
