#pragma once

#include <cstdio>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace tierchain::ledger {

    /// Free-form entity fields; ordered so serialization is deterministic
    using Fields = std::map<std::string, std::string>;

    // JSON serialization utilities
    class JsonSerializer {
      public:
        static std::string escapeJson(const std::string &str) {
            std::string result;
            result.reserve(str.size());
            for (char c : str) {
                switch (c) {
                case '"':
                    result += "\\\"";
                    break;
                case '\\':
                    result += "\\\\";
                    break;
                case '\n':
                    result += "\\n";
                    break;
                case '\r':
                    result += "\\r";
                    break;
                case '\t':
                    result += "\\t";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                        result += buf;
                    } else {
                        result += c;
                    }
                    break;
                }
            }
            return result;
        }

        static std::string quote(const std::string &str) { return "\"" + escapeJson(str) + "\""; }

        /// {"k":"v",...} in key order
        static std::string serializeFields(const Fields &fields) {
            std::stringstream ss;
            ss << '{';
            bool first = true;
            for (const auto &[key, value] : fields) {
                if (!first)
                    ss << ',';
                ss << quote(key) << ':' << quote(value);
                first = false;
            }
            ss << '}';
            return ss.str();
        }

        static std::string serializeStrings(const std::vector<std::string> &values) {
            std::stringstream ss;
            ss << '[';
            for (size_t i = 0; i < values.size(); ++i) {
                if (i > 0)
                    ss << ',';
                ss << quote(values[i]);
            }
            ss << ']';
            return ss.str();
        }

        static const char *boolean(bool value) { return value ? "true" : "false"; }
    };

} // namespace tierchain::ledger
