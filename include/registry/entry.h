///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file entry.h
 * @brief Cache records for simulator variables (datarefs) and commands
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace XPlaneBridge {

enum class ValueType { Unknown, Int, Float, Double, IntArray, FloatArray, Data };

/** Maps the web API "value_type" strings (int, float, double, int_array, float_array, data). */
ValueType ParseValueType(const std::string& text);
const char* ToString(ValueType type);
bool IsArrayType(ValueType type);

/**
 * Current value of an entry. Empty until the first update, bool for command
 * active state, string for decoded "data" variables.
 */
using Value = std::variant<std::monostate, int64_t, double, std::vector<int64_t>, std::vector<double>,
                           std::string, bool>;

/** Human readable form used by logs and the command-line tool. */
std::string FormatValue(const Value& value);

struct VariableEntry {
    std::string name;
    int64_t id = 0;
    ValueType value_type = ValueType::Unknown;
    bool writable = false;
    std::vector<int> indices;             ///< Subscribed indices, ascending (array or unknown types)
    std::vector<int> previous_indices;    ///< Index list before the last change
    Value value;

    bool IsArray() const { return IsArrayType(value_type); }

    /** Arrays, and untyped entries whose values arrive as received (UDP). */
    bool Indexable() const { return IsArray() || value_type == ValueType::Unknown; }
};

struct CommandEntry {
    std::string name;
    int64_t id = 0;
    std::string description;
    bool is_active = false;
};

enum class EntryKind { Variable, Command };

/** Copy of an entry taken right after it was updated, handed to consumers. */
struct EntryUpdate {
    EntryKind kind = EntryKind::Variable;
    std::string name;
    int64_t id = 0;
    Value value;
};

/**
 * @brief Splits "name[4]" into ("name", 4). Plain names give no index.
 * @return std::nullopt for an unterminated bracket or a negative/non-numeric index
 */
std::optional<std::pair<std::string, std::optional<int>>> ParseVariablePath(const std::string& path);

} // namespace XPlaneBridge
