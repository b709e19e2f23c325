///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file entry.cpp
 * @brief Value type names, value formatting and variable path parsing
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "registry/entry.h"

#include <cctype>
#include <sstream>

namespace XPlaneBridge {

ValueType ParseValueType(const std::string& text) {
    if (text == "int") return ValueType::Int;
    if (text == "float") return ValueType::Float;
    if (text == "double") return ValueType::Double;
    if (text == "int_array") return ValueType::IntArray;
    if (text == "float_array") return ValueType::FloatArray;
    if (text == "data") return ValueType::Data;
    return ValueType::Unknown;
}

const char* ToString(ValueType type) {
    switch (type) {
    case ValueType::Int: return "int";
    case ValueType::Float: return "float";
    case ValueType::Double: return "double";
    case ValueType::IntArray: return "int_array";
    case ValueType::FloatArray: return "float_array";
    case ValueType::Data: return "data";
    case ValueType::Unknown: break;
    }
    return "unknown";
}

bool IsArrayType(ValueType type) {
    return type == ValueType::IntArray || type == ValueType::FloatArray;
}

namespace {

struct ValueFormatter {
    std::ostringstream& out;

    void operator()(std::monostate) const { out << "null"; }
    void operator()(int64_t v) const { out << v; }
    void operator()(double v) const { out << v; }
    void operator()(bool v) const { out << (v ? "true" : "false"); }
    void operator()(const std::string& v) const { out << '"' << v << '"'; }
    template <typename T>
    void operator()(const std::vector<T>& v) const {
        out << '[';
        for (size_t i = 0; i < v.size(); ++i) {
            if (i) out << ", ";
            out << v[i];
        }
        out << ']';
    }
};

} // namespace

std::string FormatValue(const Value& value) {
    std::ostringstream out;
    std::visit(ValueFormatter{out}, value);
    return out.str();
}

std::optional<std::pair<std::string, std::optional<int>>> ParseVariablePath(const std::string& path) {
    const size_t open = path.find('[');
    if (open == std::string::npos) {
        if (path.empty() || path.find(']') != std::string::npos) return std::nullopt;
        return std::make_pair(path, std::optional<int>());
    }
    if (open == 0 || path.back() != ']') return std::nullopt;

    const std::string digits = path.substr(open + 1, path.size() - open - 2);
    if (digits.empty() || digits.size() > 9) return std::nullopt;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    return std::make_pair(path.substr(0, open), std::optional<int>(std::stoi(digits)));
}

} // namespace XPlaneBridge
