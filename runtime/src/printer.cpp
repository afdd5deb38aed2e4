#include "stackpp/vm/printer.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace stackpp::vm {

static std::string quoted(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:   out += c; break;
        }
    }
    out += '"';
    return out;
}

// 7 -> 7.0 so that numbers read as floats in the dump
static std::string debugNumber(double n) {
    std::string s = formatNumber(n);
    if (std::isfinite(n) && s.find('.') == std::string::npos) s += ".0";
    return s;
}

std::string describe(const Value& v) {
    switch (v.tag) {
        case ValueTag::Number:      return "Number(" + debugNumber(v.as.n) + ")";
        case ValueTag::String:      return "String(" + quoted(v.text) + ")";
        case ValueTag::Bool:        return std::string("Bool(") + (v.as.b ? "true" : "false") + ")";
        case ValueTag::Variable:    return "Variable(" + quoted(v.text) + ")";
        case ValueTag::Instruction: return "Instruction(" + std::string(opcodeName(v.as.op)) + ")";
        case ValueTag::Block:       return "Block(" + (v.body ? describe(*v.body) : std::string("[]")) + ")";
        case ValueTag::Error:
            switch (v.as.err) {
                case ErrorKind::StackEmpty: return "Error(StackEmpty)";
            }
            return "Error(?)";
    }
    return "?";
}

std::string describe(const Program& program) {
    std::string out = "[";
    for (std::size_t i = 0; i < program.size(); ++i) {
        if (i != 0) out += ", ";
        out += describe(program[i]);
    }
    out += "]";
    return out;
}

std::string describe(const Machine& machine) {
    std::vector<const std::string*> names;
    names.reserve(machine.memory.size());
    for (const auto& kv : machine.memory) names.push_back(&kv.first);
    std::sort(names.begin(), names.end(),
              [](const std::string* a, const std::string* b) { return *a < *b; });

    std::string out = "Machine { stack: " + describe(machine.stack) + ", memory: {";
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i != 0) out += ", ";
        out += quoted(*names[i]) + ": " + describe(machine.memory.at(*names[i]));
    }
    out += "} }";
    return out;
}

std::ostream& operator<<(std::ostream& os, const Value& v) {
    return os << describe(v);
}

} // namespace stackpp::vm
