#include "stackpp/vm/value.hpp"

#include <charconv>
#include <cmath>
#include <stdexcept>

namespace stackpp::vm {

Value Value::block(Program code) {
    Value x;
    x.tag = ValueTag::Block;
    x.body = std::make_shared<const Program>(std::move(code));
    return x;
}

bool operator==(const Value& a, const Value& b) {
    if (a.tag != b.tag) return false;
    switch (a.tag) {
        case ValueTag::Number:      return a.as.n == b.as.n;
        case ValueTag::String:
        case ValueTag::Variable:    return a.text == b.text;
        case ValueTag::Bool:        return a.as.b == b.as.b;
        case ValueTag::Instruction: return a.as.op == b.as.op;
        case ValueTag::Error:       return a.as.err == b.as.err;
        case ValueTag::Block: {
            if (a.body == b.body) return true;
            if (!a.body || !b.body) return false;
            return *a.body == *b.body;
        }
    }
    return false;
}

double asNumber(const Value& v) {
    return v.tag == ValueTag::Number ? v.as.n : 0.0;
}

std::string asString(const Value& v) {
    switch (v.tag) {
        case ValueTag::String:
        case ValueTag::Variable:
            return v.text;
        case ValueTag::Number:
            return formatNumber(v.as.n);
        default:
            return std::string();
    }
}

bool asBool(const Value& v) {
    return v.tag == ValueTag::Bool && v.as.b;
}

std::shared_ptr<const Program> asBlock(const Value& v) {
    if (v.tag == ValueTag::Block && v.body) return v.body;
    return std::make_shared<const Program>(Program{v});
}

std::string formatNumber(double n) {
    if (std::isnan(n)) return "NaN";
    if (std::isinf(n)) return n < 0 ? "-inf" : "inf";

    // fixed notation of DBL_MAX or DBL_TRUE_MIN stays well under this
    char buf[512];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), n, std::chars_format::fixed);
    if (ec != std::errc()) {
        throw std::runtime_error("formatNumber: buffer too small");
    }
    return std::string(buf, ptr);
}

std::string_view opcodeName(Opcode op) {
    switch (op) {
        case Opcode::ADD:          return "Add";
        case Opcode::SUB:          return "Sub";
        case Opcode::MUL:          return "Mul";
        case Opcode::DIV:          return "Div";
        case Opcode::MOD:          return "Mod";
        case Opcode::POW:          return "Pow";
        case Opcode::CONCAT:       return "Concat";
        case Opcode::PRINT:        return "Print";
        case Opcode::INPUT:        return "Input";
        case Opcode::EQUAL:        return "Equal";
        case Opcode::LESS_THAN:    return "LessThan";
        case Opcode::GREATER_THAN: return "GreaterThan";
        case Opcode::EVAL:         return "Eval";
        case Opcode::WHEN:         return "When";
        case Opcode::IF_ELSE:      return "IfElse";
        case Opcode::WHILE:        return "While";
        case Opcode::UNTIL:        return "Until";
        case Opcode::LET:          return "Let";
        case Opcode::POP:          return "Pop";
    }
    return "?";
}

} // namespace stackpp::vm
