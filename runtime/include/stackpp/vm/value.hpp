#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "stackpp/vm/opcode.hpp"

namespace stackpp::vm {

struct Value;

// A parsed program and the body of a block share one representation.
using Program = std::vector<Value>;

enum class ValueTag : uint8_t {
    Number,
    String,
    Bool,
    Variable,
    Instruction,
    Block,
    Error
};

enum class ErrorKind : uint8_t {
    StackEmpty
};

struct Value {
    ValueTag tag{ValueTag::Error};
    union {
        double    n;
        bool      b;
        Opcode    op;
        ErrorKind err;
    } as{};
    std::string text;                      // String, Variable
    std::shared_ptr<const Program> body;   // Block; never mutated after parse

    static Value number(double v) { Value x; x.tag = ValueTag::Number; x.as.n = v; return x; }
    static Value string(std::string s) { Value x; x.tag = ValueTag::String; x.text = std::move(s); return x; }
    static Value boolean(bool v) { Value x; x.tag = ValueTag::Bool; x.as.b = v; return x; }
    static Value variable(std::string name) { Value x; x.tag = ValueTag::Variable; x.text = std::move(name); return x; }
    static Value instruction(Opcode o) { Value x; x.tag = ValueTag::Instruction; x.as.op = o; return x; }
    static Value block(Program code);
    static Value error(ErrorKind k) { Value x; x.tag = ValueTag::Error; x.as.err = k; return x; }

    bool is(ValueTag t) const { return tag == t; }
};

bool operator==(const Value& a, const Value& b);
inline bool operator!=(const Value& a, const Value& b) { return !(a == b); }

// Total coercions. None of them fails: a value of the wrong variant
// yields 0, "", false or a one-element block holding the value itself.
double asNumber(const Value& v);
std::string asString(const Value& v);
bool asBool(const Value& v);
std::shared_ptr<const Program> asBlock(const Value& v);

// Shortest text that reads back to the same double, never in exponent form.
std::string formatNumber(double n);

} // namespace stackpp::vm
