#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

namespace stackpp::vm {

enum class Opcode : uint8_t {
    ADD, SUB, MUL, DIV, MOD, POW,   // number, number -> number

    CONCAT,                         // string, string -> string

    PRINT,                          // value -> (stdout)
    INPUT,                          // -> string

    EQUAL,                          // string, string -> bool
    LESS_THAN, GREATER_THAN,        // number, number -> bool

    EVAL,                           // block
    WHEN,                           // bool, block
    IF_ELSE,                        // bool, block(true), block(false)
    WHILE,                          // block(cond), block(body)
    UNTIL,                          // block(cond), block(body)

    LET,                            // value, name
    POP
};

struct KeywordEntry {
    std::string_view keyword;
    Opcode op;
};

inline constexpr KeywordEntry kKeywords[] = {
    {"add", Opcode::ADD},
    {"sub", Opcode::SUB},
    {"mul", Opcode::MUL},
    {"div", Opcode::DIV},
    {"mod", Opcode::MOD},
    {"pow", Opcode::POW},
    {"concat", Opcode::CONCAT},
    {"print", Opcode::PRINT},
    {"input", Opcode::INPUT},
    {"equal", Opcode::EQUAL},
    {"less-than", Opcode::LESS_THAN},
    {"greater-than", Opcode::GREATER_THAN},
    {"eval", Opcode::EVAL},
    {"when", Opcode::WHEN},
    {"if-else", Opcode::IF_ELSE},
    {"while", Opcode::WHILE},
    {"until", Opcode::UNTIL},
    {"let", Opcode::LET},
    {"pop", Opcode::POP},
};

// Exact, case-sensitive match.
inline std::optional<Opcode> lookupKeyword(std::string_view word) {
    for (const auto& k : kKeywords) {
        if (k.keyword == word) return k.op;
    }
    return std::nullopt;
}

inline std::string_view keywordOf(Opcode op) {
    for (const auto& k : kKeywords) {
        if (k.op == op) return k.keyword;
    }
    return "?";
}

// Name used by the debug printer: Instruction(LessThan)
std::string_view opcodeName(Opcode op);

} // namespace stackpp::vm
