#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "stackpp/vm/value.hpp"

namespace stackpp::syntax {

// Tokenize and classify. Never fails: tokens that are neither a literal,
// a variable nor a keyword are left out of the result.
vm::Program parse(std::string_view source);
vm::Program parse(const std::vector<std::string>& tokens);

// Classify one raw token; nullopt when it is dropped.
std::optional<vm::Value> parseToken(std::string_view token);

// 64-bit float literal: [+-] digits [. digits] [e[+-]digits], or inf/infinity/nan.
std::optional<double> parseNumber(std::string_view token);

// Read the whole file and parse it.
// Throws std::runtime_error if the file cannot be read.
vm::Program loadProgramFromFile(const std::string& path);

} // namespace stackpp::syntax
