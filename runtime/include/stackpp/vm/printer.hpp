#pragma once
#include <ostream>
#include <string>

#include "stackpp/vm/memory.hpp"
#include "stackpp/vm/value.hpp"

namespace stackpp::vm {

// Debug rendering used by the REPL and the tracer:
//   Number(7.0)  String("hi")  Block([Variable("i"), Instruction(Add)])
//   Machine { stack: [...], memory: {"i": Number(10.0)} }
std::string describe(const Value& v);
std::string describe(const Program& program);
std::string describe(const Machine& machine);

std::ostream& operator<<(std::ostream& os, const Value& v);

} // namespace stackpp::vm
