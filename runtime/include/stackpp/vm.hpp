#pragma once
#include <iostream>
#include <cstddef>

#include "stackpp/vm/memory.hpp"
#include "stackpp/vm/value.hpp"

namespace stackpp::vm {

// Executes programs against a borrowed Machine. Control-flow instructions
// re-enter eval() on nested blocks; there is no instruction pointer.
class VM {
public:
    explicit VM(Machine& machine, std::istream& in = std::cin, std::ostream& out = std::cout)
        : mem(machine), in_(in), out_(out) {}

    Machine& mem;

    void eval(const Program& program);

private:
    std::istream& in_;
    std::ostream& out_;
    std::size_t depth_ = 0;

    void step(const Value& v);
    void execute(Opcode op);
    void evalBlock(const Value& v);
    void trace(const Value& v);
};

// Entry point used by the driver: stdin/stdout bound.
void evaluate(const Program& program, Machine& machine);

} // namespace stackpp::vm
