#pragma once
#include <vector>
#include <unordered_map>
#include <string>
#include <cstdint>
#include <iostream>

#include "stackpp/vm/value.hpp"

namespace stackpp::vm {

// Runtime state of one interpreter session: operand stack plus the global
// variable store. Outlives every evaluation run against it.
class Machine {
public:
    std::vector<Value> stack;
    std::unordered_map<std::string, Value> memory;

    struct Stats {
        uint64_t instructionsExecuted = 0;
        uint64_t valuesPushed = 0;
        uint64_t blocksEvaluated = 0;
        uint64_t emptyPops = 0;
        std::size_t maxStackDepth = 0;
        std::size_t maxNestingDepth = 0;

        void print(std::ostream& os) const {
            os << "VM Statistics:\n";
            os << "  Instructions executed: " << instructionsExecuted << "\n";
            os << "  Values pushed: " << valuesPushed << "\n";
            os << "  Blocks evaluated: " << blocksEvaluated << "\n";
            os << "  Pops on empty stack: " << emptyPops << "\n";
            os << "  Max stack depth: " << maxStackDepth << "\n";
            os << "  Max nesting depth: " << maxNestingDepth << "\n";
        }
    };

    Stats stats;

    void push(Value v) {
        stack.push_back(std::move(v));
        stats.valuesPushed++;
        if (stack.size() > stats.maxStackDepth) stats.maxStackDepth = stack.size();
    }

    // Never fails: an empty stack yields Error(StackEmpty).
    Value pop() {
        if (stack.empty()) {
            stats.emptyPops++;
            return Value::error(ErrorKind::StackEmpty);
        }
        Value v = std::move(stack.back());
        stack.pop_back();
        return v;
    }

    void drop() {
        if (!stack.empty()) stack.pop_back();
    }

    const Value* top() const { return stack.empty() ? nullptr : &stack.back(); }

    const Value* lookup(const std::string& name) const {
        auto it = memory.find(name);
        return it == memory.end() ? nullptr : &it->second;
    }

    void bind(std::string name, Value v) {
        memory.insert_or_assign(std::move(name), std::move(v));
    }

    void setTraceEnabled(bool on) { traceEnabled_ = on; }
    bool isTraceEnabled() const { return traceEnabled_; }

    void setTraceStream(std::ostream& os) { trace_ = &os; }
    std::ostream& traceStream() { return *trace_; }

private:
    bool traceEnabled_ = false;
    std::ostream* trace_ = &std::cerr;
};

} // namespace stackpp::vm
