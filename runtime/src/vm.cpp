#include "stackpp/vm.hpp"
#include <cmath>
#include <string>
#include "stackpp/vm/printer.hpp"

namespace stackpp::vm {

void VM::trace(const Value& v) {
    std::ostream& os = mem.traceStream();
    os << "[VM] " << std::string((depth_ - 1) * 2, ' ') << describe(v)
       << " (stack=" << mem.stack.size() << ", depth=" << depth_ << ")\n";
}

void VM::eval(const Program& program) {
    ++depth_;
    mem.stats.blocksEvaluated++;
    if (depth_ > mem.stats.maxNestingDepth) mem.stats.maxNestingDepth = depth_;

    for (const Value& v : program) step(v);

    --depth_;
}

void VM::evalBlock(const Value& v) {
    // hold a reference: the block may be popped or rebound while it runs
    std::shared_ptr<const Program> code = asBlock(v);
    eval(*code);
}

void VM::step(const Value& v) {
    if (mem.isTraceEnabled()) trace(v);

    switch (v.tag) {
        case ValueTag::Instruction:
            mem.stats.instructionsExecuted++;
            execute(v.as.op);
            return;
        case ValueTag::Variable: {
            // unbound names stay on the stack as they are
            const Value* bound = mem.lookup(v.text);
            mem.push(bound ? *bound : v);
            return;
        }
        case ValueTag::Number:
        case ValueTag::String:
        case ValueTag::Bool:
        case ValueTag::Block:
        case ValueTag::Error:
            mem.push(v);
            return;
    }
}

void VM::execute(Opcode op) {
    switch (op) {
        // ---- arithmetic: right operand is on top
        case Opcode::ADD:
        case Opcode::SUB:
        case Opcode::MUL:
        case Opcode::DIV:
        case Opcode::MOD:
        case Opcode::POW: {
            double rhs = asNumber(mem.pop());
            double lhs = asNumber(mem.pop());
            double res = 0;
            switch (op) {
                case Opcode::ADD: res = lhs + rhs; break;
                case Opcode::SUB: res = lhs - rhs; break;
                case Opcode::MUL: res = lhs * rhs; break;
                case Opcode::DIV: res = lhs / rhs; break;
                case Opcode::MOD: res = std::fmod(lhs, rhs); break;
                case Opcode::POW: res = std::pow(lhs, rhs); break;
                default: break;
            }
            mem.push(Value::number(res));
            return;
        }

        case Opcode::CONCAT: {
            std::string rhs = asString(mem.pop());
            std::string lhs = asString(mem.pop());
            mem.push(Value::string(lhs + rhs));
            return;
        }

        // ---- I/O
        case Opcode::PRINT: {
            out_ << asString(mem.pop());
            out_.flush();
            return;
        }
        case Opcode::INPUT: {
            std::string line;
            if (!std::getline(in_, line)) line.clear();
            if (!line.empty() && line.back() == '\r') line.pop_back();
            mem.push(Value::string(std::move(line)));
            return;
        }

        // ---- comparisons -> bool
        case Opcode::EQUAL: {
            std::string rhs = asString(mem.pop());
            std::string lhs = asString(mem.pop());
            mem.push(Value::boolean(lhs == rhs));
            return;
        }
        case Opcode::LESS_THAN:
        case Opcode::GREATER_THAN: {
            double rhs = asNumber(mem.pop());
            double lhs = asNumber(mem.pop());
            mem.push(Value::boolean(op == Opcode::LESS_THAN ? lhs < rhs : lhs > rhs));
            return;
        }

        // ---- control flow: blocks are popped before the condition
        case Opcode::EVAL: {
            evalBlock(mem.pop());
            return;
        }
        case Opcode::WHEN: {
            Value code = mem.pop();
            bool cond = asBool(mem.pop());
            if (cond) evalBlock(code);
            return;
        }
        case Opcode::IF_ELSE: {
            Value codeFalse = mem.pop();
            Value codeTrue = mem.pop();
            bool cond = asBool(mem.pop());
            evalBlock(cond ? codeTrue : codeFalse);
            return;
        }
        case Opcode::WHILE:
        case Opcode::UNTIL: {
            std::shared_ptr<const Program> body = asBlock(mem.pop());
            std::shared_ptr<const Program> cond = asBlock(mem.pop());
            bool runWhile = (op == Opcode::WHILE);
            while (true) {
                eval(*cond);
                if (asBool(mem.pop()) != runWhile) break;
                eval(*body);
            }
            return;
        }

        // ---- variables
        case Opcode::LET: {
            std::string name = asString(mem.pop());
            Value value = mem.pop();
            mem.bind(std::move(name), std::move(value));
            return;
        }
        case Opcode::POP: {
            mem.drop();
            return;
        }
    }
}

void evaluate(const Program& program, Machine& machine) {
    VM vm(machine);
    vm.eval(program);
}

} // namespace stackpp::vm
