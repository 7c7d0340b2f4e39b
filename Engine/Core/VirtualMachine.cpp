/**
 *  VirtualMachine.cpp
 *  SNRScripter
 *
 *  Scenario bytecode interpreter.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Core/VirtualMachine.hpp"
#include "Support/FileDefs.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <cstdio>
#include <cstdlib>

namespace {
const double TAU = 6.283185307179586;

char errbuf[128];

const char *hexAddress(CodeAddress pc) {
	std::snprintf(errbuf, sizeof(errbuf), "0x%08x", pc);
	return errbuf;
}

[[noreturn]] void corrupt(CodeAddress pc, const std::string &what) {
	throw VmError(VmError::Kind::Corrupt, pc, what);
}

[[noreturn]] void overflow(CodeAddress pc, const char *op) {
	throw VmError(VmError::Kind::Overflow, pc, std::string("overflow in ") + op + " at " + hexAddress(pc));
}

inline int32_t unbool(bool v) {
	return v ? -1 : 0;
}

inline double real(int32_t v) {
	return v / 1000.0;
}

// Float to int conversion that saturates and maps NaN to 0
inline int32_t saturate(double v) {
	if (std::isnan(v))
		return 0;
	if (v >= static_cast<double>(std::numeric_limits<int32_t>::max()))
		return std::numeric_limits<int32_t>::max();
	if (v <= static_cast<double>(std::numeric_limits<int32_t>::min()))
		return std::numeric_limits<int32_t>::min();
	return static_cast<int32_t>(v);
}

inline int32_t unreal(double v) {
	return saturate(static_cast<float>(v) * 1000.0f);
}

inline double angle(int32_t v) {
	return real(v) * TAU;
}

inline int32_t unangle(double v) {
	return unreal(v / TAU);
}

inline int32_t wrap(int64_t v) {
	return static_cast<int32_t>(static_cast<uint32_t>(v));
}

inline int32_t shiftLeft(int32_t l, int32_t r) {
	return static_cast<int32_t>(static_cast<uint32_t>(l) << (r & 31));
}

inline int32_t shiftRight(int32_t l, int32_t r) {
	return l >> (r & 31);
}

inline int32_t divide(int32_t l, int32_t r) {
	if (r == 0)
		return 0;
	if (l == std::numeric_limits<int32_t>::min() && r == -1)
		return l;
	return l / r;
}

inline int32_t modulo(int32_t l, int32_t r) {
	if (r == 0 || r == -1)
		return 0;
	return l - (l / r) * r;
}
} // namespace

const size_t VmContext::DATA_STACK_RESERVE;

VmContext::VmContext(int32_t initVal, uint32_t seed)
    : dataStack(DATA_STACK_RESERVE, 0), prng(seed) {
	memory[0] = initVal;
}

size_t VmContext::argumentSlot(Register r) const {
	// The top of the data stack is the size of the innermost frame
	size_t depth = static_cast<size_t>(r.index()) + 2;
	if (depth > dataStack.size())
		throw VmError(VmError::Kind::Corrupt, 0, "argument " + r.toString() + " outside of the data stack");
	return dataStack.size() - depth;
}

int32_t VmContext::read(Register r) const {
	if (r.isArgument())
		return dataStack[argumentSlot(r)];
	return memory[r.index()];
}

void VmContext::write(Register r, int32_t value) {
	if (r.isArgument())
		dataStack[argumentSlot(r)] = value;
	else
		memory[r.index()] = value;
}

int32_t VmContext::random(int32_t a, int32_t b) const {
	if (a == b)
		return a;
	int64_t lo    = std::min(a, b);
	int64_t range = std::llabs(static_cast<int64_t>(b) - a) + 1;
	int64_t bits  = (prng >> 8) & 0xFFFF;
	return static_cast<int32_t>(lo + ((bits * range) >> 16));
}

bool VmContext::popCode(uint32_t &value) {
	if (codeStack.empty())
		return false;
	value = codeStack.back();
	codeStack.pop_back();
	return true;
}

void VmContext::pushFrame(const std::vector<int32_t> &args) {
	for (auto it = args.rbegin(); it != args.rend(); ++it) dataStack.push_back(*it);
	dataStack.push_back(static_cast<int32_t>(args.size()));
}

bool VmContext::popFrame() {
	if (dataStack.empty())
		return false;
	int32_t count = dataStack.back();
	if (count < 0 || static_cast<size_t>(count) >= dataStack.size())
		return false;
	dataStack.resize(dataStack.size() - 1 - count);
	return true;
}

int32_t VmMath::evaluate(const VmContext &ctx, const Expression &e) {
	std::vector<int32_t> stack;
	stack.reserve(e.terms.size());

	auto pop = [&stack]() {
		int32_t v = stack.back();
		stack.pop_back();
		return v;
	};

	for (auto &term : e.terms) {
		if (term.op == ExpressionOp::Push) {
			stack.push_back(ctx.number(term.value));
			continue;
		}
		if (stack.size() < Expression::arity(term.op))
			throw VmError(VmError::Kind::Corrupt, 0, std::string("expression underflow at ") + Expression::name(term.op));

		if (term.op == ExpressionOp::Select) {
			int32_t cond    = pop();
			int32_t ifTrue  = pop();
			int32_t ifFalse = pop();
			stack.push_back(cond ? ifTrue : ifFalse);
			continue;
		}
		if (Expression::arity(term.op) == 1) {
			int32_t v = pop();
			switch (term.op) {
				case ExpressionOp::Negate:
					v = wrap(-static_cast<int64_t>(v));
					break;
				case ExpressionOp::BitwiseNot:
					v = ~v;
					break;
				case ExpressionOp::Abs:
					v = wrap(std::llabs(static_cast<int64_t>(v)));
					break;
				case ExpressionOp::CmpZero:
					v = unbool(v == 0);
					break;
				case ExpressionOp::CmpNotZero:
					v = unbool(v != 0);
					break;
				case ExpressionOp::Sin:
					v = unreal(std::sin(angle(v)));
					break;
				case ExpressionOp::Cos:
					v = unreal(std::cos(angle(v)));
					break;
				case ExpressionOp::Tan:
					v = unreal(std::tan(angle(v)));
					break;
				default:
					break;
			}
			stack.push_back(v);
			continue;
		}

		int32_t r = pop();
		int32_t l = pop();
		int64_t L = l, R = r;
		int32_t v = 0;
		switch (term.op) {
			case ExpressionOp::Add:
				v = wrap(L + R);
				break;
			case ExpressionOp::Subtract:
				v = wrap(L - R);
				break;
			case ExpressionOp::Multiply:
				v = wrap(L * R);
				break;
			case ExpressionOp::Divide:
				v = divide(l, r);
				break;
			case ExpressionOp::Modulo:
				v = modulo(l, r);
				break;
			case ExpressionOp::ShiftLeft:
				v = shiftLeft(l, r);
				break;
			case ExpressionOp::ShiftRight:
				v = shiftRight(l, r);
				break;
			case ExpressionOp::BitwiseAnd:
				v = l & r;
				break;
			case ExpressionOp::BitwiseOr:
				v = l | r;
				break;
			case ExpressionOp::BitwiseXor:
				v = l ^ r;
				break;
			case ExpressionOp::CmpEqual:
				v = unbool(l == r);
				break;
			case ExpressionOp::CmpNotEqual:
				v = unbool(l != r);
				break;
			case ExpressionOp::CmpGreaterOrEqual:
				v = unbool(l >= r);
				break;
			case ExpressionOp::CmpGreater:
				v = unbool(l > r);
				break;
			case ExpressionOp::CmpLessOrEqual:
				v = unbool(l <= r);
				break;
			case ExpressionOp::CmpLess:
				v = unbool(l < r);
				break;
			case ExpressionOp::LogicalAnd:
				v = unbool(l && r);
				break;
			case ExpressionOp::LogicalOr:
				v = unbool(l || r);
				break;
			case ExpressionOp::MultiplyReal:
				v = wrap(L * R / 1000);
				break;
			case ExpressionOp::DivideReal:
				v = R ? wrap(L * 1000 / R) : 0;
				break;
			case ExpressionOp::Min:
				v = std::min(l, r);
				break;
			case ExpressionOp::Max:
				v = std::max(l, r);
				break;
			default:
				break;
		}
		stack.push_back(v);
	}

	if (stack.size() != 1)
		sendToLog(LogLevel::Warn, "Expression %s left %zu values on the stack\n", e.toString().c_str(), stack.size());
	return stack.empty() ? 0 : stack.back();
}

int32_t VmMath::unary(UnaryOperationType type, int32_t value, CodeAddress pc) {
	switch (type) {
		case UnaryOperationType::Zero:
			return 0;
		case UnaryOperationType::Not16:
			return ~value & 0xFFFF;
		case UnaryOperationType::Negate:
#ifdef SNR_VM_CHECKED_ARITHMETIC
			if (value == std::numeric_limits<int32_t>::min())
				overflow(pc, "neg");
#endif
			return wrap(-static_cast<int64_t>(value));
		case UnaryOperationType::Abs:
#ifdef SNR_VM_CHECKED_ARITHMETIC
			if (value == std::numeric_limits<int32_t>::min())
				overflow(pc, "abs");
#endif
			return wrap(std::llabs(static_cast<int64_t>(value)));
		case UnaryOperationType::BitwiseNot:
			return ~value;
	}
	corrupt(pc, "unknown unary operation at " + std::string(hexAddress(pc)));
}

int32_t VmMath::binary(BinaryOperationType type, int32_t l, int32_t r, CodeAddress pc) {
	int32_t res = 0;
	switch (type) {
		case BinaryOperationType::MovRight:
			return r;
		case BinaryOperationType::Zero:
			return 0;
		case BinaryOperationType::Add:
#ifdef SNR_VM_CHECKED_ARITHMETIC
			if (__builtin_add_overflow(l, r, &res))
				overflow(pc, "add");
			return res;
#else
			return wrap(static_cast<int64_t>(l) + r);
#endif
		case BinaryOperationType::Subtract:
#ifdef SNR_VM_CHECKED_ARITHMETIC
			if (__builtin_sub_overflow(l, r, &res))
				overflow(pc, "sub");
			return res;
#else
			return wrap(static_cast<int64_t>(l) - r);
#endif
		case BinaryOperationType::Multiply:
#ifdef SNR_VM_CHECKED_ARITHMETIC
			if (__builtin_mul_overflow(l, r, &res))
				overflow(pc, "mul");
			return res;
#else
			return wrap(static_cast<int64_t>(l) * r);
#endif
		case BinaryOperationType::Divide:
#ifdef SNR_VM_CHECKED_ARITHMETIC
			if (l == std::numeric_limits<int32_t>::min() && r == -1)
				overflow(pc, "div");
#endif
			return divide(l, r);
		case BinaryOperationType::Modulo:
			return modulo(l, r);
		case BinaryOperationType::BitwiseAnd:
			return l & r;
		case BinaryOperationType::BitwiseOr:
			return l | r;
		case BinaryOperationType::BitwiseXor:
			return l ^ r;
		case BinaryOperationType::LeftShift:
			return shiftLeft(l, r);
		case BinaryOperationType::RightShift:
			return shiftRight(l, r);
		case BinaryOperationType::MultiplyReal:
			return unreal(real(l) * real(r));
		case BinaryOperationType::DivideReal:
			return r ? unreal(real(l) / real(r)) : 0;
		case BinaryOperationType::ATan2:
			return unangle(std::atan2(real(l), real(r)));
		case BinaryOperationType::SetBit:
			return l | shiftLeft(1, r);
		case BinaryOperationType::ClearBit:
			return l & ~shiftLeft(1, r);
		case BinaryOperationType::TrailingZeroMask: {
			uint32_t masked = static_cast<uint32_t>(l) & (0xFFFFFFFFu << (r & 31));
			if (masked == 0)
				masked = 32;
			return __builtin_ctz(masked);
		}
	}
	(void)res;
	corrupt(pc, "unknown binary operation at " + std::string(hexAddress(pc)));
}

bool VmMath::condition(const JumpCond &cond, int32_t l, int32_t r) {
	bool res = false;
	switch (cond.condition) {
		case JumpCondType::Equal:
			res = l == r;
			break;
		case JumpCondType::NotEqual:
			res = l != r;
			break;
		case JumpCondType::GreaterOrEqual:
			res = l >= r;
			break;
		case JumpCondType::Greater:
			res = l > r;
			break;
		case JumpCondType::LessOrEqual:
			res = l <= r;
			break;
		case JumpCondType::Less:
			res = l < r;
			break;
		case JumpCondType::BitwiseAndNotZero:
			res = (l & r) != 0;
			break;
		case JumpCondType::BitSet:
			res = (l & shiftLeft(1, r)) != 0;
			break;
	}
	return cond.negated ? !res : res;
}

VirtualMachine::VirtualMachine(std::shared_ptr<const Scenario> s, int32_t initVal, uint32_t seed)
    : scenario(std::move(s)), ctx(initVal, seed), cursor(scenario->entryPoint()), pc(cursor) {}

bool VirtualMachine::execute(const Instruction &ins) {
	switch (static_cast<Opcode>(ins.opcode)) {
		case Opcode::Uo:
			ctx.write(ins.dest, VmMath::unary(static_cast<UnaryOperationType>(ins.operation), ctx.number(ins.right), pc));
			return false;
		case Opcode::Bo:
			ctx.write(ins.dest, VmMath::binary(static_cast<BinaryOperationType>(ins.operation), ctx.number(ins.left),
			                                   ctx.number(ins.right), pc));
			return false;
		case Opcode::Exp:
			ctx.write(ins.dest, VmMath::evaluate(ctx, ins.expression));
			return false;
		case Opcode::Gt: {
			int32_t index = ctx.number(ins.left);
			bool inside   = index >= 0 && static_cast<size_t>(index) < ins.numbers.size();
			ctx.write(ins.dest, inside ? ctx.number(ins.numbers[index]) : 0);
			return false;
		}
		case Opcode::Jc:
			if (VmMath::condition(ins.cond, ctx.number(ins.left), ctx.number(ins.right)))
				cursor = ins.target;
			return false;
		case Opcode::J:
			cursor = ins.target;
			return false;
		case Opcode::Gosub:
			ctx.pushCode(cursor);
			cursor = ins.target;
			return false;
		case Opcode::Retsub: {
			uint32_t target;
			if (!ctx.popCode(target))
				corrupt(pc, "retsub with an empty call stack");
			cursor = target;
			return false;
		}
		case Opcode::Jt: {
			int32_t index = ctx.number(ins.left);
			if (index >= 0 && static_cast<size_t>(index) < ins.targets.size())
				cursor = ins.targets[index];
			return false;
		}
		case Opcode::Rnd:
			ctx.write(ins.dest, ctx.random(ctx.number(ins.left), ctx.number(ins.right)));
			return false;
		case Opcode::Push:
			for (auto &n : ins.numbers) ctx.pushCode(static_cast<uint32_t>(ctx.number(n)));
			return false;
		case Opcode::Pop: {
			std::vector<int32_t> values;
			for (size_t i = 0; i < ins.registers.size(); i++) {
				uint32_t v;
				if (!ctx.popCode(v))
					corrupt(pc, "pop with an empty call stack");
				values.push_back(static_cast<int32_t>(v));
			}
			for (size_t i = 0; i < values.size(); i++) ctx.write(ins.registers[i], values[i]);
			return false;
		}
		case Opcode::Call: {
			std::vector<int32_t> args;
			args.reserve(ins.numbers.size());
			for (auto &n : ins.numbers) args.push_back(ctx.number(n));
			ctx.pushCode(cursor);
			ctx.pushFrame(args);
			cursor = ins.target;
			return false;
		}
		case Opcode::Return: {
			uint32_t target;
			if (!ctx.popFrame())
				corrupt(pc, "return without an argument frame");
			if (!ctx.popCode(target))
				corrupt(pc, "return with an empty call stack");
			cursor = target;
			return false;
		}
	}
	return true;
}

RuntimeCommand VirtualMachine::run(const CommandResult &previous) {
	if (previous.writesMemory)
		ctx.write(previous.dest, previous.value);

	while (true) {
		ctx.stepPrng();
		pc = cursor;

		Instruction ins;
		try {
			ins = scenario->instructionAt(cursor);
		} catch (const ParseError &e) {
			corrupt(pc, e.what());
		}

		try {
			if (execute(ins))
				return ins.command.resolve(*this);
		} catch (const VmError &e) {
			// Context errors carry no address of their own
			if (e.pc == 0 && pc != 0)
				throw VmError(e.kind, pc, e.what());
			throw;
		}
	}
}
