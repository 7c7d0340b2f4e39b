/**
 *  Instruction.hpp
 *  SNRScripter
 *
 *  Operands of scenario bytecode: registers, numbers, expressions and conditions.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Support/ByteStream.hpp"

#include <string>
#include <vector>
#include <cstdint>

using CodeAddress = uint32_t;

// 0x0000..0x0FFF address the global register file, 0x1000..0x1FFF the arguments of the innermost frame
class Register {
	uint16_t value{0};

	explicit Register(uint16_t raw)
	    : value(raw) {}

public:
	static const uint16_t ARGUMENTS_START = 0x1000;
	static const uint16_t ARGUMENTS_END   = 0x1FFF;
	static const uint16_t REGISTER_COUNT  = 0x1000;

	enum class ParseStatus {
		Ok,
		InvalidPrefix,
		InvalidIndex
	};

	Register() = default;

	// Both throw std::out_of_range for indices above 4095
	static Register regular(uint16_t index);
	static Register argument(uint16_t index);
	// Throws ParseError(BadLength) for raw values outside of both ranges
	static Register fromRaw(uint16_t raw);

	static ParseStatus parse(const std::string &text, Register &out);

	bool isArgument() const {
		return value >= ARGUMENTS_START;
	}
	uint16_t index() const {
		return isArgument() ? value - ARGUMENTS_START : value;
	}
	uint16_t raw() const {
		return value;
	}
	std::string toString() const;

	bool operator==(const Register &o) const {
		return value == o.value;
	}
	bool operator!=(const Register &o) const {
		return value != o.value;
	}
	bool operator<(const Register &o) const {
		return value < o.value;
	}
};

// Either a literal or a register reference
struct NumberSpec {
	bool isRegister{false};
	int32_t constant{0};
	Register reg;

	static NumberSpec literal(int32_t v) {
		NumberSpec s;
		s.constant = v;
		return s;
	}
	static NumberSpec of(Register r) {
		NumberSpec s;
		s.isRegister = true;
		s.reg        = r;
		return s;
	}

	static NumberSpec read(ByteReader &r);
	// Picks the shortest form, throws ParseError(BadLength) for constants outside of 28 bits
	void write(ByteWriter &w) const;
	std::string toString() const;

	bool operator==(const NumberSpec &o) const {
		return isRegister == o.isRegister && (isRegister ? reg == o.reg : constant == o.constant);
	}
	bool operator!=(const NumberSpec &o) const {
		return !(*this == o);
	}
};

enum class ExpressionOp : uint8_t {
	Push,
	Add,
	Subtract,
	Multiply,
	Divide,
	Modulo,
	ShiftLeft,
	ShiftRight,
	BitwiseAnd,
	BitwiseOr,
	BitwiseXor,
	Negate,
	BitwiseNot,
	Abs,
	CmpEqual,
	CmpNotEqual,
	CmpGreaterOrEqual,
	CmpGreater,
	CmpLessOrEqual,
	CmpLess,
	CmpZero,
	CmpNotZero,
	LogicalAnd,
	LogicalOr,
	Select,
	MultiplyReal,
	DivideReal,
	Sin,
	Cos,
	Tan,
	Min,
	Max
};

const uint8_t EXPRESSION_END = 0xFF;

struct ExpressionTerm {
	ExpressionOp op{ExpressionOp::Push};
	NumberSpec value;

	bool operator==(const ExpressionTerm &o) const {
		return op == o.op && (op != ExpressionOp::Push || value == o.value);
	}
};

struct Expression {
	std::vector<ExpressionTerm> terms;

	struct Check {
		enum class Status {
			Ok,
			StackUnderflow,
			NotSingleValue
		} status{Status::Ok};
		// Term position for StackUnderflow, final stack depth for NotSingleValue
		size_t value{0};
	};

	static Expression read(ByteReader &r);
	void write(ByteWriter &w) const;
	Check validate() const;
	std::string toString() const;

	bool operator==(const Expression &o) const {
		return terms == o.terms;
	}

	// Stack inputs consumed by a term, the result count is always one
	static size_t arity(ExpressionOp op);
	static const char *name(ExpressionOp op);
};

enum class UnaryOperationType : uint8_t {
	Zero       = 0,
	Not16      = 1,
	Negate     = 2,
	Abs        = 3,
	BitwiseNot = 4
};

enum class BinaryOperationType : uint8_t {
	MovRight         = 0x00,
	Zero             = 0x01,
	Add              = 0x02,
	Subtract         = 0x03,
	Multiply         = 0x04,
	Divide           = 0x05,
	Modulo           = 0x06,
	BitwiseAnd       = 0x07,
	BitwiseOr        = 0x08,
	BitwiseXor       = 0x09,
	LeftShift        = 0x0A,
	RightShift       = 0x0B,
	MultiplyReal     = 0x0C,
	DivideReal       = 0x0D,
	ATan2            = 0x0E,
	SetBit           = 0x0F,
	ClearBit         = 0x10,
	TrailingZeroMask = 0x11
};

enum class JumpCondType : uint8_t {
	Equal             = 0x0,
	NotEqual          = 0x1,
	GreaterOrEqual    = 0x2,
	Greater           = 0x3,
	LessOrEqual       = 0x4,
	Less              = 0x5,
	BitwiseAndNotZero = 0x6,
	BitSet            = 0x7
};

struct JumpCond {
	JumpCondType condition{JumpCondType::Equal};
	bool negated{false};

	uint8_t encode() const {
		return static_cast<uint8_t>(condition) | (negated ? 0x80 : 0);
	}
	bool operator==(const JumpCond &o) const {
		return condition == o.condition && negated == o.negated;
	}
};

const char *unaryOperationName(UnaryOperationType type);
const char *binaryOperationName(BinaryOperationType type);
const char *jumpCondName(JumpCondType type);

enum class Opcode : uint8_t {
	Uo     = 0x40,
	Bo     = 0x41,
	Exp    = 0x42,
	Gt     = 0x44,
	Jc     = 0x46,
	J      = 0x47,
	Gosub  = 0x48,
	Retsub = 0x49,
	Jt     = 0x4A,
	Rnd    = 0x4C,
	Push   = 0x4D,
	Pop    = 0x4E,
	Call   = 0x4F,
	Return = 0x50
};

inline bool isInstructionOpcode(uint8_t op) {
	return op >= static_cast<uint8_t>(Opcode::Uo) && op <= static_cast<uint8_t>(Opcode::Return) && op != 0x43 && op != 0x45 &&
	       op != 0x4B;
}
