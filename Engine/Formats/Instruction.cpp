/**
 *  Instruction.cpp
 *  SNRScripter
 *
 *  Operands of scenario bytecode: registers, numbers, expressions and conditions.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Formats/Instruction.hpp"

#include <stdexcept>
#include <cstddef>

Register Register::regular(uint16_t index) {
	if (index >= REGISTER_COUNT)
		throw std::out_of_range("register index " + std::to_string(index));
	return Register(index);
}

Register Register::argument(uint16_t index) {
	if (index >= REGISTER_COUNT)
		throw std::out_of_range("argument index " + std::to_string(index));
	return Register(ARGUMENTS_START + index);
}

Register Register::fromRaw(uint16_t raw) {
	if (raw > ARGUMENTS_END)
		throw ParseError(ParseError::Kind::BadLength, "register 0x" + std::to_string(raw) + " out of range");
	return Register(raw);
}

Register::ParseStatus Register::parse(const std::string &text, Register &out) {
	if (text.size() < 2 || text[0] != '$' || (text[1] != 'v' && text[1] != 'a'))
		return ParseStatus::InvalidPrefix;
	if (text.size() == 2 || text.size() > 6)
		return ParseStatus::InvalidIndex;

	uint32_t index = 0;
	for (size_t i = 2; i < text.size(); i++) {
		if (text[i] < '0' || text[i] > '9')
			return ParseStatus::InvalidIndex;
		index = index * 10 + (text[i] - '0');
		if (index >= REGISTER_COUNT)
			return ParseStatus::InvalidIndex;
	}

	out = text[1] == 'v' ? regular(index) : argument(index);
	return ParseStatus::Ok;
}

std::string Register::toString() const {
	return (isArgument() ? "$a" : "$v") + std::to_string(index());
}

NumberSpec NumberSpec::read(ByteReader &r) {
	uint8_t t = r.u8();
	if (!(t & 0x80))
		return literal(static_cast<int32_t>(static_cast<uint32_t>(t) << 25) >> 25);

	uint8_t p = (t >> 4) & 0x7;
	uint8_t k = t & 0xF;
	// High nibble of the extended constants
	int32_t ks = static_cast<int32_t>(static_cast<uint32_t>(k) << 28) >> 28;

	switch (p) {
		case 0: {
			int32_t b1 = r.u8();
			return literal(static_cast<int32_t>(static_cast<uint32_t>(ks) << 8) | b1);
		}
		case 1: {
			int32_t b1 = r.u8();
			int32_t b2 = r.u8();
			return literal(static_cast<int32_t>(static_cast<uint32_t>(ks) << 16) | (b1 << 8) | b2);
		}
		case 2: {
			int32_t b1 = r.u8();
			int32_t b2 = r.u8();
			int32_t b3 = r.u8();
			return literal(static_cast<int32_t>(static_cast<uint32_t>(ks) << 24) | (b1 << 16) | (b2 << 8) | b3);
		}
		case 3:
			return of(Register::regular(k));
		case 4:
			return of(Register::regular(static_cast<uint16_t>((k << 8) | r.u8())));
		case 5:
			return of(Register::argument(k));
		default:
			throw ParseError(ParseError::Kind::InvalidByte, "number spec tag " + std::to_string(t));
	}
}

void NumberSpec::write(ByteWriter &w) const {
	auto tag = [](uint8_t p, uint8_t k) {
		return static_cast<uint8_t>(0x80 | (p << 4) | (k & 0xF));
	};

	if (isRegister) {
		uint16_t index = reg.index();
		if (reg.isArgument()) {
			if (index > 0xF)
				throw ParseError(ParseError::Kind::BadLength, "argument " + reg.toString() + " cannot be encoded");
			w.u8(tag(5, index));
		} else if (index <= 0xF) {
			w.u8(tag(3, index));
		} else {
			w.u8(tag(4, index >> 8));
			w.u8(index & 0xFF);
		}
		return;
	}

	int32_t v = constant;
	if (v >= -0x40 && v <= 0x3F) {
		w.u8(static_cast<uint8_t>(v) & 0x7F);
	} else if (v >= -0x800 && v <= 0x7FF) {
		w.u8(tag(0, v >> 8));
		w.u8(v & 0xFF);
	} else if (v >= -0x80000 && v <= 0x7FFFF) {
		w.u8(tag(1, v >> 16));
		w.u8((v >> 8) & 0xFF);
		w.u8(v & 0xFF);
	} else if (v >= -0x8000000 && v <= 0x7FFFFFF) {
		w.u8(tag(2, v >> 24));
		w.u8((v >> 16) & 0xFF);
		w.u8((v >> 8) & 0xFF);
		w.u8(v & 0xFF);
	} else {
		throw ParseError(ParseError::Kind::BadLength, "constant " + std::to_string(v) + " cannot be encoded");
	}
}

std::string NumberSpec::toString() const {
	return isRegister ? reg.toString() : std::to_string(constant);
}

size_t Expression::arity(ExpressionOp op) {
	switch (op) {
		case ExpressionOp::Push:
			return 0;
		case ExpressionOp::Negate:
		case ExpressionOp::BitwiseNot:
		case ExpressionOp::Abs:
		case ExpressionOp::CmpZero:
		case ExpressionOp::CmpNotZero:
		case ExpressionOp::Sin:
		case ExpressionOp::Cos:
		case ExpressionOp::Tan:
			return 1;
		case ExpressionOp::Select:
			return 3;
		default:
			return 2;
	}
}

const char *Expression::name(ExpressionOp op) {
	static const char *names[] = {"push", "+",   "-",   "*",  "/",   "%",  "<<",  ">>",  "&",   "|",   "^",
	                              "neg",  "~",   "abs", "==", "!=",  ">=", ">",   "<=",  "<",   "!",   "!!",
	                              "&&",   "||",  "?:",  "*.", "/.",  "sin", "cos", "tan", "min", "max"};
	return names[static_cast<size_t>(op)];
}

Expression Expression::read(ByteReader &r) {
	Expression e;
	size_t start = r.position();
	while (true) {
		uint8_t op = r.u8();
		if (op == EXPRESSION_END)
			break;
		if (op > static_cast<uint8_t>(ExpressionOp::Max))
			throw ParseError(ParseError::Kind::InvalidByte, "expression term " + std::to_string(op));

		ExpressionTerm term;
		term.op = static_cast<ExpressionOp>(op);
		if (term.op == ExpressionOp::Push)
			term.value = NumberSpec::read(r);
		e.terms.push_back(term);
	}

	auto check = e.validate();
	if (check.status != Check::Status::Ok)
		throw ParseError(ParseError::Kind::InvalidByte, "malformed expression at " + std::to_string(start));
	return e;
}

void Expression::write(ByteWriter &w) const {
	auto check = validate();
	if (check.status == Check::Status::StackUnderflow)
		throw ParseError(ParseError::Kind::InvalidByte, "expression underflows at term " + std::to_string(check.value));
	if (check.status == Check::Status::NotSingleValue)
		throw ParseError(ParseError::Kind::InvalidByte, "expression leaves " + std::to_string(check.value) + " values");

	for (auto &term : terms) {
		w.u8(static_cast<uint8_t>(term.op));
		if (term.op == ExpressionOp::Push)
			term.value.write(w);
	}
	w.u8(EXPRESSION_END);
}

Expression::Check Expression::validate() const {
	Check res;
	ptrdiff_t depth = 0;
	for (size_t pos = 0; pos < terms.size(); pos++) {
		depth -= static_cast<ptrdiff_t>(arity(terms[pos].op));
		if (depth < 0) {
			res.status = Check::Status::StackUnderflow;
			res.value  = pos;
			return res;
		}
		depth++;
	}
	if (depth != 1) {
		res.status = Check::Status::NotSingleValue;
		res.value  = depth;
	}
	return res;
}

std::string Expression::toString() const {
	std::string out;
	for (auto &term : terms) {
		if (!out.empty())
			out += ' ';
		out += term.op == ExpressionOp::Push ? term.value.toString() : name(term.op);
	}
	return out;
}

const char *unaryOperationName(UnaryOperationType type) {
	switch (type) {
		case UnaryOperationType::Zero:
			return "zero";
		case UnaryOperationType::Not16:
			return "not16";
		case UnaryOperationType::Negate:
			return "neg";
		case UnaryOperationType::Abs:
			return "abs";
		case UnaryOperationType::BitwiseNot:
			return "not";
	}
	return "?";
}

const char *binaryOperationName(BinaryOperationType type) {
	static const char *names[] = {"mov", "zero", "add",  "sub",   "mul",   "div", "mod", "and", "or",
	                              "xor", "shl",  "shr",  "mulr",  "divr",  "atan2", "bset", "bclr", "tzm"};
	auto i = static_cast<size_t>(type);
	return i < sizeof(names) / sizeof(names[0]) ? names[i] : "?";
}

const char *jumpCondName(JumpCondType type) {
	static const char *names[] = {"==", "!=", ">=", ">", "<=", "<", "&", "bit"};
	return names[static_cast<size_t>(type) & 0x7];
}
