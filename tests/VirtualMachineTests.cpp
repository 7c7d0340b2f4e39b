/**
 *  VirtualMachineTests.cpp
 *  SNRScripter
 *
 *  Interpreter semantics.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Core/VirtualMachine.hpp"
#include "tests/Builders.hpp"

#include <gtest/gtest.h>

using namespace TestData;

namespace {
CompiletimeCommand exitCommand() {
	return makeCommand(Cmd::EXIT, {Arg::u8(0), Arg::number(0)});
}

uint32_t stepped(uint32_t state, int times) {
	for (int i = 0; i < times; i++) state = state * 0x343FD + 0x269EC3;
	return state;
}
} // namespace

TEST(VirtualMachine, ArithmeticUpToTheFirstCommand) {
	auto s = assemble([](Assembler &as) {
		as << Ins::bo(BinaryOperationType::Add, v(0), n(2), n(3));
		as << Ins::bo(BinaryOperationType::Multiply, v(1), r(v(0)), n(7));
		as << Ins::command(exitCommand());
	});

	VirtualMachine vm(s, 0, 1234);
	auto cmd = vm.run(CommandResult::none());
	EXPECT_EQ(cmd.opcode, Cmd::EXIT);
	EXPECT_EQ(vm.context().read(v(0)), 5);
	EXPECT_EQ(vm.context().read(v(1)), 35);
	EXPECT_EQ(vm.context().prngState(), stepped(1234, 3));
}

TEST(VirtualMachine, InitialValueLandsInTheFirstRegister) {
	VmContext ctx(77, 0);
	EXPECT_EQ(ctx.read(v(0)), 77);
	EXPECT_EQ(ctx.read(v(1)), 0);
}

TEST(VirtualMachine, RandomUsesTheAdvancedState) {
	auto s = assemble([](Assembler &as) {
		as << Ins::rnd(v(0), n(0), n(99));
		as << Ins::command(exitCommand());
	});

	VirtualMachine vm(s, 0, 42);
	vm.run(CommandResult::none());
	uint32_t state  = stepped(42, 1);
	int32_t expects = static_cast<int32_t>((((state >> 8) & 0xFFFF) * 100) >> 16);
	EXPECT_EQ(vm.context().read(v(0)), expects);
	EXPECT_GE(expects, 0);
	EXPECT_LE(expects, 99);
}

TEST(VirtualMachine, RandomRanges) {
	VmContext ctx(0, 0xFFFFFFFF);
	EXPECT_EQ(ctx.random(5, 5), 5);
	// Reversed bounds cover the same range
	EXPECT_EQ(ctx.random(10, 1), ctx.random(1, 10));
	EXPECT_EQ(ctx.random(1, 10), 10);
}

TEST(VirtualMachine, DivisionByZeroIsZero) {
	EXPECT_EQ(VmMath::binary(BinaryOperationType::Divide, 7, 0, 0), 0);
	EXPECT_EQ(VmMath::binary(BinaryOperationType::Modulo, 7, 0, 0), 0);
	EXPECT_EQ(VmMath::binary(BinaryOperationType::Modulo, -7, 3, 0), -1);
	EXPECT_EQ(VmMath::binary(BinaryOperationType::DivideReal, 7, 0, 0), 0);
	EXPECT_EQ(VmMath::binary(BinaryOperationType::MultiplyReal, 1500, 2000, 0), 3000);
}

TEST(VirtualMachine, BitOperations) {
	EXPECT_EQ(VmMath::binary(BinaryOperationType::SetBit, 0, 4, 0), 16);
	EXPECT_EQ(VmMath::binary(BinaryOperationType::ClearBit, 0xFF, 0, 0), 0xFE);
	EXPECT_EQ(VmMath::binary(BinaryOperationType::TrailingZeroMask, 0x30, 0, 0), 4);
	EXPECT_EQ(VmMath::binary(BinaryOperationType::TrailingZeroMask, 0x30, 5, 0), 5);
	EXPECT_EQ(VmMath::unary(UnaryOperationType::Not16, 0, 0), 0xFFFF);
	EXPECT_TRUE(VmMath::condition({JumpCondType::BitSet, false}, 0x8, 3));
	EXPECT_FALSE(VmMath::condition({JumpCondType::Less, true}, 1, 2));
}

TEST(VirtualMachine, CommandsPreserveRegisters) {
	auto s = assemble([](Assembler &as) {
		as << Ins::bo(BinaryOperationType::MovRight, v(3), {}, n(9));
		as.cmd(Cmd::WAIT, {Arg::flag(false), Arg::number(0)});
		as << Ins::bo(BinaryOperationType::Add, v(3), {}, n(1));
		as << Ins::command(exitCommand());
	});

	VirtualMachine vm(s, 0, 0);
	auto wait = vm.run(CommandResult::none());
	EXPECT_EQ(wait.opcode, Cmd::WAIT);
	EXPECT_EQ(wait.number(1), 0);
	EXPECT_EQ(vm.context().read(v(3)), 9);
	EXPECT_EQ(vm.run(CommandResult::dummyFor(wait)).opcode, Cmd::EXIT);
	EXPECT_EQ(vm.context().read(v(3)), 10);
}

TEST(VirtualMachine, DestinationAnswersAreWritten) {
	auto s = assemble([](Assembler &as) {
		as.cmd(Cmd::SGET, {Arg::dest(v(5)), Arg::number(3)});
		as << Ins::command(exitCommand());
	});

	VirtualMachine vm(s, 0, 0);
	auto get = vm.run(CommandResult::none());
	ASSERT_TRUE(get.hasDest());
	EXPECT_EQ(get.dest(), v(5));
	vm.run(CommandResult::writeMemory(get.dest(), -12));
	EXPECT_EQ(vm.context().read(v(5)), -12);
}

TEST(VirtualMachine, GosubReturnsAfterTheCall) {
	auto s = assemble([](Assembler &as) {
		as << Ins::gosub(as.at("sub"));
		as << Ins::bo(BinaryOperationType::Add, v(1), {}, n(100));
		as << Ins::command(exitCommand());
		as.label("sub");
		as << Ins::bo(BinaryOperationType::MovRight, v(1), {}, n(5));
		as << Ins::retsub();
	});

	VirtualMachine vm(s, 0, 0);
	vm.run(CommandResult::none());
	EXPECT_EQ(vm.context().read(v(1)), 105);
	EXPECT_TRUE(vm.context().codeStackView().empty());
}

TEST(VirtualMachine, CallFramesExposeArguments) {
	auto s = assemble([](Assembler &as) {
		as << Ins::bo(BinaryOperationType::MovRight, v(2), {}, n(4));
		as << Ins::call(as.at("f"), {n(5), r(v(2))});
		as << Ins::command(exitCommand());
		as.label("f");
		as << Ins::bo(BinaryOperationType::Subtract, v(0), r(a(0)), r(a(1)));
		as << Ins::bo(BinaryOperationType::MovRight, a(1), {}, n(0));
		as << Ins::ret();
	});

	VirtualMachine vm(s, 0, 0);
	size_t reserve = vm.context().dataStackView().size();
	vm.run(CommandResult::none());
	EXPECT_EQ(vm.context().read(v(0)), 1);
	EXPECT_EQ(vm.context().dataStackView().size(), reserve);
	EXPECT_TRUE(vm.context().codeStackView().empty());
}

TEST(VirtualMachine, PushAndPopRestoreRegisters) {
	auto s = assemble([](Assembler &as) {
		as << Ins::bo(BinaryOperationType::MovRight, v(1), {}, n(11));
		as << Ins::push({r(v(1)), n(22)});
		as << Ins::bo(BinaryOperationType::Zero, v(1), {}, n(0));
		as << Ins::pop({v(2), v(1)});
		as << Ins::command(exitCommand());
	});

	VirtualMachine vm(s, 0, 0);
	vm.run(CommandResult::none());
	EXPECT_EQ(vm.context().read(v(2)), 22);
	EXPECT_EQ(vm.context().read(v(1)), 11);
}

TEST(VirtualMachine, TablesOutOfRangeFallThrough) {
	auto s = assemble([](Assembler &as) {
		as << Ins::bo(BinaryOperationType::MovRight, v(0), {}, n(2));
		as << Ins::jt(r(v(0)), {as.at("zero"), as.at("one")});
		as << Ins::gt(v(1), r(v(0)), {n(10), n(20)});
		as << Ins::gt(v(2), n(1), {n(10), n(20)});
		as << Ins::command(exitCommand());
		as.label("zero");
		as.label("one");
		as << Ins::bo(BinaryOperationType::MovRight, v(3), {}, n(1));
		as << Ins::command(exitCommand());
	});

	VirtualMachine vm(s, 0, 0);
	vm.run(CommandResult::none());
	EXPECT_EQ(vm.context().read(v(1)), 0);
	EXPECT_EQ(vm.context().read(v(2)), 20);
	EXPECT_EQ(vm.context().read(v(3)), 0);
}

TEST(VirtualMachine, ConditionalJumps) {
	auto s = assemble([](Assembler &as) {
		as << Ins::bo(BinaryOperationType::MovRight, v(0), {}, n(3));
		as.label("loop");
		as << Ins::bo(BinaryOperationType::Add, v(1), {}, n(10));
		as << Ins::bo(BinaryOperationType::Subtract, v(0), {}, n(1));
		as << Ins::jc({JumpCondType::Greater, false}, r(v(0)), n(0), as.at("loop"));
		as << Ins::command(exitCommand());
	});

	VirtualMachine vm(s, 0, 0);
	vm.run(CommandResult::none());
	EXPECT_EQ(vm.context().read(v(1)), 30);
}

TEST(VirtualMachine, EmptyStackRetsubIsCorrupt) {
	CodeAddress failing = 0;
	auto s = assemble([&failing](Assembler &as) {
		as << Ins::bo(BinaryOperationType::Add, v(0), {}, n(1));
		failing = as.here();
		as << Ins::retsub();
	});

	VirtualMachine vm(s, 0, 0);
	try {
		vm.run(CommandResult::none());
		FAIL() << "retsub on an empty stack";
	} catch (const VmError &e) {
		EXPECT_EQ(e.kind, VmError::Kind::Corrupt);
		EXPECT_EQ(e.pc, failing);
	}
}

TEST(VirtualMachine, ArgumentsOutsideTheStackAreCorrupt) {
	VmContext ctx(0, 0);
	EXPECT_EQ(ctx.read(a(15)), 0);
	EXPECT_THROW(ctx.read(a(VmContext::DATA_STACK_RESERVE)), VmError);

	ctx.pushFrame({8, 9});
	EXPECT_EQ(ctx.read(a(0)), 8);
	EXPECT_EQ(ctx.read(a(1)), 9);
	EXPECT_TRUE(ctx.popFrame());
	EXPECT_EQ(ctx.dataStackView().size(), VmContext::DATA_STACK_RESERVE);
}

TEST(VirtualMachine, ExpressionsEvaluateOnAStack) {
	VmContext ctx(0, 0);
	ctx.write(v(1), 6);
	Expression e;
	ExpressionTerm t;
	t.value = r(v(1));
	e.terms.push_back(t);
	t.value = n(4);
	e.terms.push_back(t);
	ExpressionTerm op;
	op.op = ExpressionOp::CmpGreater;
	e.terms.push_back(op);
	EXPECT_EQ(VmMath::evaluate(ctx, e), -1);
}
