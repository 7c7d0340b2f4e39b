/**
 *  InstructionTests.cpp
 *  SNRScripter
 *
 *  Instruction and command encoding, scenario images and info tables.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Formats/Scenario.hpp"
#include "tests/Builders.hpp"

#include <gtest/gtest.h>

using namespace TestData;

namespace {
Instruction reencoded(const Instruction &ins) {
	ByteWriter w;
	ins.write(w);
	auto bytes = w.take();
	ByteReader r(bytes);
	auto out = Instruction::read(r);
	EXPECT_TRUE(r.eof()) << ins.toString();
	return out;
}

Expression expr(std::initializer_list<ExpressionTerm> terms) {
	Expression e;
	e.terms = terms;
	return e;
}

ExpressionTerm push(int32_t value) {
	ExpressionTerm t;
	t.value = n(value);
	return t;
}

ExpressionTerm op(ExpressionOp o) {
	ExpressionTerm t;
	t.op = o;
	return t;
}
} // namespace

TEST(Instruction, EveryOpcodeSurvivesEncoding) {
	JumpCond less{JumpCondType::Less, true};
	std::vector<Instruction> all{
	    Ins::uo(UnaryOperationType::Negate, v(1)),
	    Ins::uo(UnaryOperationType::Abs, v(1), r(v(2))),
	    Ins::bo(BinaryOperationType::Add, v(0), {}, n(3)),
	    Ins::bo(BinaryOperationType::Multiply, v(1), r(v(0)), n(7)),
	    Ins::exp(v(4), expr({push(2), push(3), op(ExpressionOp::Add)})),
	    Ins::gt(v(5), r(v(0)), {n(10), n(-2000), r(v(7))}),
	    Ins::jc(less, r(v(0)), n(100), 0x1234),
	    Ins::j(0x80),
	    Ins::gosub(0x90),
	    Ins::retsub(),
	    Ins::jt(r(v(1)), {0x100, 0x200}),
	    Ins::rnd(v(9), n(0), n(99)),
	    Ins::push({n(1), r(v(2))}),
	    Ins::pop({v(3), v(4)}),
	    Ins::call(0x300, {n(5), r(a(0))}),
	    Ins::ret(),
	};
	for (auto &ins : all) EXPECT_EQ(reencoded(ins), ins) << ins.toString();
}

TEST(Instruction, ElidedOperandsReadAsDestination) {
	auto ins = reencoded(Ins::bo(BinaryOperationType::Subtract, v(6), {}, n(1)));
	EXPECT_TRUE(ins.elided);
	EXPECT_EQ(ins.left, r(v(6)));
	EXPECT_EQ(ins.toString(), "bo sub $v6, $v6, 1");
}

TEST(Instruction, GetTableEntriesArePaddedToFourBytes) {
	ByteWriter w;
	Ins::gt(v(0), n(0), {n(1), n(1000)}).write(w);
	// opcode, dest, index, count, two padded entries
	EXPECT_EQ(w.position(), 1u + 2 + 1 + 2 + 4 + 4);
}

TEST(Instruction, CommandsCarryTheirArguments) {
	auto select = makeCommand(Cmd::SELECT, {Arg::u16(1), Arg::u16(2), Arg::dest(v(8)), Arg::number(0),
	                                        Arg::string("Where to?"), Arg::strings({"Left", "Right"})});
	auto ins    = reencoded(Ins::command(select));
	EXPECT_TRUE(ins.isCommand());
	EXPECT_EQ(ins.command, select);
	EXPECT_EQ(ins.toString(), "SELECT 1, 2, -> $v8, 0, \"Where to?\", [\"Left\", \"Right\"]");

	auto wipe = makeCommand(Cmd::WIPE, {Arg::number(1), Arg::number(r(v(2))), Arg::number(0), Arg::mask({n(5), n(0), n(7)})});
	auto back = reencoded(Ins::command(wipe));
	ASSERT_EQ(back.command.args[3].numbers.size(), 8u);
	EXPECT_EQ(back.command.args[3].numbers[2], n(7));
	EXPECT_EQ(back.command, wipe);
}

TEST(Instruction, MessageTextUsesTheFixup) {
	auto msg  = makeCommand(Cmd::MSGSET, {Arg::messageId(0x123456), Arg::flag(true), Arg::string("あい？", true)});
	auto back = reencoded(Ins::command(msg));
	EXPECT_EQ(back.command.args[2].text, "あい？");
	EXPECT_EQ(back.command.args[0].raw, 0x123456u);

	ByteWriter w;
	msg.write(w);
	// opcode, 24-bit id, flag, u16 length, three half-width characters and the terminator
	EXPECT_EQ(w.position(), 1u + 3 + 1 + 2 + 3 + 1);
}

TEST(Instruction, MakeCommandChecksTheSignature) {
	EXPECT_THROW(makeCommand(Cmd::WAIT, {Arg::number(1)}), std::invalid_argument);
	EXPECT_THROW(makeCommand(Cmd::WAIT, {Arg::number(1), Arg::number(1)}), std::invalid_argument);
	EXPECT_THROW(makeCommand(0x42, {}), std::invalid_argument);
	EXPECT_NO_THROW(makeCommand(Cmd::WAIT, {Arg::flag(false), Arg::number(1)}));
}

TEST(Instruction, UnknownOpcodesThrow) {
	std::vector<uint8_t> bytes{0x43};
	ByteReader r(bytes);
	EXPECT_THROW(Instruction::read(r), ParseError);

	std::vector<uint8_t> badCond{0x46, 0x09, 0x00, 0x00, 0, 0, 0, 0};
	ByteReader cond(badCond);
	EXPECT_THROW(Instruction::read(cond), ParseError);
}

TEST(Expression, ValidateCountsTheStack) {
	EXPECT_EQ(expr({push(1)}).validate().status, Expression::Check::Status::Ok);
	auto under = expr({push(1), op(ExpressionOp::Add)}).validate();
	EXPECT_EQ(under.status, Expression::Check::Status::StackUnderflow);
	EXPECT_EQ(under.value, 1u);
	auto extra = expr({push(1), push(2)}).validate();
	EXPECT_EQ(extra.status, Expression::Check::Status::NotSingleValue);
	EXPECT_EQ(extra.value, 2u);
	EXPECT_EQ(expr({push(1), push(2), push(3), op(ExpressionOp::Select)}).validate().status,
	          Expression::Check::Status::Ok);

	ByteWriter w;
	EXPECT_THROW(expr({op(ExpressionOp::Negate)}).write(w), ParseError);
}

TEST(Scenario, HeaderIsChecked) {
	auto image = Scenario::build({0x00, 0x00, 0x00});
	EXPECT_NO_THROW(Scenario{std::vector<uint8_t>(image)});

	auto badMagic = image;
	badMagic[0]   = 'X';
	try {
		Scenario s(std::move(badMagic));
		FAIL() << "bad magic accepted";
	} catch (const ParseError &e) {
		EXPECT_EQ(e.kind, ParseError::Kind::InvalidMagic);
	}

	auto truncated = image;
	truncated.pop_back();
	EXPECT_THROW(Scenario{std::move(truncated)}, ParseError);

	auto badOffset = image;
	storeLE32(badOffset.data() + 32, static_cast<uint32_t>(image.size()));
	EXPECT_THROW(Scenario{std::move(badOffset)}, ParseError);
}

TEST(Scenario, InfoTablesAndAssetPaths) {
	ScenarioInfo info;
	info.masks.push_back({"Wipe01"});
	info.pictures.push_back({"BG_Beach", 4});
	info.bustups.push_back({"Ber", "Akuwarai", 2});
	info.bgms.push_back({"Umib_01", "Golden Nocturnal", 0});
	info.movies.push_back({"Op", 3, 1, -1});
	info.voiceMappings.push_back({"bea", {1, 2}});
	info.tips.push_back({1, 7, "Tip", "Content"});

	Scenario s(Scenario::build({0x00, 0x00, 0x00}, info));
	auto &t = s.info();
	ASSERT_EQ(t.pictures.size(), 1u);
	EXPECT_EQ(t.pictures[0].linkedCgId, 4);
	EXPECT_EQ(t.bustups[0].emotion, "Akuwarai");
	EXPECT_EQ(t.bgms[0].displayName, "Golden Nocturnal");
	EXPECT_EQ(t.movies[0].flags, 1);
	EXPECT_EQ(t.voiceMappings[0].characters, (std::vector<uint8_t>{1, 2}));
	EXPECT_EQ(t.tips[0].content, "Content");

	EXPECT_EQ(t.maskPath(0), "/mask/wipe01.msk");
	EXPECT_EQ(t.picturePath(0), "/picture/bg_beach.pic");
	EXPECT_EQ(t.bustupPath(0), "/bustup/ber.bup");
	EXPECT_EQ(t.bgmPath(0), "/bgm/umib_01.nxa");
	EXPECT_EQ(t.moviePath(0), "/movie/op.mp4");
	EXPECT_EQ(ScenarioInfo::voicePath("BEA_1E1"), "/voice/bea_1e1.nxa");
	EXPECT_EQ(t.picturePath(1), "");
	EXPECT_EQ(t.sePath(0), "");
	EXPECT_NE(t.describe().find("Golden Nocturnal"), std::string::npos);
}

TEST(Scenario, InstructionsAreDecodedInPlace) {
	auto s = assemble([](Assembler &as) {
		as << Ins::bo(BinaryOperationType::Add, v(0), n(2), n(3));
		as.label("exit");
		as.cmd(Cmd::EXIT, {Arg::u8(0), Arg::number(0)});
	});

	CodeAddress at = s->entryPoint();
	auto first     = s->instructionAt(at);
	EXPECT_EQ(first.opcode, static_cast<uint8_t>(Opcode::Bo));
	auto second = s->instructionAt(at);
	EXPECT_TRUE(second.isCommand());
	EXPECT_EQ(second.command.opcode, Cmd::EXIT);
	EXPECT_EQ(at, s->data()->size());
}
