/**
 *  Bustup.cpp
 *  SNRScripter
 *
 *  BUP4 character portraits: base blocks plus named expressions.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Formats/Bustup.hpp"
#include "Engine/Formats/Text.hpp"

#include <algorithm>
#include <set>
#include <string>

namespace {
const uint32_t BUP_MAGIC = 0x34505542; // "BUP4"

BustupBlockPromise readPromise(ByteReader &r, size_t fileSize) {
	BustupBlockPromise promise;
	promise.offset = r.u32();
	promise.size   = r.u32();
	if (!promise.null() && (promise.offset > fileSize || promise.size > fileSize - promise.offset))
		throw ParseError(ParseError::Kind::TruncatedStream, "bustup block outside of the file");
	return promise;
}
} // namespace

std::vector<BustupBlockPromise> BustupSkeleton::uniqueBlocks() const {
	std::map<uint32_t, BustupBlockPromise> unique;
	auto visit = [&unique](const BustupBlockPromise &p) {
		if (p.null())
			return;
		auto it = unique.find(p.offset);
		if (it == unique.end())
			unique.emplace(p.offset, p);
		else if (it->second.size != p.size)
			throw ParseError(ParseError::Kind::BadLength, "bustup block size mismatch between references");
	};

	for (auto &b : baseBlocks) visit(b);
	for (auto &e : expressions) {
		visit(e.second.face1);
		visit(e.second.face2);
		for (auto &m : e.second.mouths) visit(m);
		for (auto &eye : e.second.eyes) visit(eye);
	}

	std::vector<BustupBlockPromise> result;
	result.reserve(unique.size());
	for (auto &u : unique) result.push_back(u.second);
	return result;
}

BustupSkeleton readBustupSkeleton(const uint8_t *data, size_t len) {
	ByteReader r(data, len);
	if (r.u32() != BUP_MAGIC)
		throw ParseError(ParseError::Kind::InvalidMagic, "not a BUP4 file");
	uint32_t version = r.u32();
	if (version != 1)
		throw ParseError(ParseError::Kind::Unsupported, "bustup version " + std::to_string(version));
	if (r.u32() != len)
		throw ParseError(ParseError::Kind::BadLength, "bustup file size mismatch");

	BustupSkeleton skeleton;
	skeleton.originX         = r.i16();
	skeleton.originY         = r.i16();
	skeleton.effectiveWidth  = r.u16();
	skeleton.effectiveHeight = r.u16();
	skeleton.bustupId        = r.u32();
	uint32_t baseCount       = r.u32();
	uint32_t expressionCount = r.u32();

	for (uint32_t i = 0; i < baseCount; i++) {
		auto promise = readPromise(r, len);
		if (promise.null())
			throw ParseError(ParseError::Kind::BadLength, "null base block in bustup");
		skeleton.baseBlocks.push_back(promise);
	}

	std::set<std::string> names;
	for (uint32_t i = 0; i < expressionCount; i++) {
		std::string name = readU16String(r);
		if (!names.insert(name).second)
			throw ParseError(ParseError::Kind::BadLength, "duplicate bustup expression " + name);

		BustupExpressionSkeleton expr;
		expr.face1        = readPromise(r, len);
		expr.face2        = readPromise(r, len);
		uint16_t mouths   = r.u16();
		for (uint16_t m = 0; m < mouths; m++) expr.mouths.push_back(readPromise(r, len));
		uint16_t eyes     = r.u16();
		for (uint16_t e = 0; e < eyes; e++) expr.eyes.push_back(readPromise(r, len));

		skeleton.expressions.emplace_back(std::move(name), std::move(expr));
	}

	return skeleton;
}

PictureBlock cleanupBustupBlock(PictureBlock &&block) {
	if (block.empty())
		return std::move(block);

	std::vector<bool> covered(static_cast<size_t>(block.width) * block.height, false);
	auto mark = [&](const PicRect &rect) {
		// The far edge is clamped to the last texel and stays exclusive
		uint32_t toX = std::min<uint32_t>(rect.toX, block.width - 1);
		uint32_t toY = std::min<uint32_t>(rect.toY, block.height - 1);
		for (uint32_t y = rect.fromY; y < toY; y++)
			for (uint32_t x = rect.fromX; x < toX; x++)
				covered[static_cast<size_t>(y) * block.width + x] = true;
	};
	for (auto &rect : block.opaqueRects) mark(rect);
	for (auto &rect : block.transparentRects) mark(rect);

	for (size_t i = 0; i < covered.size(); i++)
		if (!covered[i])
			std::fill_n(block.rgba.begin() + i * 4, 4, 0);

	return std::move(block);
}

Bustup<PictureBlock> readBustupImage(const uint8_t *data, size_t len) {
	return readBustup<PictureBlock>(data, len, [](PictureBlock &&block) {
		return cleanupBustupBlock(std::move(block));
	});
}

std::vector<uint8_t> composeBustupBase(const Bustup<PictureBlock> &bustup) {
	std::vector<uint8_t> canvas(static_cast<size_t>(bustup.info.effectiveWidth) * bustup.info.effectiveHeight * 4, 0);
	for (auto &block : bustup.baseBlocks)
		blitPictureBlock(*block, 0, 0, canvas, bustup.info.effectiveWidth, bustup.info.effectiveHeight, true);
	return canvas;
}

std::vector<uint8_t> composeBustupExpression(const Bustup<PictureBlock> &bustup, const std::string &expression,
                                             size_t mouth, size_t eye) {
	std::vector<uint8_t> canvas = composeBustupBase(bustup);
	auto *expr                  = bustup.expression(expression);
	if (!expr)
		return canvas;

	auto overlay = [&](const std::shared_ptr<const PictureBlock> &block) {
		if (block)
			blitPictureBlock(*block, 0, 0, canvas, bustup.info.effectiveWidth, bustup.info.effectiveHeight, true);
	};
	overlay(expr->face1);
	overlay(expr->face2);
	if (mouth < expr->mouths.size())
		overlay(expr->mouths[mouth]);
	if (eye < expr->eyes.size())
		overlay(expr->eyes[eye]);
	return canvas;
}
