/**
 *  Bustup.hpp
 *  SNRScripter
 *
 *  BUP4 character portraits: base blocks plus named expressions.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Engine/Formats/Picture.hpp"

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <map>
#include <cstdint>

// Reference to a block that is decoded in the second phase.
// A null promise (offset 0) marks an absent face slot or an empty mouth/eye frame.
struct BustupBlockPromise {
	uint32_t offset{0};
	uint32_t size{0};

	bool null() const {
		return offset == 0;
	}
};

struct BustupExpressionSkeleton {
	BustupBlockPromise face1;
	BustupBlockPromise face2;
	std::vector<BustupBlockPromise> mouths;
	std::vector<BustupBlockPromise> eyes;
};

struct BustupSkeleton {
	int32_t originX{0};
	int32_t originY{0};
	uint32_t effectiveWidth{0};
	uint32_t effectiveHeight{0};
	uint32_t bustupId{0};
	std::vector<BustupBlockPromise> baseBlocks;
	// In file order
	std::vector<std::pair<std::string, BustupExpressionSkeleton>> expressions;

	// Every distinct non-null block offset, ascending
	std::vector<BustupBlockPromise> uniqueBlocks() const;
};

BustupSkeleton readBustupSkeleton(const uint8_t *data, size_t len);

template <typename T>
struct BustupExpression {
	std::shared_ptr<const T> face1;
	std::shared_ptr<const T> face2;
	// A null entry is an empty frame
	std::vector<std::shared_ptr<const T>> mouths;
	std::vector<std::shared_ptr<const T>> eyes;
};

template <typename T>
struct Bustup {
	PictureInfo info;
	uint32_t bustupId{0};
	std::vector<std::shared_ptr<const T>> baseBlocks;
	std::vector<std::pair<std::string, BustupExpression<T>>> expressions;

	const BustupExpression<T> *expression(const std::string &name) const {
		for (auto &e : expressions)
			if (e.first == name)
				return &e.second;
		return nullptr;
	}
};

// Decodes the skeleton, calls makeBlock exactly once per unique block offset and resolves the promises.
template <typename T>
Bustup<T> readBustup(const uint8_t *data, size_t len, const std::function<T(PictureBlock &&)> &makeBlock) {
	BustupSkeleton skeleton = readBustupSkeleton(data, len);

	std::map<uint32_t, std::shared_ptr<const T>> decoded;
	for (auto &promise : skeleton.uniqueBlocks())
		decoded[promise.offset] = std::make_shared<const T>(makeBlock(readPictureBlock(data + promise.offset, promise.size)));

	auto resolve = [&decoded](const BustupBlockPromise &promise) -> std::shared_ptr<const T> {
		if (promise.null())
			return nullptr;
		return decoded.at(promise.offset);
	};

	Bustup<T> result;
	result.info.originX         = skeleton.originX;
	result.info.originY         = skeleton.originY;
	result.info.effectiveWidth  = skeleton.effectiveWidth;
	result.info.effectiveHeight = skeleton.effectiveHeight;
	result.info.pictureId       = skeleton.bustupId;
	result.bustupId             = skeleton.bustupId;

	for (auto &b : skeleton.baseBlocks)
		result.baseBlocks.push_back(resolve(b));

	for (auto &e : skeleton.expressions) {
		BustupExpression<T> expr;
		expr.face1 = resolve(e.second.face1);
		expr.face2 = resolve(e.second.face2);
		for (auto &m : e.second.mouths)
			expr.mouths.push_back(resolve(m));
		for (auto &eye : e.second.eyes)
			expr.eyes.push_back(resolve(eye));
		result.expressions.emplace_back(e.first, std::move(expr));
	}

	return result;
}

// Clears every texel that is not covered by an opaque or transparent rectangle
PictureBlock cleanupBustupBlock(PictureBlock &&block);

// CPU-side bustup with unused block areas cleared
Bustup<PictureBlock> readBustupImage(const uint8_t *data, size_t len);

// Base blocks composited into an RGBA canvas of the effective size
std::vector<uint8_t> composeBustupBase(const Bustup<PictureBlock> &bustup);

// Base plus the faces of an expression and one mouth and eye frame; unknown names give the base alone
std::vector<uint8_t> composeBustupExpression(const Bustup<PictureBlock> &bustup, const std::string &expression,
                                             size_t mouth = 0, size_t eye = 0);
