/**
 *  Audio.cpp
 *  SNRScripter
 *
 *  NXA1 opus container and the frame/sample source contracts.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Formats/Audio.hpp"
#include "Support/ByteStream.hpp"

#include <algorithm>
#include <string>

namespace {
const uint32_t NXA_MAGIC       = 0x3141584E; // "NXA1"
const size_t NXA_HEADER_SIZE   = 0x30;
} // namespace

std::shared_ptr<const AudioFile> readAudio(const uint8_t *data, size_t len) {
	ByteReader r(data, len);
	if (r.u32() != NXA_MAGIC)
		throw ParseError(ParseError::Kind::InvalidMagic, "not a NXA1 file");
	uint32_t version = r.u32();
	if (version != 2)
		throw ParseError(ParseError::Kind::Unsupported, "audio version " + std::to_string(version));
	if (r.u32() != len)
		throw ParseError(ParseError::Kind::BadLength, "audio file size mismatch");

	auto file                = std::make_shared<AudioFile>();
	AudioInfo &info          = file->info;
	info.sampleRate          = r.u32();
	info.channelCount        = r.u16();
	info.frameSize           = r.u16();
	info.frameSamples        = r.u16();
	info.preSkip             = r.u16();
	info.sampleCount         = r.u32();
	info.loopStart           = r.u32();
	info.loopEnd             = r.u32();

	if (info.channelCount != 1 && info.channelCount != 2)
		throw ParseError(ParseError::Kind::Unsupported, "audio with " + std::to_string(info.channelCount) + " channels");
	if (info.frameSize == 0 || info.frameSamples == 0)
		throw ParseError(ParseError::Kind::BadLength, "audio frame size is zero");
	if (info.loopEnd != info.sampleCount)
		throw ParseError(ParseError::Kind::Unsupported, "audio loop end is not at the end of the stream");

	r.seek(NXA_HEADER_SIZE);
	file->frames.assign(r.current(), r.current() + r.remaining());
	if (file->frames.size() % info.frameSize)
		throw ParseError(ParseError::Kind::BadLength, "audio data is not a whole number of frames");

	return file;
}

const uint8_t *AudioFrameReader::nextFrame(size_t &size) {
	if (!hasNextFrame())
		return nullptr;
	size          = file->info.frameSize;
	auto frame    = file->frames.data() + bytePosition;
	bytePosition += size;
	return frame;
}

AudioSource::AudioSource(std::unique_ptr<AudioFrameSource> src)
    : source(std::move(src)) {
	buffer.reserve(source->maxFrameSize());
	skipLeft = source->preSkip();
}

uint32_t AudioSource::skipBuffered(uint32_t count) {
	uint32_t remaining = static_cast<uint32_t>(buffer.size()) - position;
	if (remaining >= count) {
		position += count;
		return 0;
	}
	position = static_cast<uint32_t>(buffer.size());
	return count - remaining;
}

void AudioSource::samplesSeek(uint32_t samplePosition) {
	buffer.clear();
	position = 0;

	uint32_t raw     = samplePosition + source->preSkip();
	uint32_t preRoll = std::min(source->preRoll(), raw);

	// Land before the target and decode the pre-roll away
	skipLeft = source->samplesSeek(raw - preRoll) + preRoll;
}

bool AudioSource::readSample(StereoSample &sample) {
	while (true) {
		if (skipLeft > 0)
			skipLeft = skipBuffered(skipLeft);

		if (position < buffer.size()) {
			sample = buffer[position++];
			return true;
		}

		buffer.clear();
		position = 0;
		if (!source->readFrame(buffer))
			return false;
	}
}

uint32_t AudioSource::currentSamplePosition() const {
	return source->currentSamplePosition() + skipLeft - (static_cast<uint32_t>(buffer.size()) - position) - source->preSkip();
}
