/**
 *  AudioDecoder.cpp
 *  SNRScripter
 *
 *  FFmpeg backed decoding of the opus packets inside NXA files.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Media/AudioDecoder.hpp"
#include "Support/Errors.hpp"
#include "Support/FileDefs.hpp"

#include <vector>
#include <cstring>

namespace {

// OpusHead identification header, lets the decoder pick up channels and pre-skip
std::vector<uint8_t> opusHead(const AudioInfo &info) {
	std::vector<uint8_t> head{'O', 'p', 'u', 's', 'H', 'e', 'a', 'd', 1};
	head.push_back(static_cast<uint8_t>(info.channelCount));
	head.push_back(info.preSkip & 0xFF);
	head.push_back(info.preSkip >> 8);
	for (int i = 0; i < 4; i++) head.push_back((info.sampleRate >> (i * 8)) & 0xFF);
	head.push_back(0); // gain
	head.push_back(0);
	head.push_back(0); // mapping family
	return head;
}

float sampleAt(const AVFrame *frame, int channel, int index, int channels) {
	switch (frame->format) {
		case AV_SAMPLE_FMT_FLTP:
			return reinterpret_cast<const float *>(frame->extended_data[channel])[index];
		case AV_SAMPLE_FMT_FLT:
			return reinterpret_cast<const float *>(frame->extended_data[0])[index * channels + channel];
		case AV_SAMPLE_FMT_S16P:
			return reinterpret_cast<const int16_t *>(frame->extended_data[channel])[index] / 32768.0f;
		case AV_SAMPLE_FMT_S16:
			return reinterpret_cast<const int16_t *>(frame->extended_data[0])[index * channels + channel] / 32768.0f;
		default:
			return 0;
	}
}

} // namespace

bool appendFrameSamples(const AVFrame *frame, int channels, AudioBuffer &destination) {
	switch (frame->format) {
		case AV_SAMPLE_FMT_FLTP:
		case AV_SAMPLE_FMT_FLT:
		case AV_SAMPLE_FMT_S16P:
		case AV_SAMPLE_FMT_S16:
			break;
		default:
			sendToLog(LogLevel::Error, "Unsupported decoder sample format %d\n", frame->format);
			return false;
	}
	if (channels < 1)
		return false;

	for (int i = 0; i < frame->nb_samples; i++) {
		StereoSample s;
		s.left  = sampleAt(frame, 0, i, channels);
		s.right = channels > 1 ? sampleAt(frame, 1, i, channels) : s.left;
		destination.push_back(s);
	}
	return true;
}

OpusFrameDecoder::OpusFrameDecoder(std::shared_ptr<const AudioFile> file)
    : reader(std::move(file)) {
	const AVCodec *codec = avcodec_find_decoder(AV_CODEC_ID_OPUS);
	if (!codec)
		throw AssetError(AssetError::Kind::DecodeFailed, "<opus>", "FFmpeg was built without an opus decoder");

	codecContext = avcodec_alloc_context3(codec);
	if (!codecContext)
		throw AssetError(AssetError::Kind::DecodeFailed, "<opus>", "cannot allocate a codec context");

	auto head                    = opusHead(reader.info());
	codecContext->extradata      = static_cast<uint8_t *>(av_mallocz(head.size() + AV_INPUT_BUFFER_PADDING_SIZE));
	codecContext->extradata_size = static_cast<int>(head.size());
	std::memcpy(codecContext->extradata, head.data(), head.size());
	codecContext->sample_rate = static_cast<int>(reader.info().sampleRate);

	if (avcodec_open2(codecContext, codec, nullptr) < 0) {
		avcodec_free_context(&codecContext);
		throw AssetError(AssetError::Kind::DecodeFailed, "<opus>", "cannot open the opus decoder");
	}

	packet = av_packet_alloc();
	frame  = av_frame_alloc();
}

OpusFrameDecoder::~OpusFrameDecoder() {
	if (frame)
		av_frame_free(&frame);
	if (packet)
		av_packet_free(&packet);
	if (codecContext)
		avcodec_free_context(&codecContext);
}

bool OpusFrameDecoder::readFrame(AudioBuffer &destination) {
	size_t size{0};
	const uint8_t *data = reader.nextFrame(size);
	if (!data)
		return false;

	// The packet only borrows the data, the decoder does not keep it
	packet->data = const_cast<uint8_t *>(data);
	packet->size = static_cast<int>(size);
	int err      = avcodec_send_packet(codecContext, packet);
	packet->data = nullptr;
	packet->size = 0;
	if (err < 0) {
		sendToLog(LogLevel::Warn, "Dropping a broken opus packet at frame %zu\n", reader.framePosition() - 1);
		// Keep the timeline intact
		destination.resize(destination.size() + reader.info().frameSamples);
		return true;
	}

	while (avcodec_receive_frame(codecContext, frame) >= 0) {
		appendFrameSamples(frame, reader.info().channelCount, destination);
		av_frame_unref(frame);
	}
	return true;
}

uint32_t OpusFrameDecoder::samplesSeek(uint32_t samplePosition) {
	uint32_t frameSamples = reader.info().frameSamples;
	if (frameSamples == 0)
		return 0;
	size_t frameIndex = samplePosition / frameSamples;
	reader.seekToFrame(frameIndex);
	avcodec_flush_buffers(codecContext);
	return samplePosition - static_cast<uint32_t>(frameIndex * frameSamples);
}
