/**
 *  Movie.cpp
 *  SNRScripter
 *
 *  H.264/AAC movie decoding into NV12 frames and the player that paces them.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Media/Movie.hpp"
#include "Engine/Media/AudioDecoder.hpp"
#include "Engine/Components/Async.hpp"
#include "Support/Errors.hpp"
#include "Support/FileDefs.hpp"

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
#include <libavutil/mem.h>
#include <libswscale/swscale.h>
}

#include <SDL2/SDL_timer.h>

#include <algorithm>
#include <cstring>

bool FrameTimingQueue::push(double timestamp) {
	if (full())
		return false;
	window.insert(std::upper_bound(window.begin(), window.end(), timestamp), timestamp);
	return true;
}

bool FrameTimingQueue::pop(FrameTiming &timing) {
	if (window.empty() || !(full() || flushing))
		return false;
	timing.startTime = window[0];
	timing.duration  = window.size() > 1 ? window[1] - window[0] : fallbackDuration;
	window.pop_front();
	return true;
}

/* ---------------- VideoDecoder ----------------- */

int VideoDecoder::readPacket(void *opaque, uint8_t *buf, int size) {
	auto input  = static_cast<MemoryInput *>(opaque);
	size_t left = input->data->size() - input->position;
	if (left == 0)
		return AVERROR_EOF;
	size_t count = std::min(left, static_cast<size_t>(size));
	std::memcpy(buf, input->data->data() + input->position, count);
	input->position += count;
	return static_cast<int>(count);
}

int64_t VideoDecoder::seek(void *opaque, int64_t offset, int whence) {
	auto input  = static_cast<MemoryInput *>(opaque);
	int64_t end = static_cast<int64_t>(input->data->size());
	int64_t target;
	switch (whence & ~AVSEEK_FORCE) {
		case AVSEEK_SIZE:
			return end;
		case SEEK_SET:
			target = offset;
			break;
		case SEEK_CUR:
			target = static_cast<int64_t>(input->position) + offset;
			break;
		case SEEK_END:
			target = end + offset;
			break;
		default:
			return -1;
	}
	if (target < 0 || target > end)
		return -1;
	input->position = static_cast<size_t>(target);
	return target;
}

VideoDecoder::VideoDecoder(std::shared_ptr<const std::vector<uint8_t>> data, std::string name)
    : label(std::move(name)) {
	input.data = std::move(data);

	const int bufferSize = 32768;
	auto buffer          = static_cast<uint8_t *>(av_malloc(bufferSize));
	ioContext            = avio_alloc_context(buffer, bufferSize, 0, &input, readPacket, nullptr, seek);
	if (!ioContext) {
		av_free(buffer);
		throw AssetError(AssetError::Kind::DecodeFailed, label, "cannot allocate an IO context");
	}

	formatContext     = avformat_alloc_context();
	formatContext->pb = ioContext;
	if (avformat_open_input(&formatContext, nullptr, nullptr, nullptr) < 0) {
		// formatContext is freed on failure
		release();
		throw AssetError(AssetError::Kind::DecodeFailed, label, "unrecognised container");
	}
	if (avformat_find_stream_info(formatContext, nullptr) < 0) {
		release();
		throw AssetError(AssetError::Kind::DecodeFailed, label, "no stream info");
	}

	videoStream = av_find_best_stream(formatContext, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
	if (videoStream < 0) {
		release();
		throw AssetError(AssetError::Kind::DecodeFailed, label, "no video stream");
	}
	videoContext = openDecoder(videoStream);
	if (!videoContext) {
		release();
		throw AssetError(AssetError::Kind::DecodeFailed, label, "cannot open the video decoder");
	}
	videoTimeBase = av_q2d(formatContext->streams[videoStream]->time_base);

	AVRational rate = formatContext->streams[videoStream]->avg_frame_rate;
	if (rate.num > 0 && rate.den > 0)
		timings = FrameTimingQueue(av_q2d(av_inv_q(rate)));

	audioStream = av_find_best_stream(formatContext, AVMEDIA_TYPE_AUDIO, -1, videoStream, nullptr, 0);
	if (audioStream >= 0) {
		audioContext = openDecoder(audioStream);
		if (audioContext) {
			audioChannels = audioContext->ch_layout.nb_channels;
		} else {
			sendToLog(LogLevel::Warn, "Movie %s has an audio stream that cannot be decoded, playing it silently\n", label.c_str());
			audioStream = -1;
		}
	}

	packet = av_packet_alloc();
	frame  = av_frame_alloc();
}

VideoDecoder::~VideoDecoder() {
	release();
}

void VideoDecoder::release() {
	if (frame)
		av_frame_free(&frame);
	if (packet)
		av_packet_free(&packet);
	if (convertContext) {
		sws_freeContext(convertContext);
		convertContext = nullptr;
	}
	if (audioContext)
		avcodec_free_context(&audioContext);
	if (videoContext)
		avcodec_free_context(&videoContext);
	if (formatContext)
		avformat_close_input(&formatContext);
	if (ioContext) {
		av_freep(&ioContext->buffer);
		avio_context_free(&ioContext);
	}
}

AVCodecContext *VideoDecoder::openDecoder(int stream) {
	AVCodecParameters *params = formatContext->streams[stream]->codecpar;
	const AVCodec *codec      = avcodec_find_decoder(params->codec_id);
	if (!codec)
		return nullptr;
	AVCodecContext *context = avcodec_alloc_context3(codec);
	if (!context)
		return nullptr;
	if (avcodec_parameters_to_context(context, params) < 0 || avcodec_open2(context, codec, nullptr) < 0) {
		avcodec_free_context(&context);
		return nullptr;
	}
	return context;
}

void VideoDecoder::frameSize(int &width, int &height) const {
	width  = videoContext->width;
	height = videoContext->height;
}

uint32_t VideoDecoder::audioSampleRate() const {
	return audioContext ? static_cast<uint32_t>(audioContext->sample_rate) : 0;
}

bool VideoDecoder::convertFrame(Nv12Frame &out) {
	int w = frame->width, h = frame->height;
	convertContext = sws_getCachedContext(convertContext, w, h, static_cast<AVPixelFormat>(frame->format),
	                                      w, h, AV_PIX_FMT_NV12, SWS_BILINEAR, nullptr, nullptr, nullptr);
	if (!convertContext) {
		sendToLog(LogLevel::Error, "Movie %s: cannot convert pixel format %d\n", label.c_str(), frame->format);
		return false;
	}

	int uvStride = (w + 1) / 2 * 2;
	out.width    = w;
	out.height   = h;
	out.y.resize(static_cast<size_t>(w) * h);
	out.uv.resize(static_cast<size_t>(uvStride) * ((h + 1) / 2));

	uint8_t *planes[4]{out.y.data(), out.uv.data(), nullptr, nullptr};
	int strides[4]{w, uvStride, 0, 0};
	sws_scale(convertContext, frame->data, frame->linesize, 0, h, planes, strides);
	return true;
}

void VideoDecoder::receiveAudioFrames(AudioBuffer *audio) {
	while (avcodec_receive_frame(audioContext, frame) >= 0) {
		if (audio)
			appendFrameSamples(frame, audioChannels, *audio);
		av_frame_unref(frame);
	}
}

bool VideoDecoder::readFrame(MovieFrame &out, AudioBuffer *audio) {
	while (!timings.full() && !videoFlushed) {
		int err = avcodec_receive_frame(videoContext, frame);
		if (err >= 0) {
			int64_t pts = frame->best_effort_timestamp;
			if (pts == AV_NOPTS_VALUE)
				pts = frame->pts;
			if (pts == AV_NOPTS_VALUE)
				pts = decodedFrames.empty() ? 0 : decodedFrames.rbegin()->first + 1;
			Nv12Frame image;
			if (convertFrame(image)) {
				decodedFrames[pts] = std::move(image);
				timings.push(pts * videoTimeBase);
			}
			av_frame_unref(frame);
			continue;
		}

		if (err != AVERROR(EAGAIN) || demuxFinished) {
			if (err != AVERROR_EOF && err != AVERROR(EAGAIN))
				sendToLog(LogLevel::Error, "Movie %s: video decoding failed with %d\n", label.c_str(), err);
			videoFlushed = true;
			timings.finish();
			break;
		}

		if (av_read_frame(formatContext, packet) < 0) {
			demuxFinished = true;
			avcodec_send_packet(videoContext, nullptr);
			if (audioContext) {
				avcodec_send_packet(audioContext, nullptr);
				receiveAudioFrames(audio);
			}
			continue;
		}

		if (packet->stream_index == videoStream) {
			if (avcodec_send_packet(videoContext, packet) < 0)
				sendToLog(LogLevel::Warn, "Movie %s: dropping a broken video packet\n", label.c_str());
		} else if (packet->stream_index == audioStream && audioContext) {
			if (avcodec_send_packet(audioContext, packet) >= 0)
				receiveAudioFrames(audio);
			else
				sendToLog(LogLevel::Warn, "Movie %s: dropping a broken audio packet\n", label.c_str());
		}
		av_packet_unref(packet);
	}

	FrameTiming timing;
	if (decodedFrames.empty() || !timings.pop(timing))
		return false;

	// Both are ordered by timestamp, so the smallest key belongs to the popped timing
	auto first   = decodedFrames.begin();
	out.timing   = timing;
	out.image    = std::move(first->second);
	decodedFrames.erase(first);
	return true;
}

/* ---------------- MovieAudioSource ----------------- */

bool MovieAudioSource::readFrame(AudioBuffer &destination) {
	AudioBuffer buffer;
	if (queue->buffers.pop(buffer)) {
		destination.insert(destination.end(), buffer.begin(), buffer.end());
		position += static_cast<uint32_t>(buffer.size());
		return true;
	}
	if (queue->finished.load() && queue->buffers.empty())
		return false;

	// The decoder is behind, keep the clock running on silence
	const uint32_t gap = 480;
	destination.resize(destination.size() + gap);
	position += gap;
	return true;
}

/* ---------------- VideoPlayer ----------------- */

bool VideoPlayer::Shared::pump() {
	std::lock_guard<std::mutex> guard(decoderMutex);
	if (decoderFinished)
		return false;

	bool withAudio = audio && audioWanted.load();
	while (frames.size() < frames.capacity()) {
		MovieFrame next;
		AudioBuffer sound;
		if (!decoder->readFrame(next, withAudio ? &sound : nullptr)) {
			decoderFinished = true;
			if (audio)
				audio->finished = true;
			return false;
		}
		if (!sound.empty() && !audio->buffers.push(std::move(sound)))
			sendToLog(LogLevel::Warn, "Movie %s: the mixer fell behind, dropping audio\n", decoder->name().c_str());
		frames.push(std::move(next));
	}
	return true;
}

VideoPlayer::VideoPlayer(std::unique_ptr<VideoDecoder> decoder)
    : shared(std::make_shared<Shared>()) {
	decoder->frameSize(width, height);
	if (decoder->hasAudio()) {
		shared->audio             = std::make_shared<MovieAudioSource::Queue>();
		shared->audio->sampleRate = decoder->audioSampleRate();
	}
	shared->decoder = std::move(decoder);
	startDecoding();
}

VideoPlayer::~VideoPlayer() {
	shared->shouldFinish = true;
	// The mixer drains what is queued and lets the sound go
	if (shared->audio)
		shared->audio->finished = true;
}

void VideoPlayer::startDecoding() {
	// Without worker threads update() decodes on the caller
	if (!async.initialised())
		return;

	auto state = shared;
	async.queue(std::make_unique<FunctionInstruction>(&async, AsyncPool::IO, [state]() {
		while (!state->shouldFinish && !async.threadShutdownRequested) {
			if (!state->pump())
				break;
			SDL_Delay(3);
		}
	}));
}

std::unique_ptr<AudioFrameSource> VideoPlayer::audioSource() {
	if (!shared->audio)
		return nullptr;
	shared->audioWanted = true;
	return std::make_unique<MovieAudioSource>(shared->audio);
}

double VideoPlayer::time() const {
	return audioClock ? audioClock() : timer;
}

void VideoPlayer::update(Ticks dt) {
	if (!async.initialised() && !shared->decoderFinished)
		shared->pump();

	timer += dt.seconds();
	double now = time();

	MovieFrame *next;
	while ((next = shared->frames.front()) && next->timing.startTime <= now) {
		shared->frames.pop(current);
		hasCurrent = true;
		serial++;
	}
}

bool VideoPlayer::finished() const {
	if (!shared->decoderFinished || !shared->frames.empty())
		return false;
	return !hasCurrent || time() >= current.timing.startTime + current.timing.duration;
}

std::array<Vec4, 3> movieColorTransform() {
	// BT.709, luma in [16, 235] and chroma centred on 128
	return {{Vec4(1.1644f, 0.0f, 1.7927f, -0.9694f),
	         Vec4(1.1644f, -0.2132f, -0.5329f, 0.3000f),
	         Vec4(1.1644f, 2.1124f, 0.0f, -1.1293f)}};
}
