/**
 *  Async.cpp
 *  SNRScripter
 *
 *  Asynchronous execution management: the IO and compute worker pools.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Components/Async.hpp"
#include "Support/FileDefs.hpp"

#include <SDL2/SDL_cpuinfo.h>

#include <algorithm>

AsyncController async;

namespace {
struct QueueThreadArg {
	AsyncController *ac;
	AsyncInstructionQueue *queue;
};
} // namespace

int AsyncController::ownInit() {
	// Leave a core to the game thread
	computeQueue.threadCount = static_cast<size_t>(std::max(1, SDL_GetCPUCount() - 1));

	for (AsyncInstructionQueue *qPtr : queueCollection)
		qPtr->init(this);

	return 0;
}

int AsyncController::ownDeinit() {
	endThreads();
	return 0;
}

AsyncController::AsyncController()
    : BaseController(this),
      ioQueue("ioQueue", 2),
      computeQueue("computeQueue", 1) {
	queueCollection.push_back(&ioQueue);
	queueCollection.push_back(&computeQueue);
}

void AsyncController::endThreads() {
	threadShutdownRequested = true;

	for (AsyncInstructionQueue *qPtr : queueCollection) {
		sendToLog(LogLevel::Info, "[Info] AsyncController is going to stop %s threads\n", qPtr->name);
		qPtr->stop();
	}

	threadShutdownRequested = false;
}

void AsyncController::queue(std::unique_ptr<AsyncInstruction> inst) {
	if (!initialised()) {
		inst->execute();
		return;
	}

	AsyncInstructionQueue *instQueue = inst->getInstructionQueue();
	SDL_AtomicLock(&instQueue->lock);
	instQueue->q.push_back(std::move(inst));
	SDL_AtomicUnlock(&instQueue->lock);
	SDL_SemPost(instQueue->instructionsWaiting);
}

int AsyncController::asyncLoop(AsyncInstructionQueue &queue) {
	while (true) {
		SDL_SemWait(queue.instructionsWaiting);

		if (threadShutdownRequested)
			break;

		SDL_AtomicLock(&queue.lock);
		if (queue.q.empty()) {
			SDL_AtomicUnlock(&queue.lock);
			continue;
		}
		std::unique_ptr<AsyncInstruction> inst = std::move(queue.q.front());
		queue.q.pop_front();
		SDL_AtomicUnlock(&queue.lock);

		inst->execute();
	}
	return 0;
}

int asyncThreadLoop(void *arg) {
	std::unique_ptr<QueueThreadArg> data(static_cast<QueueThreadArg *>(arg));
	return data->ac->asyncLoop(*data->queue);
}

/* ---------------- Async Instruction Queue  ----------------- */

void AsyncInstructionQueue::init(AsyncController *ac) {
	instructionsWaiting = SDL_CreateSemaphore(0);
	if (!instructionsWaiting)
		ctrl.quit(1, "Failed to create a semaphore for %s: %s", name, SDL_GetError());

	for (size_t i = 0; i < threadCount; i++) {
		auto arg            = new QueueThreadArg{ac, this};
		SDL_Thread *created = SDL_CreateThread(asyncThreadLoop, name, arg);
		if (!created) {
			delete arg;
			ctrl.quit(1, "Failed to create %s thread: %s", name, SDL_GetError());
		}
		threads.push_back(created);
	}
}

void AsyncInstructionQueue::stop() {
	if (!instructionsWaiting)
		return;

	// Every thread wakes up once, sees the shutdown flag and leaves
	for (size_t i = 0; i < threads.size(); i++)
		SDL_SemPost(instructionsWaiting);
	for (auto thread : threads)
		SDL_WaitThread(thread, nullptr);
	threads.clear();

	SDL_AtomicLock(&lock);
	if (!q.empty())
		sendToLog(LogLevel::Warn, "[Warn] %s dropped %zu pending instructions\n", name, q.size());
	q.clear();
	SDL_AtomicUnlock(&lock);

	SDL_DestroySemaphore(instructionsWaiting);
	instructionsWaiting = nullptr;
}

AsyncInstructionQueue *FunctionInstruction::getInstructionQueue() {
	return pool == AsyncPool::IO ? &ac->ioQueue : &ac->computeQueue;
}
