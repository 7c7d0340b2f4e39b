/**
 *  Async.hpp
 *  SNRScripter
 *
 *  Asynchronous execution management: the IO and compute worker pools.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Engine/Components/Base.hpp"

#include <SDL2/SDL_thread.h>
#include <SDL2/SDL_atomic.h>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

class AsyncInstruction;
class AsyncController;

class AsyncInstructionQueue {
public:
	std::deque<std::unique_ptr<AsyncInstruction>> q;
	SDL_SpinLock lock{0};

	SDL_sem *instructionsWaiting{nullptr};
	std::vector<SDL_Thread *> threads;
	const char *name{nullptr};
	size_t threadCount{1};

	void init(AsyncController *ac);
	void stop();
	AsyncInstructionQueue(const char *threadname, size_t count)
	    : name(threadname), threadCount(count) {}
};

// Subclasses define execute, which runs on a thread of the queue they name
class AsyncInstruction {
public:
	AsyncController *ac;
	virtual AsyncInstructionQueue *getInstructionQueue() = 0;
	AsyncInstruction(AsyncController *_ac)
	    : ac(_ac) {}
	virtual void execute()      = 0;
	virtual ~AsyncInstruction() = default;
};

enum class AsyncPool {
	// Blocking reads, video pipes
	IO,
	// Decoding, must not block on IO
	Compute
};

class FunctionInstruction : public AsyncInstruction {
public:
	AsyncPool pool;
	std::function<void()> function;
	AsyncInstructionQueue *getInstructionQueue() override;
	void execute() override {
		function();
	}
	FunctionInstruction(AsyncController *_ac, AsyncPool _pool, std::function<void()> _function)
	    : AsyncInstruction(_ac), pool(_pool), function(std::move(_function)) {}
};

// Result of a queued task, waited upon at most by the game thread
template <typename T>
class AsyncResult {
	mutable std::mutex mutex;
	mutable std::condition_variable cv;
	bool done{false};
	T value{};
	std::exception_ptr error;

public:
	void set(T &&v) {
		std::lock_guard<std::mutex> guard(mutex);
		value = std::move(v);
		done  = true;
		cv.notify_all();
	}
	void fail(std::exception_ptr e) {
		std::lock_guard<std::mutex> guard(mutex);
		error = std::move(e);
		done  = true;
		cv.notify_all();
	}

	bool ready() const {
		std::lock_guard<std::mutex> guard(mutex);
		return done;
	}
	// Rethrows the exception of a failed task
	const T &wait() const {
		std::unique_lock<std::mutex> guard(mutex);
		cv.wait(guard, [this] { return done; });
		if (error)
			std::rethrow_exception(error);
		return value;
	}
	// Like wait but does not block, nullptr while the task runs
	const T *poll() const {
		std::lock_guard<std::mutex> guard(mutex);
		if (!done)
			return nullptr;
		if (error)
			std::rethrow_exception(error);
		return &value;
	}
};

int asyncThreadLoop(void *arg);

class AsyncController : public BaseController {
protected:
	int ownInit() override;
	int ownDeinit() override;

public:
	AsyncInstructionQueue ioQueue, computeQueue;
	std::vector<AsyncInstructionQueue *> queueCollection;
	std::atomic<bool> threadShutdownRequested{false};

	void endThreads();
	int asyncLoop(AsyncInstructionQueue &queue);

	// Runs the instruction right away when the pools are not running (tools and tests)
	void queue(std::unique_ptr<AsyncInstruction> inst);

	template <typename T>
	std::shared_ptr<AsyncResult<T>> run(AsyncPool pool, std::function<T()> task) {
		auto result = std::make_shared<AsyncResult<T>>();
		queue(std::make_unique<FunctionInstruction>(this, pool, [result, task]() {
			try {
				result->set(task());
			} catch (std::exception &) {
				result->fail(std::current_exception());
			}
		}));
		return result;
	}

	AsyncController();
};

extern AsyncController async;
