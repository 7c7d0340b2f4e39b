/**
 *  Cache.hpp
 *  SNRScripter
 *
 *  Typed weak cache with one-shot loader tokens.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Support/FileDefs.hpp"

#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Values are only kept alive by their users, an expired entry is loaded again on the next lookup.
// At most one caller at a time owns the right to load a key.
template <typename V, typename KEY = std::string>
class AssetCache {
	struct Slot {
		std::mutex mutex;
		std::condition_variable cv;
		bool finished{false};
		std::shared_ptr<V> value;
	};

	struct Entry {
		std::weak_ptr<V> loaded;
		std::shared_ptr<Slot> loading;
	};

	std::mutex mutex;
	std::unordered_map<KEY, Entry> entries;

	void complete(const KEY &key, const std::shared_ptr<Slot> &slot, std::shared_ptr<V> value) {
		{
			std::lock_guard<std::mutex> guard(mutex);
			auto it = entries.find(key);
			if (it != entries.end() && it->second.loading == slot) {
				it->second.loading = nullptr;
				if (value)
					it->second.loaded = value;
				else if (it->second.loaded.expired())
					entries.erase(it);
			}
		}
		std::lock_guard<std::mutex> guard(slot->mutex);
		slot->finished = true;
		slot->value    = std::move(value);
		slot->cv.notify_all();
	}

public:
	// Someone else is loading the key
	class Loading {
		std::shared_ptr<Slot> slot;

	public:
		Loading() = default;
		explicit Loading(std::shared_ptr<Slot> s)
		    : slot(std::move(s)) {}

		bool ready() const {
			std::lock_guard<std::mutex> guard(slot->mutex);
			return slot->finished;
		}
		// Returns nullptr when the loader gave up, look the key up again in that case
		std::shared_ptr<V> wait() const {
			std::unique_lock<std::mutex> guard(slot->mutex);
			slot->cv.wait(guard, [this] { return slot->finished; });
			return slot->value;
		}
	};

	// The right and the obligation to load a key
	class LoaderToken {
		AssetCache *cache{nullptr};
		KEY key{};
		std::shared_ptr<Slot> slot;

	public:
		LoaderToken() = default;
		LoaderToken(AssetCache *c, KEY k, std::shared_ptr<Slot> s)
		    : cache(c), key(std::move(k)), slot(std::move(s)) {}
		LoaderToken(const LoaderToken &) = delete;
		LoaderToken &operator=(const LoaderToken &) = delete;
		LoaderToken(LoaderToken &&o) noexcept
		    : cache(o.cache), key(std::move(o.key)), slot(std::move(o.slot)) {
			o.cache = nullptr;
		}
		LoaderToken &operator=(LoaderToken &&o) noexcept {
			if (this != &o) {
				if (armed())
					leaked();
				cache   = o.cache;
				key     = std::move(o.key);
				slot    = std::move(o.slot);
				o.cache = nullptr;
			}
			return *this;
		}
		~LoaderToken() {
			if (armed())
				leaked();
		}

		bool armed() const {
			return cache != nullptr;
		}

		void finish(std::shared_ptr<V> value) {
			if (!armed())
				throw std::logic_error("Finishing a loader token twice");
			if (!value)
				throw std::logic_error("Finishing a loader token without a value");
			AssetCache *c = cache;
			cache         = nullptr;
			c->complete(key, slot, std::move(value));
		}

		// Opens the key for the next caller
		void cancel() {
			if (!armed())
				return;
			AssetCache *c = cache;
			cache         = nullptr;
			c->complete(key, slot, nullptr);
		}

	private:
		[[noreturn]] static void leaked() {
			sendToLog(LogLevel::Error, "[Error] AssetCache loader token dropped without finish or cancel\n");
			std::terminate();
		}
	};

	enum class State {
		Loaded,
		Loading,
		LoadRequired
	};

	struct Lookup {
		State state;
		std::shared_ptr<V> value;
		Loading loading;
		LoaderToken token;
	};

	AssetCache() = default;
	AssetCache(const AssetCache &) = delete;
	AssetCache &operator=(const AssetCache &) = delete;

	Lookup lookup(const KEY &key) {
		std::lock_guard<std::mutex> guard(mutex);
		Entry &entry = entries[key];

		Lookup result;
		result.value = entry.loaded.lock();
		if (result.value) {
			result.state = State::Loaded;
		} else if (entry.loading) {
			result.state   = State::Loading;
			result.loading = Loading(entry.loading);
		} else {
			entry.loading = std::make_shared<Slot>();
			result.state  = State::LoadRequired;
			result.token  = LoaderToken(this, key, entry.loading);
		}
		return result;
	}

	// Loaded and still referenced
	std::shared_ptr<V> peek(const KEY &key) {
		std::lock_guard<std::mutex> guard(mutex);
		auto it = entries.find(key);
		if (it == entries.end())
			return nullptr;
		return it->second.loaded.lock();
	}

	// Drops bookkeeping of values nobody references any more
	size_t purge() {
		std::lock_guard<std::mutex> guard(mutex);
		size_t removed = 0;
		for (auto it = entries.begin(); it != entries.end();) {
			if (!it->second.loading && it->second.loaded.expired()) {
				it = entries.erase(it);
				removed++;
			} else {
				++it;
			}
		}
		return removed;
	}

	size_t size() {
		std::lock_guard<std::mutex> guard(mutex);
		return entries.size();
	}
};
