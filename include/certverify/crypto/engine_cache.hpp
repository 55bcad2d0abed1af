#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <casket/utils/noncopyable.hpp>

namespace certverify::crypto
{

namespace detail
{

inline uint64_t NextEngineCacheId() noexcept
{
    static std::atomic<uint64_t> counter{0};
    return ++counter;
}

} // namespace detail

/// @brief Per-thread cache of cryptographic objects keyed by algorithm name.
///
/// OpenSSL contexts must not be used by two threads at once and are costly to set up, so each
/// thread owns exactly one instance per algorithm. The instance is created by the factory on the
/// first request of a thread and lives until that thread exits or the cache is destroyed, whichever
/// comes first. The cache itself may be shared freely between threads: lookups only ever touch the
/// calling thread's slots.
///
/// The cache must outlive every call to current() made through it.
///
/// @tparam T Cached object type.
template <typename T>
class EngineCache final : public casket::NonCopyable
{
public:
    using Factory = std::function<std::unique_ptr<T>(const std::string& algorithm)>;

    explicit EngineCache(Factory factory)
        : id_(detail::NextEngineCacheId())
        , factory_(std::move(factory))
        , registry_(std::make_shared<Registry>())
    {
    }

    /// @brief Destroys the instances created through this cache in every thread still running.
    ~EngineCache() noexcept
    {
        std::vector<std::shared_ptr<Slots>> alive;
        {
            std::lock_guard<std::mutex> lock(registry_->mutex);
            for (const auto& slots : registry_->slots)
            {
                if (auto locked = slots.lock())
                {
                    alive.push_back(std::move(locked));
                }
            }
            registry_->slots.clear();
        }

        for (auto& slots : alive)
        {
            slots->clear();
        }
    }

    /// @brief Gets the calling thread's instance for @p algorithm, creating it if needed.
    ///
    /// Exceptions thrown by the factory propagate to the caller and nothing is cached,
    /// so a later call tries again.
    T& current(std::string_view algorithm)
    {
        auto& slots = threadSlots();
        auto found = slots.find(algorithm);
        if (found != slots.end())
        {
            return *found->second;
        }

        std::string name(algorithm);
        auto instance = factory_(name);
        auto& result = *instance;
        slots.emplace(std::move(name), std::move(instance));
        return result;
    }

    /// @brief Number of instances owned by the calling thread.
    size_t size() const
    {
        const auto& entries = threadEntries();
        auto found = entries.find(id_);
        return found != entries.end() ? found->second.slots->size() : 0;
    }

private:
    using Slots = std::map<std::string, std::unique_ptr<T>, std::less<>>;

    /// Slots of the threads which used the cache. Threads own their slots, so the
    /// slots of an exited thread expire here.
    struct Registry
    {
        std::mutex mutex;
        std::vector<std::weak_ptr<Slots>> slots;
    };

    struct ThreadEntry
    {
        std::weak_ptr<Registry> owner;
        std::shared_ptr<Slots> slots;
    };

    using ThreadEntries = std::unordered_map<uint64_t, ThreadEntry>;

    static ThreadEntries& threadEntries()
    {
        thread_local ThreadEntries entries;
        return entries;
    }

    Slots& threadSlots()
    {
        auto& entries = threadEntries();
        auto found = entries.find(id_);
        if (found != entries.end())
        {
            return *found->second.slots;
        }

        // Forget the entries of destroyed caches, their instances are already gone.
        for (auto it = entries.begin(); it != entries.end();)
        {
            it = it->second.owner.expired() ? entries.erase(it) : std::next(it);
        }

        auto slots = std::make_shared<Slots>();
        {
            std::lock_guard<std::mutex> lock(registry_->mutex);
            auto& registered = registry_->slots;
            for (auto it = registered.begin(); it != registered.end();)
            {
                it = it->expired() ? registered.erase(it) : std::next(it);
            }
            registered.push_back(slots);
        }

        entries.emplace(id_, ThreadEntry{registry_, slots});
        return *slots;
    }

private:
    const uint64_t id_;
    Factory factory_;
    std::shared_ptr<Registry> registry_;
};

} // namespace certverify::crypto
