#pragma once

#include <kgrag/core/types.h>

#include <spdlog/spdlog.h>

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace kgrag::providers {

enum class ModelState { Unloaded, Loading, Ready, Failed };

constexpr const char* modelStateToString(ModelState s) noexcept {
    switch (s) {
        case ModelState::Unloaded:
            return "unloaded";
        case ModelState::Loading:
            return "loading";
        case ModelState::Ready:
            return "ready";
        case ModelState::Failed:
            return "failed";
    }
    return "unknown";
}

/**
 * @brief Lazily loaded, process-wide model instance.
 *
 * The first get() runs the loader; concurrent callers block on a condition
 * variable until that single load finishes and then share its outcome. A
 * failed load is remembered and returned to every later caller until reset().
 */
template <typename T> class ModelHandle {
public:
    using Loader = std::function<Result<std::shared_ptr<T>>()>;

    ModelHandle(std::string name, Loader loader)
        : name_(std::move(name)), loader_(std::move(loader)) {}

    ModelHandle(const ModelHandle&) = delete;
    ModelHandle& operator=(const ModelHandle&) = delete;

    Result<std::shared_ptr<T>> get() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return state_ != ModelState::Loading; });

        if (state_ == ModelState::Ready)
            return instance_;
        if (state_ == ModelState::Failed)
            return lastError_;

        state_ = ModelState::Loading;
        ++loadCount_;
        lock.unlock();

        Result<std::shared_ptr<T>> loaded = runLoader();

        lock.lock();
        if (loaded && loaded.value()) {
            instance_ = loaded.value();
            state_ = ModelState::Ready;
            spdlog::debug("model '{}' loaded", name_);
        } else {
            lastError_ = loaded ? Error{ErrorCode::ProviderUnavailable,
                                        "loader for '" + name_ + "' returned no instance"}
                                : loaded.error();
            state_ = ModelState::Failed;
            spdlog::warn("model '{}' failed to load: {}", name_, lastError_.message);
        }
        cv_.notify_all();

        if (state_ == ModelState::Ready)
            return instance_;
        return lastError_;
    }

    // Drops the instance or cached failure; the next get() loads again.
    void reset() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return state_ != ModelState::Loading; });
        instance_.reset();
        lastError_ = Error{};
        state_ = ModelState::Unloaded;
    }

    ModelState state() const {
        std::lock_guard lock(mutex_);
        return state_;
    }

    size_t loadCount() const {
        std::lock_guard lock(mutex_);
        return loadCount_;
    }

    const std::string& name() const { return name_; }

private:
    Result<std::shared_ptr<T>> runLoader() {
        if (!loader_)
            return Error{ErrorCode::ProviderUnavailable, "no loader configured for " + name_};
        try {
            return loader_();
        } catch (const std::exception& e) {
            return Error{ErrorCode::ProviderUnavailable,
                         "loading '" + name_ + "' threw: " + e.what()};
        } catch (...) {
            return Error{ErrorCode::ProviderUnavailable,
                         "loading '" + name_ + "' threw a non-standard exception"};
        }
    }

    std::string name_;
    Loader loader_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    ModelState state_ = ModelState::Unloaded;
    std::shared_ptr<T> instance_;
    Error lastError_;
    size_t loadCount_ = 0;
};

} // namespace kgrag::providers
