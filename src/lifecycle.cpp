#include "refreshlatch/lifecycle.hpp"

#include <algorithm>

#include "refreshlatch/latch.hpp"

namespace refreshlatch {

    ObserverId Lifecycle::add_observer(Observer observer) {
        const ObserverId id = next_id_++;
        if (destroyed_) {
            if (observer) {
                observer();
            }
            return id;
        }
        observers_.emplace_back(id, std::move(observer));
        return id;
    }

    bool Lifecycle::remove_observer(ObserverId id) {
        const auto it = std::ranges::find_if(observers_, [id](const auto& entry) { return entry.first == id; });
        if (it == observers_.end()) {
            return false;
        }
        observers_.erase(it);
        return true;
    }

    void Lifecycle::destroy() {
        if (destroyed_) {
            return;
        }
        destroyed_     = true;
        auto observers = std::move(observers_);
        observers_.clear();
        for (auto& [id, observer] : observers) {
            if (observer) {
                observer();
            }
        }
    }

    bool Lifecycle::destroyed() const {
        return destroyed_;
    }

    std::size_t Lifecycle::observer_count() const {
        return observers_.size();
    }

    LifecycleBinding::LifecycleBinding(Lifecycle& lifecycle, ObserverId id) : lifecycle_(&lifecycle), id_(id) {}

    LifecycleBinding::~LifecycleBinding() {
        release();
    }

    LifecycleBinding::LifecycleBinding(LifecycleBinding&& other) noexcept : lifecycle_(other.lifecycle_), id_(other.id_) {
        other.lifecycle_ = nullptr;
        other.id_        = 0;
    }

    LifecycleBinding& LifecycleBinding::operator=(LifecycleBinding&& other) noexcept {
        if (this == &other) {
            return *this;
        }
        release();
        lifecycle_       = other.lifecycle_;
        id_              = other.id_;
        other.lifecycle_ = nullptr;
        other.id_        = 0;
        return *this;
    }

    void LifecycleBinding::release() {
        if (lifecycle_) {
            lifecycle_->remove_observer(id_);
            lifecycle_ = nullptr;
        }
        id_ = 0;
    }

    LifecycleBinding bind_to_lifecycle(Lifecycle& lifecycle, RefreshLatch& latch) {
        const auto id = lifecycle.add_observer([&latch]() {
            if (!latch.disposed()) {
                latch.dispose();
            }
        });
        return LifecycleBinding(lifecycle, id);
    }

} // namespace refreshlatch
