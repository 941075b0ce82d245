#ifndef REFRESHLATCH_LIFECYCLE_HPP
#define REFRESHLATCH_LIFECYCLE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace refreshlatch {

    class RefreshLatch;

    using ObserverId = std::uint64_t;

    // Adapter for a host object's teardown event. Observers run once, in
    // registration order, when destroy() is called.
    class Lifecycle {
      public:
        using Observer = std::function<void()>;

        // Registering on a destroyed lifecycle runs the observer immediately.
        ObserverId  add_observer(Observer observer);
        bool        remove_observer(ObserverId id);
        void        destroy();

        bool        destroyed() const;
        std::size_t observer_count() const;

      private:
        std::vector<std::pair<ObserverId, Observer>> observers_;
        ObserverId                                   next_id_   = 1;
        bool                                         destroyed_ = false;
    };

    // Disposes a latch when its lifecycle is destroyed. Dropping the binding
    // unregisters the observer from the lifecycle, so both the Lifecycle and
    // the latch must outlive the binding.
    class LifecycleBinding {
      public:
        LifecycleBinding() = default;
        LifecycleBinding(Lifecycle& lifecycle, ObserverId id);
        ~LifecycleBinding();

        LifecycleBinding(const LifecycleBinding&)            = delete;
        LifecycleBinding& operator=(const LifecycleBinding&) = delete;
        LifecycleBinding(LifecycleBinding&& other) noexcept;
        LifecycleBinding& operator=(LifecycleBinding&& other) noexcept;

        void              release();
        ObserverId        id() const {
            return id_;
        }
        explicit operator bool() const {
            return lifecycle_ != nullptr;
        }

      private:
        Lifecycle* lifecycle_ = nullptr;
        ObserverId id_        = 0;
    };

    [[nodiscard]] LifecycleBinding bind_to_lifecycle(Lifecycle& lifecycle, RefreshLatch& latch);

} // namespace refreshlatch

#endif // REFRESHLATCH_LIFECYCLE_HPP
