#ifndef SQSH_EVENT_BUS_HPP
#define SQSH_EVENT_BUS_HPP

#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace sqsh {

/**
 * @brief Delivers events to the handlers registered for their exact type.
 *
 * Delivery happens on the publishing thread with the bus locked: handlers
 * of one bus never overlap and must not publish or subscribe.
 */
class EventBus {
public:
    template <typename Event>
    void subscribe(std::function<void(const Event&)> handler) {
        Handler erased = [fn = std::move(handler)](const void* event) {
            fn(*static_cast<const Event*>(event));
        };
        std::lock_guard lock(mtx_);
        handlers_[typeid(Event)].push_back(std::move(erased));
    }

    template <typename Event>
    void publish(const Event& event) {
        std::lock_guard lock(mtx_);
        if (const auto found = handlers_.find(typeid(Event)); found != handlers_.end()) {
            for (const auto& handler : found->second) handler(&event);
        }
    }

private:
    using Handler = std::function<void(const void*)>;

    std::mutex mtx_;
    std::unordered_map<std::type_index, std::vector<Handler>> handlers_;
};

} // namespace sqsh

#endif // SQSH_EVENT_BUS_HPP
