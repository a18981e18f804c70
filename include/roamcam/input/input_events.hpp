#pragma once

/**
 * @file input_events.hpp
 * @brief Typed event dispatch with scoped subscriptions
 *
 * The host application (window system, browser shell, test) emits input
 * events; input sources subscribe to the types they care about. Handlers are
 * keyed by event type. A Subscription removes its handler when destroyed,
 * and stays safe to destroy after the dispatcher itself is gone.
 *
 * Dispatch is single-threaded: emit() runs handlers synchronously on the
 * calling thread.
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace roamcam {

// ============================================================================
// Event types
// ============================================================================

/// Pointer capture engaged or released
struct PointerLockChanged {
    bool locked = false;
};

/// Key edge; keyCode is a GLFW key code
struct KeyEvent {
    int keyCode = 0;
    bool pressed = false;
};

/// Relative mouse motion in pixels
struct MouseMoved {
    float dx = 0.0f;
    float dy = 0.0f;
};

/// Gamepad plugged in or removed
struct GamepadConnection {
    int index = 0;
    bool connected = false;
};

// ============================================================================
// InputEvents
// ============================================================================

class InputEvents;

/// Scoped handler registration. Move-only.
class Subscription {
public:
    Subscription() = default;
    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept
        : registry_(std::move(other.registry_)), type_(other.type_), id_(other.id_) {
        other.id_ = 0;
    }

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            registry_ = std::move(other.registry_);
            type_ = other.type_;
            id_ = other.id_;
            other.id_ = 0;
        }
        return *this;
    }

    /// Remove the handler now
    void reset();

    [[nodiscard]] bool active() const { return id_ != 0 && !registry_.expired(); }

private:
    friend class InputEvents;
    struct Registry;

    Subscription(std::weak_ptr<Registry> registry, std::type_index type, uint64_t id)
        : registry_(std::move(registry)), type_(type), id_(id) {}

    std::weak_ptr<Registry> registry_;
    std::type_index type_ = std::type_index(typeid(void));
    uint64_t id_ = 0;
};

class InputEvents {
public:
    InputEvents();

    InputEvents(const InputEvents&) = delete;
    InputEvents& operator=(const InputEvents&) = delete;

    template<typename T>
    [[nodiscard]] Subscription subscribe(std::function<void(const T&)> handler);

    template<typename T>
    void emit(const T& event);

    /// Handlers registered for an event type
    template<typename T>
    [[nodiscard]] size_t handlerCount() const;

private:
    std::shared_ptr<Subscription::Registry> registry_;
};

// ============================================================================
// Implementation
// ============================================================================

struct Subscription::Registry {
    struct Handler {
        uint64_t id;
        std::shared_ptr<std::function<void(const void*)>> fn;
    };
    std::unordered_map<std::type_index, std::vector<Handler>> handlers;
    uint64_t nextId = 1;

    void remove(std::type_index type, uint64_t id) {
        auto it = handlers.find(type);
        if (it == handlers.end()) return;
        auto& bucket = it->second;
        for (auto h = bucket.begin(); h != bucket.end(); ++h) {
            if (h->id == id) {
                bucket.erase(h);
                break;
            }
        }
    }
};

inline void Subscription::reset() {
    if (id_ == 0) return;
    if (auto registry = registry_.lock()) {
        registry->remove(type_, id_);
    }
    registry_.reset();
    id_ = 0;
}

inline InputEvents::InputEvents()
    : registry_(std::make_shared<Subscription::Registry>()) {}

template<typename T>
Subscription InputEvents::subscribe(std::function<void(const T&)> handler) {
    std::type_index type(typeid(T));
    uint64_t id = registry_->nextId++;
    auto fn = std::make_shared<std::function<void(const void*)>>(
        [handler = std::move(handler)](const void* event) {
            handler(*static_cast<const T*>(event));
        });
    registry_->handlers[type].push_back({id, std::move(fn)});
    return Subscription(registry_, type, id);
}

template<typename T>
void InputEvents::emit(const T& event) {
    auto it = registry_->handlers.find(std::type_index(typeid(T)));
    if (it == registry_->handlers.end()) {
        return;
    }
    // Handlers may unsubscribe while being called
    auto snapshot = it->second;
    for (const auto& handler : snapshot) {
        (*handler.fn)(&event);
    }
}

template<typename T>
size_t InputEvents::handlerCount() const {
    auto it = registry_->handlers.find(std::type_index(typeid(T)));
    return it == registry_->handlers.end() ? 0 : it->second.size();
}

}  // namespace roamcam
