/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once
#include "core/logger.hpp"
#include <algorithm>
#include <atomic>
#include <concepts>
#include <cstdlib>
#include <functional>
#include <memory>
#include <mutex>
#include <source_location>
#include <string>
#include <typeinfo>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

#ifdef __GNUG__
#include <cxxabi.h>
#endif

namespace ps::event {
    using HandlerId = size_t;

    // Event concept
    template <typename T>
    concept Event = requires {
                        typename T::event_id;
                    } && std::is_aggregate_v<T>;

    class Bus {
        template <typename T>
        using Handler = std::function<void(const T&)>;

        struct BaseChannel {
            virtual ~BaseChannel() = default;
            virtual size_t handler_count() const = 0;
        };

        template <Event E>
        struct Channel : BaseChannel {
            std::vector<std::pair<HandlerId, Handler<E>>> handlers;
            mutable std::mutex mutex;

            size_t handler_count() const override {
                std::lock_guard lock(mutex);
                return handlers.size();
            }
        };

    public:
        template <Event E>
        void emit(const E& event, std::source_location loc = std::source_location::current()) {
            if (trace_) {
                LOG_TRACE("EMIT {} @ {}:{}", demangle(typeid(E).name()), loc.file_name(), loc.line());
            }

            Channel<E>* channel = find_channel<E>();
            if (!channel) {
                return;
            }

            // Handlers may subscribe or unsubscribe while we dispatch
            std::vector<Handler<E>> handlers_copy;
            {
                std::lock_guard lock(channel->mutex);
                handlers_copy.reserve(channel->handlers.size());
                for (auto& [id, handler] : channel->handlers) {
                    handlers_copy.push_back(handler);
                }
            }

            for (auto& handler : handlers_copy) {
                handler(event);
            }

            emit_count_++;
        }

        template <Event E>
        HandlerId when(Handler<E> handler) {
            auto& channel = get_channel<E>();
            std::lock_guard lock(channel.mutex);

            HandlerId id = next_id_++;
            channel.handlers.emplace_back(id, std::move(handler));
            return id;
        }

        template <Event E>
        void remove(HandlerId id) {
            Channel<E>* channel = find_channel<E>();
            if (!channel) {
                return;
            }
            std::lock_guard lock(channel->mutex);
            std::erase_if(channel->handlers, [id](const auto& pair) { return pair.first == id; });
        }

        template <Event E>
        void clear() {
            if (Channel<E>* channel = find_channel<E>()) {
                std::lock_guard lock(channel->mutex);
                channel->handlers.clear();
            }
        }

        void clear_all() {
            std::lock_guard lock(mutex_);
            channels_.clear();
        }

        template <Event E>
        size_t subscriber_count() const {
            std::lock_guard lock(mutex_);
            if (auto it = channels_.find(typeid(E)); it != channels_.end()) {
                return it->second->handler_count();
            }
            return 0;
        }

        void set_trace(bool enabled) { trace_ = enabled; }
        size_t total_emits() const { return emit_count_; }

    private:
        template <Event E>
        Channel<E>& get_channel() {
            std::lock_guard lock(mutex_);
            auto [it, inserted] = channels_.try_emplace(
                typeid(E),
                std::make_unique<Channel<E>>());
            return static_cast<Channel<E>&>(*it->second);
        }

        template <Event E>
        Channel<E>* find_channel() {
            std::lock_guard lock(mutex_);
            if (auto it = channels_.find(typeid(E)); it != channels_.end()) {
                return static_cast<Channel<E>*>(it->second.get());
            }
            return nullptr;
        }

        static std::string demangle(const char* name) {
#ifdef __GNUG__
            int status = 0;
            std::unique_ptr<char, void (*)(void*)> res{
                abi::__cxa_demangle(name, nullptr, nullptr, &status),
                std::free};
            return (status == 0) ? res.get() : name;
#else
            return name;
#endif
        }

        mutable std::mutex mutex_;
        std::unordered_map<std::type_index, std::unique_ptr<BaseChannel>> channels_;
        std::atomic<HandlerId> next_id_{1};
        std::atomic<size_t> emit_count_{0};
        std::atomic<bool> trace_{false};
    };

    // Global event bus singleton
    inline Bus& bus() {
        static Bus instance;
        return instance;
    }

    // Removes its handler when it goes out of scope
    template <Event E>
    class ScopedSubscription {
    public:
        ScopedSubscription() = default;
        explicit ScopedSubscription(HandlerId id) : id_(id) {}
        ~ScopedSubscription() { reset(); }

        ScopedSubscription(const ScopedSubscription&) = delete;
        ScopedSubscription& operator=(const ScopedSubscription&) = delete;

        ScopedSubscription(ScopedSubscription&& other) noexcept : id_(std::exchange(other.id_, 0)) {}
        ScopedSubscription& operator=(ScopedSubscription&& other) noexcept {
            if (this != &other) {
                reset();
                id_ = std::exchange(other.id_, 0);
            }
            return *this;
        }

        void reset() {
            if (id_ != 0) {
                bus().remove<E>(id_);
                id_ = 0;
            }
        }

    private:
        HandlerId id_ = 0;
    };

} // namespace ps::event
