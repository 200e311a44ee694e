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
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

#ifdef __GNUG__
#include <cxxabi.h>
#endif

namespace arp::event {
    using HandlerId = size_t;

    template <typename T>
    concept Event = requires {
                        typename T::event_id;
                    } && std::is_aggregate_v<T>;

    // Removes its handler from the bus when destroyed or reset. Move only.
    class Subscription {
    public:
        Subscription() = default;
        explicit Subscription(std::function<void()> release) : release_(std::move(release)) {}
        ~Subscription() { reset(); }

        Subscription(Subscription&& other) noexcept
            : release_(std::exchange(other.release_, nullptr)) {}

        Subscription& operator=(Subscription&& other) noexcept {
            if (this != &other) {
                reset();
                release_ = std::exchange(other.release_, nullptr);
            }
            return *this;
        }

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        void reset() {
            if (auto release = std::exchange(release_, nullptr)) {
                release();
            }
        }

        bool active() const { return static_cast<bool>(release_); }

    private:
        std::function<void()> release_;
    };

    // Synchronous publish/subscribe channel per event type. Handlers run on the
    // emitting thread, in subscription order.
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
            Channel<E>* channel = find_channel<E>();
            if (!channel) {
                return;
            }

            // Handlers may subscribe or unsubscribe while being called
            std::vector<Handler<E>> handlers_copy;
            {
                std::lock_guard lock(channel->mutex);
                handlers_copy.reserve(channel->handlers.size());
                for (auto& [id, handler] : channel->handlers) {
                    handlers_copy.push_back(handler);
                }
            }

            if (core::Logger::get().should_log(core::LogLevel::Trace)) {
                LOG_TRACE("EMIT {} to {} handlers @ {}:{}",
                          demangle(typeid(E).name()), handlers_copy.size(), loc.file_name(), loc.line());
            }

            for (auto& handler : handlers_copy) {
                handler(event);
            }
        }

        template <Event E>
        HandlerId when(Handler<E> handler) {
            auto& channel = get_channel<E>();
            std::lock_guard lock(channel.mutex);

            HandlerId id = next_id_++;
            channel.handlers.emplace_back(id, std::move(handler));
            return id;
        }

        // Same as when(), but the handler lives as long as the returned subscription
        template <Event E>
        [[nodiscard]] Subscription subscribe(Handler<E> handler) {
            const HandlerId id = when<E>(std::move(handler));
            return Subscription([this, id] { remove<E>(id); });
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
        size_t subscriber_count() const {
            std::lock_guard lock(mutex_);
            if (auto it = channels_.find(typeid(E)); it != channels_.end()) {
                return it->second->handler_count();
            }
            return 0;
        }

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
    };

    // Process-wide bus shared by the scene and its observers
    inline Bus& bus() {
        static Bus instance;
        return instance;
    }

} // namespace arp::event
