// SPDX-License-Identifier: GPL-2.0-only
/*
 * Softphone - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2025 Softphone Project Contributors
 *
 */
/**
 * @file SignalingChannel.h
 * @ingroup sip
 * @file SignalingChannel.cpp
 * @ingroup sip
 */
#if !defined(__SIP__SIGNALING_CHANNEL_H__)
#define __SIP__SIGNALING_CHANNEL_H__

#include "common/Defines.h"
#include "common/network/sip/SIPPayload.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace network
{
    namespace sip
    {
        // ---------------------------------------------------------------------------
        //  Types
        // ---------------------------------------------------------------------------

        /** @brief Predicate selecting the inbound SIP messages a subscriber is interested in. */
        typedef std::function<bool(const SIPPayload&)> MessageFilter;
        /** @brief Handler invoked for every inbound SIP message accepted by a filter. */
        typedef std::function<void(const SIPPayload&)> MessageHandler;

        // ---------------------------------------------------------------------------
        //  Class Prototypes
        // ---------------------------------------------------------------------------

        class SignalingChannel;

        // ---------------------------------------------------------------------------
        //  Class Declaration
        // ---------------------------------------------------------------------------

        /**
         * @brief Represents a registered listener on a signaling channel. The listener is removed
         *  when unsubscribe() is called or the subscription is destroyed, whichever comes first.
         *  Removal is safe while the channel is dispatching, including from inside the handler.
         * @ingroup sip
         */
        class SOFTPHONE_API Subscription {
        public:
            auto operator=(Subscription&) -> Subscription& = delete;
            Subscription(Subscription&) = delete;

            /**
             * @brief Finalizes a instance of the Subscription class.
             */
            ~Subscription();

            /**
             * @brief Removes the listener from the channel. Repeated calls are no-ops.
             */
            void unsubscribe();
            /**
             * @brief Flag indicating whether the listener is still registered.
             * @returns bool True, if the listener is registered, otherwise false.
             */
            bool isActive() const;

        private:
            friend class SignalingChannel;

            /**
             * @brief Shared registration record between the channel and the subscription.
             */
            struct Entry {
                MessageFilter filter;
                MessageHandler handler;
                std::atomic<bool> active;

                /**
                 * @brief Initializes a new instance of the Entry structure.
                 * @param f Message filter.
                 * @param h Message handler.
                 */
                Entry(MessageFilter f, MessageHandler h) : filter(f), handler(h), active(true) { /* stub */ }
            };

            std::shared_ptr<Entry> m_entry;

            /**
             * @brief Initializes a new instance of the Subscription class.
             * @param entry Registration record.
             */
            explicit Subscription(std::shared_ptr<Entry> entry);
        };

        // ---------------------------------------------------------------------------
        //  Class Declaration
        // ---------------------------------------------------------------------------

        /**
         * @brief Abstract SIP signaling channel. Implementations own the SIP transport (TLS/TCP
         *  connection, registration and authentication) and must call dispatch() for every inbound
         *  message; call sessions use send() and subscribe() only.
         * @ingroup sip
         */
        class SOFTPHONE_API SignalingChannel {
        public:
            /**
             * @brief Initializes a new instance of the SignalingChannel class.
             */
            SignalingChannel();
            /**
             * @brief Finalizes a instance of the SignalingChannel class.
             */
            virtual ~SignalingChannel();

            /**
             * @brief Sends a SIP message to the SIP server.
             * @param message SIP message.
             * @returns bool True, if the message was sent, otherwise false.
             */
            virtual bool send(SIPPayload& message) = 0;

            /**
             * @brief Registers a listener for inbound SIP messages.
             * @param filter Predicate selecting messages for the handler.
             * @param handler Message handler.
             * @returns std::unique_ptr<Subscription> Subscription controlling the listener lifetime.
             */
            std::unique_ptr<Subscription> subscribe(MessageFilter filter, MessageHandler handler);

            /**
             * @brief Delivers an inbound SIP message to every registered listener whose filter accepts it.
             * @param message SIP message.
             */
            void dispatch(const SIPPayload& message);
            /**
             * @brief Parses and delivers an inbound SIP message.
             * @param text SIP message text.
             * @returns bool True, if the message was parsed and delivered, otherwise false.
             */
            bool dispatch(const std::string& text);

            /**
             * @brief Gets the number of registered listeners.
             * @returns size_t Number of registered listeners.
             */
            size_t subscriptionCount();

        private:
            std::mutex m_lock;
            std::vector<std::shared_ptr<Subscription::Entry>> m_entries;

            /**
             * @brief Internal helper to drop listeners that have been unsubscribed.
             */
            void prune();
        };
    } // namespace sip
} // namespace network

#endif // __SIP__SIGNALING_CHANNEL_H__
