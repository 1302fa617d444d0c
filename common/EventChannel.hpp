#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "Log.hpp"

namespace netsweep::common
{
    // Typed publish/subscribe channel. Emit() works on a copy of the
    // subscriber list, so callbacks may Connect/Disconnect re-entrantly.
    template <typename... Args>
    class EventChannel
    {
    public:
        using Callback = std::function<void(const Args &...)>;
        using Handle = std::size_t;

        Handle Connect(Callback callback)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!callback)
                return 0;
            Handle handle = m_nextHandle++;
            m_subscribers.emplace_back(handle, std::move(callback));
            return handle;
        }

        bool Disconnect(Handle handle)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto it = m_subscribers.begin(); it != m_subscribers.end(); ++it)
            {
                if (it->first == handle)
                {
                    m_subscribers.erase(it);
                    return true;
                }
            }
            return false;
        }

        void DisconnectAll()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_subscribers.clear();
        }

        void Emit(const Args &...args) const
        {
            std::vector<std::pair<Handle, Callback>> subscribers;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                subscribers = m_subscribers;
            }

            for (const auto &entry : subscribers)
            {
                try
                {
                    entry.second(args...);
                }
                catch (const std::exception &e)
                {
                    LogWarn("Events", std::string("Subscriber threw: ") + e.what());
                }
            }
        }

        std::size_t SubscriberCount() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_subscribers.size();
        }

    private:
        mutable std::mutex m_mutex;
        std::vector<std::pair<Handle, Callback>> m_subscribers;
        Handle m_nextHandle = 1;
    };
}
