#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "../../core/HostnameResolver.hpp"
#include "../../core/MacResolver.hpp"
#include "../../core/Pinger.hpp"
#include "../../core/SubnetProvider.hpp"
#include "../../detection/DeviceTypeDetector.hpp"
#include "../../storage/DeviceStorage.hpp"

namespace netsweep::testing
{
    // Scripted echo replies. Unlisted addresses time out immediately.
    class FakePinger : public core::Pinger
    {
    public:
        void SetOnline(const std::string &address, std::chrono::milliseconds rtt = std::chrono::milliseconds(3))
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_replies[address] = rtt;
        }

        void SetOffline(const std::string &address)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_replies.erase(address);
        }

        // A foreign failure throws a value outside the std::exception tree.
        void ThrowFor(const std::string &address, bool foreign = false)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_throwing[address] = foreign;
        }

        // Every Ping sleeps this long, so concurrent probes overlap.
        void SetLatency(std::chrono::milliseconds latency) { m_latency = latency; }

        // Runs on the probe thread before the reply is decided.
        void OnPing(std::function<void(const std::string &)> hook)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_hook = std::move(hook);
        }

        std::optional<std::chrono::milliseconds> Ping(const std::string &address, std::chrono::milliseconds) override
        {
            int now = ++m_inFlight;
            int seen = m_maxInFlight.load();
            while (now > seen && !m_maxInFlight.compare_exchange_weak(seen, now))
            {
            }

            std::function<void(const std::string &)> hook;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_calls.push_back(address);
                hook = m_hook;
            }
            if (hook)
                hook(address);

            if (m_latency.load().count() > 0)
                std::this_thread::sleep_for(m_latency.load());

            std::optional<std::chrono::milliseconds> reply;
            bool fail = false;
            bool foreign = false;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto thrown = m_throwing.find(address);
                fail = thrown != m_throwing.end();
                foreign = fail && thrown->second;
                auto it = m_replies.find(address);
                if (it != m_replies.end())
                    reply = it->second;
            }

            --m_inFlight;
            if (foreign)
                throw std::string("simulated socket failure");
            if (fail)
                throw std::runtime_error("simulated socket failure");
            return reply;
        }

        int MaxConcurrent() const { return m_maxInFlight; }

        std::size_t CallCount() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_calls.size();
        }

        std::vector<std::string> Calls() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_calls;
        }

        void ResetCounters()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_calls.clear();
            m_maxInFlight = 0;
        }

    private:
        mutable std::mutex m_mutex;
        std::map<std::string, std::chrono::milliseconds> m_replies;
        std::map<std::string, bool> m_throwing;
        std::vector<std::string> m_calls;
        std::function<void(const std::string &)> m_hook;
        std::atomic<std::chrono::milliseconds> m_latency{std::chrono::milliseconds(0)};
        std::atomic<int> m_inFlight{0};
        std::atomic<int> m_maxInFlight{0};
    };

    class FakeHostnameResolver : public core::HostnameResolver
    {
    public:
        void Set(const std::string &address, const std::string &name)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_names[address] = name;
        }

        std::optional<std::string> ResolveHostName(const std::string &address) override
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_names.find(address);
            if (it == m_names.end())
                return std::nullopt;
            return it->second;
        }

    private:
        std::mutex m_mutex;
        std::map<std::string, std::string> m_names;
    };

    class FakeMacResolver : public core::MacResolver
    {
    public:
        void Set(const std::string &address, const std::string &mac)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_table[address] = mac;
        }

        void Clear()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_table.clear();
        }

        std::map<std::string, std::string> GetArpTable() override
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_table;
        }

    private:
        std::mutex m_mutex;
        std::map<std::string, std::string> m_table;
    };

    class FakeSubnetProvider : public core::SubnetProvider
    {
    public:
        explicit FakeSubnetProvider(std::vector<std::string> prefixes) : m_prefixes(std::move(prefixes)) {}

        std::vector<std::string> GetSubnetsToScan() override
        {
            ++m_calls;
            return m_prefixes;
        }

        int Calls() const { return m_calls; }

    private:
        std::vector<std::string> m_prefixes;
        std::atomic<int> m_calls{0};
    };

    class FakeDetector : public detection::DeviceTypeDetector
    {
    public:
        FakeDetector(std::string name, int priority, std::optional<std::string> answer, bool throws = false)
            : m_name(std::move(name)), m_priority(priority), m_answer(std::move(answer)), m_throws(throws)
        {
        }

        int Priority() const override { return m_priority; }
        std::string Name() const override { return m_name; }

        std::optional<std::string> Classify(const std::string &) override
        {
            ++m_calls;
            if (m_throwsForeign)
                throw 42;
            if (m_throws)
                throw std::runtime_error(m_name + " exploded");
            return m_answer;
        }

        // Throws a value that does not derive from std::exception.
        void ThrowForeignValue() { m_throwsForeign = true; }

        int Calls() const { return m_calls; }

    private:
        std::string m_name;
        int m_priority;
        std::optional<std::string> m_answer;
        bool m_throws;
        std::atomic<bool> m_throwsForeign{false};
        std::atomic<int> m_calls{0};
    };

    class InMemoryStorage : public storage::DeviceStorage
    {
    public:
        std::vector<core::Device> LoadDevices() override
        {
            ++loads;
            return devices;
        }

        bool SaveDevices(const std::vector<core::Device> &d) override
        {
            ++device_saves;
            if (fail_saves)
                return false;
            devices = d;
            return true;
        }

        storage::Settings LoadSettings() override { return settings; }

        bool SaveSettings(const storage::Settings &s) override
        {
            if (fail_saves)
                return false;
            for (const auto &[k, v] : s)
                settings[k] = v;
            return true;
        }

        std::vector<core::Device> devices;
        storage::Settings settings;
        int loads = 0;
        int device_saves = 0;
        bool fail_saves = false;
    };

    // Polls until pred holds or the timeout expires.
    inline bool WaitUntil(const std::function<bool()> &pred,
                          std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (pred())
                return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return pred();
    }

    inline core::Device MakeDevice(const std::string &address, bool online, const std::string &mac = core::kUnknown)
    {
        core::Device d;
        d.address = address;
        d.name = "host-" + address;
        d.is_online = online;
        d.mac_address = mac;
        d.response_time = std::chrono::milliseconds(online ? 4 : 0);
        d.last_seen = core::Clock::now();
        return d;
    }
}
