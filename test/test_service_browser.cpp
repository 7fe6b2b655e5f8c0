#include "test_utils.hpp"
#include "zeroconf_cpp/exceptions.hpp"
#include "zeroconf_cpp/service_browser.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <utility>

using namespace zeroconf_cpp;

namespace
{

const std::string kType = "_browse-test._tcp.local.";

class RecordingListener : public ServiceListener
{
public:
    void AddService(Zeroconf&, const std::string&, const std::string& name) override
    {
        Record(name, ServiceStateChange::Added);
    }

    void RemoveService(Zeroconf&, const std::string&, const std::string& name) override
    {
        Record(name, ServiceStateChange::Removed);
    }

    void UpdateService(Zeroconf&, const std::string&, const std::string& name) override
    {
        Record(name, ServiceStateChange::Updated);
    }

    std::vector<std::pair<std::string, ServiceStateChange>> Events() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_events;
    }

    std::size_t Count(ServiceStateChange change) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::size_t count = 0;
        for (const auto& event : m_events) {
            count += event.second == change ? 1 : 0;
        }
        return count;
    }

private:
    void Record(const std::string& name, ServiceStateChange change)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.emplace_back(name, change);
    }

    mutable std::mutex m_mutex;
    std::vector<std::pair<std::string, ServiceStateChange>> m_events;
};

OutgoingMessage Announcement(const ServiceInfo& info, std::optional<std::uint32_t> ttl = std::nullopt)
{
    OutgoingMessage out(kFlagsQrResponse | kFlagsAa);
    out.AddAnswer(info.DnsPointer(ttl));
    out.AddAnswer(info.DnsService(ttl));
    out.AddAnswer(info.DnsText(ttl));
    for (auto& address : info.DnsAddresses(ttl)) {
        out.AddAnswer(std::move(address));
    }
    return out;
}

class ServiceBrowserTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        transport = std::make_shared<LoopbackTransport>();
        transport->SetLoopback(false);
        zc = std::make_unique<Zeroconf>(LoopbackSettings(transport));
    }

    void TearDown() override
    {
        zc->Close();
    }

    std::shared_ptr<LoopbackTransport> transport;
    std::unique_ptr<Zeroconf> zc;
};

}

TEST_F(ServiceBrowserTest, ReportsAddUpdateRemove)
{
    RecordingListener listener;
    ServiceBrowser browser(*zc, kType, listener);

    auto info = std::make_shared<ServiceInfo>(MakeServiceSettings(kType, "Thing", "thing.local.", "10.0.0.5"));
    Inject(*zc, Announcement(*info));
    ASSERT_TRUE(WaitFor([&](){ return listener.Count(ServiceStateChange::Added) == 1; }));

    info->SetProperties({{"version", std::string("2.0")}});
    Inject(*zc, Announcement(*info));
    ASSERT_TRUE(WaitFor([&](){ return listener.Count(ServiceStateChange::Updated) >= 1; }));

    Inject(*zc, Announcement(*info, 0));
    ASSERT_TRUE(WaitFor([&](){ return listener.Count(ServiceStateChange::Removed) == 1; }));

    browser.Cancel();
    const auto events = listener.Events();
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.front(), std::make_pair(info->Name(), ServiceStateChange::Added));
    EXPECT_EQ(events.back(), std::make_pair(info->Name(), ServiceStateChange::Removed));
}

TEST_F(ServiceBrowserTest, CachedServicesAreReportedOnStart)
{
    auto info = std::make_shared<ServiceInfo>(MakeServiceSettings(kType, "Early", "early.local.", "10.0.0.6"));
    Inject(*zc, Announcement(*info));

    RecordingListener listener;
    ServiceBrowser browser(*zc, kType, listener);
    ASSERT_TRUE(WaitFor([&](){ return listener.Count(ServiceStateChange::Added) == 1; }));
    EXPECT_EQ(listener.Events().front().first, info->Name());
}

TEST_F(ServiceBrowserTest, QueriesWithKnownAnswers)
{
    auto info = std::make_shared<ServiceInfo>(MakeServiceSettings(kType, "Known", "known.local.", "10.0.0.7"));
    Inject(*zc, Announcement(*info));

    std::vector<ServiceStateChangeHandler> handlers = {
        [](Zeroconf&, const std::string&, const std::string&, ServiceStateChange) {}};
    ServiceBrowser browser(*zc, kType, handlers);

    ASSERT_TRUE(WaitFor([&](){ return !transport->SentPackets().empty(); }));
    const IncomingMessage query(transport->SentPackets().front().packet);
    ASSERT_TRUE(query.Valid()) << query.Error();
    EXPECT_TRUE(query.IsQuery());
    ASSERT_EQ(query.Questions().size(), 1u);
    EXPECT_EQ(query.Questions()[0].name, kType);
    EXPECT_EQ(query.Questions()[0].type, kTypePtr);
    ASSERT_EQ(query.Answers().size(), 1u);
    EXPECT_EQ(std::get<PointerRecord>(query.Answers()[0]).alias, info->Name());
}

TEST_F(ServiceBrowserTest, HandlersSeeEveryService)
{
    std::mutex mutex;
    std::vector<std::string> added;
    ServiceStateChangeHandler handler = [&](Zeroconf&, const std::string& type, const std::string& name,
                                            ServiceStateChange change) {
        EXPECT_EQ(type, kType);
        if (change == ServiceStateChange::Added) {
            std::lock_guard<std::mutex> lock(mutex);
            added.push_back(name);
        }
    };
    ServiceBrowser browser(*zc, kType, {handler});

    for (const auto* instance : {"one", "two", "three"}) {
        ServiceInfo info(MakeServiceSettings(kType, instance, std::string(instance) + ".local.", "10.0.0.8"));
        Inject(*zc, Announcement(info));
    }
    ASSERT_TRUE(WaitFor([&](){
        std::lock_guard<std::mutex> lock(mutex);
        return added.size() == 3;
    }));
    browser.Cancel();
    EXPECT_TRUE(browser.Done());
}

TEST_F(ServiceBrowserTest, CancelFromHandler)
{
    std::unique_ptr<ServiceBrowser> browser;
    std::atomic<int> calls{0};
    ServiceStateChangeHandler handler = [&](Zeroconf&, const std::string&, const std::string&, ServiceStateChange) {
        ++calls;
        browser->Cancel();
    };
    browser = std::make_unique<ServiceBrowser>(*zc, kType, std::vector<ServiceStateChangeHandler>{handler});

    ServiceInfo info(MakeServiceSettings(kType, "Solo", "solo.local.", "10.0.0.9"));
    Inject(*zc, Announcement(info));
    ASSERT_TRUE(WaitFor([&](){ return browser->Done(); }));
    browser.reset();
    EXPECT_EQ(calls.load(), 1);
}

TEST_F(ServiceBrowserTest, InvalidTypeIsRejected)
{
    RecordingListener listener;
    EXPECT_THROW(ServiceBrowser(*zc, "_http._tcp.example.com.", listener), BadTypeInNameError);
}

TEST_F(ServiceBrowserTest, OverlongServiceLabelIsRejected)
{
    std::vector<ServiceStateChangeHandler> handlers = {
        [](Zeroconf&, const std::string&, const std::string&, ServiceStateChange) {}};
    const std::string type = "_" + std::string(70, 'a') + "._tcp.local.";
    EXPECT_THROW(ServiceBrowser(*zc, type, handlers), BadTypeInNameError);
    EXPECT_TRUE(transport->SentPackets().empty());
}
