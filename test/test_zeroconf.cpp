#include "test_utils.hpp"
#include "zeroconf_cpp/exceptions.hpp"

#include <gtest/gtest.h>

#include <cctype>
#include <memory>

using namespace zeroconf_cpp;

namespace
{

class ZeroconfTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        transport = std::make_shared<LoopbackTransport>();
        zc = std::make_unique<Zeroconf>(LoopbackSettings(transport));
    }

    void TearDown() override
    {
        zc->Close();
    }

    std::shared_ptr<LoopbackTransport> transport;
    std::unique_ptr<Zeroconf> zc;
};

struct SectionCounts
{
    std::size_t answers{0};
    std::size_t authorities{0};
    std::size_t additionals{0};
};

// Adds up the sections of out, checking every record carries the TTL of its kind
void Count(const OutgoingMessage& out, std::uint32_t host_ttl, std::uint32_t other_ttl, SectionCounts& counts)
{
    auto expected = [&](const Record& record) {
        const auto type = GetHeader(record).type;
        return type == kTypePtr || type == kTypeTxt ? other_ttl : host_ttl;
    };
    for (const auto& [record, ttl] : out.Answers()) {
        EXPECT_EQ(ttl.value_or(GetHeader(record).ttl), expected(record)) << record;
        ++counts.answers;
    }
    for (const auto& record : out.Authorities()) {
        EXPECT_EQ(GetHeader(record).ttl, expected(record)) << record;
        ++counts.authorities;
    }
    for (const auto& record : out.Additionals()) {
        EXPECT_EQ(GetHeader(record).ttl, expected(record)) << record;
        ++counts.additionals;
    }
}

// A host claiming name under type_, answering with a PTR and an unrelated SRV
void GenerateHost(Zeroconf& zc, const std::string& host_name, const std::string& type)
{
    const auto name = host_name + "." + type;
    OutgoingMessage out(kFlagsQrResponse | kFlagsAa);
    out.AddAnswerAtTime(MakePointerRecord(type, kDnsOtherTtl, name), Clock::now());
    out.AddAnswerAtTime(MakeServiceRecord(type, kDnsHostTtl, 0, 0, 80, name), Clock::now());
    Inject(zc, out);
}

}

TEST_F(ZeroconfTest, BroadcastAndQueryTtls)
{
    const std::string type = "_test-srvc-type._tcp.local.";
    ServiceInfoSettings settings = MakeServiceSettings(type, "xxxyyy", "ash-2.local.", "10.0.1.2");
    settings.properties = {{"path", std::string("/~paulsm/")}};
    const auto info = std::make_shared<ServiceInfo>(settings);

    SectionCounts counts;
    for (int i = 0; i < 3; ++i) {
        Count(zc->GenerateServiceQuery(*info), kDnsHostTtl, kDnsOtherTtl, counts);
    }
    zc->Registry().Add(info);
    for (int i = 0; i < 3; ++i) {
        Count(zc->GenerateServiceBroadcast(*info, std::nullopt), kDnsHostTtl, kDnsOtherTtl, counts);
    }
    EXPECT_EQ(counts.answers, 12u);
    EXPECT_EQ(counts.additionals, 0u);
    EXPECT_EQ(counts.authorities, 3u);

    OutgoingMessage query(kFlagsQrQuery | kFlagsAa);
    EXPECT_TRUE(query.IsQuery());
    query.AddQuestion(Question{type, kTypePtr, kClassIn, false});
    query.AddQuestion(Question{info->Name(), kTypeSrv, kClassIn, false});
    query.AddQuestion(Question{info->Name(), kTypeTxt, kClassIn, false});
    query.AddQuestion(Question{info->Server(), kTypeA, kClassIn, false});
    const auto response = zc->GetQueryHandler().Response(IncomingMessage(query.Packets().at(0)), false);
    ASSERT_TRUE(response.has_value());
    counts = SectionCounts();
    Count(*response, kDnsHostTtl, kDnsOtherTtl, counts);
    EXPECT_EQ(counts.answers, 4u);
    EXPECT_EQ(counts.additionals, 4u);
    EXPECT_EQ(counts.authorities, 0u);

    // Goodbye
    counts = SectionCounts();
    for (int i = 0; i < 3; ++i) {
        Count(zc->GenerateServiceBroadcast(*info, 0), 0, 0, counts);
    }
    EXPECT_EQ(counts.answers, 12u);
    EXPECT_EQ(counts.authorities, 0u);

    // Custom TTL overrides both kinds
    const std::uint32_t custom = kDnsHostTtl * 2;
    counts = SectionCounts();
    for (int i = 0; i < 3; ++i) {
        Count(zc->GenerateServiceBroadcast(*info, custom), custom, custom, counts);
    }
    EXPECT_EQ(counts.answers, 12u);
    EXPECT_EQ(counts.additionals, 0u);
    EXPECT_EQ(counts.authorities, 3u);
}

TEST_F(ZeroconfTest, PointerQueryCarriesServiceInAdditionals)
{
    const std::string type = "_test-srvc-type._tcp.local.";
    const auto info = std::make_shared<ServiceInfo>(MakeServiceSettings(type, "xxxyyy", "ash-2.local.", "10.0.1.2"));
    zc->Registry().Add(info);

    OutgoingMessage query(kFlagsQrQuery | kFlagsAa);
    query.AddQuestion(Question{type, kTypePtr, kClassIn, false});
    const auto response = zc->GetQueryHandler().Response(IncomingMessage(query.Packets().at(0)), false);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->Answers().size(), 1u);
    EXPECT_EQ(response->Authorities().size(), 0u);
    ASSERT_EQ(response->Additionals().size(), 3u);
    EXPECT_EQ(GetHeader(response->Additionals()[0]).type, kTypeSrv);
    EXPECT_EQ(GetHeader(response->Additionals()[1]).type, kTypeTxt);
    EXPECT_EQ(GetHeader(response->Additionals()[2]).type, kTypeA);
}

TEST_F(ZeroconfTest, KnownAnswerIsSuppressed)
{
    const std::string type = "_test-srvc-type._tcp.local.";
    const auto info = std::make_shared<ServiceInfo>(MakeServiceSettings(type, "xxxyyy", "ash-2.local.", "10.0.1.2"));
    zc->Registry().Add(info);

    OutgoingMessage query(kFlagsQrQuery);
    query.AddQuestion(Question{type, kTypePtr, kClassIn, false});
    query.AddAnswerAtTime(info->DnsPointer(), Clock::now());
    EXPECT_FALSE(zc->GetQueryHandler().Response(IncomingMessage(query.Packets().at(0)), false).has_value());
}

TEST_F(ZeroconfTest, KnownServiceGetsNoAdditionals)
{
    const std::string type = "_test-srvc-type._tcp.local.";
    const auto known = std::make_shared<ServiceInfo>(MakeServiceSettings(type, "known", "ash-2.local.", "10.0.1.2"));
    const auto fresh = std::make_shared<ServiceInfo>(MakeServiceSettings(type, "fresh", "ash-3.local.", "10.0.1.3"));
    zc->Registry().Add(known);
    zc->Registry().Add(fresh);

    OutgoingMessage query(kFlagsQrQuery);
    query.AddQuestion(Question{type, kTypePtr, kClassIn, false});
    query.AddAnswerAtTime(known->DnsPointer(), Clock::now());
    const auto response = zc->GetQueryHandler().Response(IncomingMessage(query.Packets().at(0)), false);
    ASSERT_TRUE(response.has_value());
    ASSERT_EQ(response->Answers().size(), 1u);
    EXPECT_EQ(std::get<PointerRecord>(response->Answers()[0].first).alias, fresh->Name());
    ASSERT_EQ(response->Additionals().size(), 3u);
    for (const auto& record : response->Additionals()) {
        const auto& name = GetHeader(record).name;
        EXPECT_TRUE(name == fresh->Name() || name == fresh->Server()) << record;
    }
}

TEST_F(ZeroconfTest, UnicastResponseEchoesQuestionsAndId)
{
    const std::string type = "_test-srvc-type._tcp.local.";
    const auto info = std::make_shared<ServiceInfo>(MakeServiceSettings(type, "xxxyyy", "ash-2.local.", "10.0.1.2"));
    zc->Registry().Add(info);

    OutgoingMessage query(kFlagsQrQuery, false, 0x1234);
    query.AddQuestion(Question{type, kTypePtr, kClassIn, false});
    const auto response = zc->GetQueryHandler().Response(IncomingMessage(query.Packets().at(0)), true);
    ASSERT_TRUE(response.has_value());
    EXPECT_FALSE(response->Multicast());
    EXPECT_EQ(response->Id(), 0x1234);
    EXPECT_EQ(response->Questions().size(), 1u);

    const IncomingMessage parsed(response->Packets().at(0));
    ASSERT_TRUE(parsed.Valid()) << parsed.Error();
    EXPECT_EQ(parsed.Id(), 0x1234);
}

TEST_F(ZeroconfTest, ServiceTypeEnumeration)
{
    const std::string type = "_test-srvc-type._tcp.local.";
    zc->Registry().Add(std::make_shared<ServiceInfo>(MakeServiceSettings(type, "one", "ash-2.local.", "10.0.1.2")));

    OutgoingMessage query(kFlagsQrQuery);
    query.AddQuestion(Question{kServiceTypeEnumerationName, kTypePtr, kClassIn, false});
    const auto response = zc->GetQueryHandler().Response(IncomingMessage(query.Packets().at(0)), false);
    ASSERT_TRUE(response.has_value());
    ASSERT_EQ(response->Answers().size(), 1u);
    EXPECT_EQ(std::get<PointerRecord>(response->Answers()[0].first).alias, type);
}

TEST_F(ZeroconfTest, NameConflicts)
{
    const std::string type = "_homeassistant._tcp.local.";
    const auto info = std::make_shared<ServiceInfo>(MakeServiceSettings(type, "Home", "random123.local.", "1.2.3.4"));
    zc->RegisterService(info);

    const auto conflicting =
        std::make_shared<ServiceInfo>(MakeServiceSettings(type, "Home", "random456.local.", "4.5.6.7"));
    EXPECT_THROW(zc->RegisterService(conflicting), NonUniqueNameError);
    EXPECT_EQ(zc->Registry().GetInfoName(info->Name()), info);
}

TEST_F(ZeroconfTest, LotsOfNamesForceRename)
{
    const std::string type = "_my-service._tcp.local.";
    const std::string name = "a wonderful service";
    constexpr int kHosts = 300;
    for (int i = 1; i <= kHosts; ++i) {
        GenerateHost(*zc, i == 1 ? name : name + "-" + std::to_string(i), type);
    }
    EXPECT_EQ(zc->GetCache().GetAllByDetails(type, kTypePtr, kClassIn).size(), static_cast<std::size_t>(kHosts));

    ServiceInfoSettings settings = MakeServiceSettings(type, name, "ash-2.local.", "10.0.1.2");
    settings.properties = {{"path", std::string("/~paulsm/")}};
    const auto info = std::make_shared<ServiceInfo>(settings);

    EXPECT_THROW(zc->RegisterService(info), NonUniqueNameError);

    // RFC 6762 section 6.6
    ASSERT_NO_THROW(zc->RegisterService(info, std::nullopt, false, true));
    EXPECT_EQ(info->Name(), name + "." + type);

    ASSERT_NO_THROW(zc->RegisterService(info, std::nullopt, true));
    EXPECT_EQ(info->InstanceName(), name + "-" + std::to_string(kHosts + 1));
    EXPECT_EQ(zc->Registry().GetInfoName(info->Name()), info);
    EXPECT_EQ(zc->Registry().GetInfoName(name + "." + type), nullptr);
}

TEST_F(ZeroconfTest, RenameLimitIsEnforced)
{
    zc->Close();
    transport = std::make_shared<LoopbackTransport>();
    auto settings = LoopbackSettings(transport);
    settings.max_name_changes = 5;
    zc = std::make_unique<Zeroconf>(settings);

    const std::string type = "_my-service._tcp.local.";
    for (int i = 1; i <= 10; ++i) {
        GenerateHost(*zc, i == 1 ? "svc" : "svc-" + std::to_string(i), type);
    }
    const auto info = std::make_shared<ServiceInfo>(MakeServiceSettings(type, "svc", "ash-2.local.", "10.0.1.2"));
    EXPECT_THROW(zc->RegisterService(info, std::nullopt, true), NonUniqueNameError);
}

TEST_F(ZeroconfTest, RegisterProbesThenAnnounces)
{
    const std::string type = "_http._tcp.local.";
    const auto info = std::make_shared<ServiceInfo>(MakeServiceSettings(type, "Web", "web.local.", "10.0.0.1"));
    transport->SetLoopback(false);
    zc->RegisterService(info);

    const auto sent = transport->SentPackets();
    ASSERT_EQ(sent.size(), static_cast<std::size_t>(kProbeCount + kAnnounceCount));
    for (int i = 0; i < kProbeCount; ++i) {
        const IncomingMessage probe(sent[i].packet);
        ASSERT_TRUE(probe.Valid());
        EXPECT_TRUE(probe.IsQuery());
        EXPECT_EQ(probe.Authorities().size(), 1u);
        EXPECT_FALSE(sent[i].to.has_value());
    }
    for (int i = kProbeCount; i < kProbeCount + kAnnounceCount; ++i) {
        const IncomingMessage announcement(sent[i].packet);
        ASSERT_TRUE(announcement.Valid());
        EXPECT_TRUE(announcement.IsResponse());
        EXPECT_EQ(announcement.Answers().size(), 4u);
    }

    transport->ClearSent();
    zc->UnregisterService(info);
    const auto goodbyes = transport->SentPackets();
    ASSERT_EQ(goodbyes.size(), static_cast<std::size_t>(kAnnounceCount));
    const IncomingMessage goodbye(goodbyes[0].packet);
    for (const auto& record : goodbye.Answers()) {
        EXPECT_EQ(GetHeader(record).ttl, 0u);
    }
    EXPECT_EQ(zc->Registry().GetInfoName(info->Name()), nullptr);
}

TEST_F(ZeroconfTest, RegisterWithCustomTtl)
{
    const std::string type = "_http._tcp.local.";
    const auto info = std::make_shared<ServiceInfo>(MakeServiceSettings(type, "Web", "web.local.", "10.0.0.1"));
    transport->SetLoopback(false);
    zc->RegisterService(info, 60);

    EXPECT_EQ(info->HostTtl(), 60u);
    EXPECT_EQ(info->OtherTtl(), 60u);
    const IncomingMessage announcement(transport->SentPackets().back().packet);
    for (const auto& record : announcement.Answers()) {
        EXPECT_EQ(GetHeader(record).ttl, 60u);
    }
}

TEST_F(ZeroconfTest, RegisterRejectsMismatchedType)
{
    ServiceInfoSettings settings = MakeServiceSettings("_http._tcp.local.", "Web", "web.local.", "10.0.0.1");
    const auto info = std::make_shared<ServiceInfo>(settings);
    info->SetName("Web._ipp._tcp.local.");
    EXPECT_THROW(zc->RegisterService(info), BadTypeInNameError);
}

TEST_F(ZeroconfTest, LookupTypeByUppercaseName)
{
    const std::string type = "_mylowertype._tcp.local.";
    const auto info = std::make_shared<ServiceInfo>(MakeServiceSettings(type, "Home", "random123.local.", "1.2.3.4"));
    transport->SetLoopback(false);
    zc->RegisterService(info);
    zc->GetCache().Clear();
    transport->SetLoopback(true);

    auto lookup = std::make_shared<ServiceInfo>(type, info->Name());
    lookup->LoadFromCache(*zc);
    EXPECT_TRUE(lookup->Addresses().empty());

    std::string upper = type;
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    OutgoingMessage query(kFlagsQrQuery | kFlagsAa);
    query.AddQuestion(Question{upper, kTypePtr, kClassIn, false});
    ASSERT_TRUE(zc->Send(query));

    ASSERT_TRUE(WaitFor([&](){ return lookup->LoadFromCache(*zc); }));
    EXPECT_EQ(lookup->ParsedAddresses(), std::vector<std::string>{"1.2.3.4"});
    EXPECT_EQ(lookup->GetProperties(), (Properties{{"version", std::string("1.0")}}));
    EXPECT_EQ(lookup->Port(), 80);
    EXPECT_EQ(lookup->Server(), "random123.local.");
}

TEST_F(ZeroconfTest, GetServiceInfoResolvesOverTheNetwork)
{
    const std::string type = "_http._tcp.local.";
    const auto info = std::make_shared<ServiceInfo>(MakeServiceSettings(type, "Web", "web.local.", "10.0.0.1"));
    transport->SetLoopback(false);
    zc->RegisterService(info);
    zc->GetCache().Clear();
    transport->SetLoopback(true);

    const auto resolved = zc->GetServiceInfo(type, info->Name(), std::chrono::seconds(2));
    ASSERT_NE(resolved, nullptr);
    EXPECT_EQ(resolved->Server(), "web.local.");
    EXPECT_EQ(resolved->ParsedAddresses(), std::vector<std::string>{"10.0.0.1"});

    EXPECT_EQ(zc->GetServiceInfo(type, "Missing." + type, std::chrono::milliseconds(300)), nullptr);
}

TEST_F(ZeroconfTest, LegacyQueryGetsUnicastAnswer)
{
    const std::string type = "_http._tcp.local.";
    const auto info = std::make_shared<ServiceInfo>(MakeServiceSettings(type, "Web", "web.local.", "10.0.0.1"));
    transport->SetLoopback(false);
    zc->RegisterService(info);
    transport->ClearSent();

    OutgoingMessage query(kFlagsQrQuery, false, 77);
    query.AddQuestion(Question{type, kTypePtr, kClassIn, false});
    zc->HandlePacket(query.Packets().at(0), Endpoint{"192.168.1.20", 40000});

    const auto sent = transport->SentPackets();
    ASSERT_EQ(sent.size(), 1u);
    ASSERT_TRUE(sent[0].to.has_value());
    EXPECT_EQ(sent[0].to->address, "192.168.1.20");
    EXPECT_EQ(sent[0].to->port, 40000);
    const IncomingMessage response(sent[0].packet);
    EXPECT_EQ(response.Id(), 77);
    EXPECT_EQ(response.Questions().size(), 1u);
}

TEST_F(ZeroconfTest, GoodbyeRemovesCachedRecord)
{
    const auto record = MakeAddressRecord("host.local.", kDnsHostTtl, *ParseAddress("10.0.0.9"));
    OutgoingMessage hello(kFlagsQrResponse | kFlagsAa);
    hello.AddAnswer(record);
    Inject(*zc, hello);
    EXPECT_TRUE(zc->GetCache().GetByDetails("host.local.", kTypeA, kClassIn).has_value());

    OutgoingMessage goodbye(kFlagsQrResponse | kFlagsAa);
    goodbye.AddAnswer(record, 0);
    Inject(*zc, goodbye);
    EXPECT_FALSE(zc->GetCache().GetByDetails("host.local.", kTypeA, kClassIn).has_value());
}

TEST_F(ZeroconfTest, InvalidPacketIsDropped)
{
    const std::vector<std::uint8_t> garbage = {0x00, 0x01, 0x84};
    EXPECT_NO_THROW(zc->HandlePacket(garbage, Endpoint{"127.0.0.1", kMdnsPort}));
    EXPECT_EQ(zc->GetCache().Size(), 0u);
}

TEST_F(ZeroconfTest, CloseSendsGoodbyesAndRejectsRegistration)
{
    const std::string type = "_http._tcp.local.";
    const auto info = std::make_shared<ServiceInfo>(MakeServiceSettings(type, "Web", "web.local.", "10.0.0.1"));
    transport->SetLoopback(false);
    zc->RegisterService(info);
    transport->ClearSent();

    zc->Close();
    EXPECT_TRUE(zc->Closed());
    const auto sent = transport->SentPackets();
    ASSERT_EQ(sent.size(), static_cast<std::size_t>(kAnnounceCount));
    const IncomingMessage goodbye(sent[0].packet);
    ASSERT_TRUE(goodbye.Valid());
    for (const auto& record : goodbye.Answers()) {
        EXPECT_EQ(GetHeader(record).ttl, 0u);
    }

    const auto other = std::make_shared<ServiceInfo>(MakeServiceSettings(type, "Other", "web.local.", "10.0.0.1"));
    EXPECT_THROW(zc->RegisterService(other), Error);
    EXPECT_NO_THROW(zc->Close());
}
