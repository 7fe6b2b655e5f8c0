#include "zeroconf_cpp/exceptions.hpp"
#include "zeroconf_cpp/incoming_message.hpp"
#include "zeroconf_cpp/outgoing_message.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace zeroconf_cpp;

namespace
{

std::string Repeat(const std::string& part, int count)
{
    std::string result;
    for (int i = 0; i < count; ++i) {
        result += part;
    }
    return result;
}

OutgoingMessage SingleQuestion(const std::string& name)
{
    OutgoingMessage out(kFlagsQrResponse);
    out.AddQuestion(Question{name, kTypeSrv, kClassIn, false});
    return out;
}

}

TEST(NamesTest, LongNameWithManyParts)
{
    const auto packets = SingleQuestion("this.is.a.very.long.name.with.lots.of.parts.in.it.local.").Packets();
    ASSERT_EQ(packets.size(), 1u);

    const IncomingMessage parsed(packets[0]);
    ASSERT_TRUE(parsed.Valid()) << parsed.Error();
    ASSERT_EQ(parsed.Questions().size(), 1u);
    EXPECT_EQ(parsed.Questions()[0].name, "this.is.a.very.long.name.with.lots.of.parts.in.it.local.");
    EXPECT_EQ(parsed.Questions()[0].type, kTypeSrv);
}

TEST(NamesTest, ExceedinglyLongNameEncodesButDoesNotDecode)
{
    const auto name = Repeat("part.", 1000) + "local.";
    std::vector<Packet> packets;
    ASSERT_NO_THROW(packets = SingleQuestion(name).Packets());
    ASSERT_EQ(packets.size(), 1u);

    // Over 255 bytes on the wire, rejected without throwing
    const IncomingMessage parsed(packets[0]);
    EXPECT_FALSE(parsed.Valid());
    EXPECT_FALSE(parsed.Error().empty());
}

TEST(NamesTest, ExtraExceedinglyLongNameEncodesButDoesNotDecode)
{
    const auto name = Repeat("part.", 4000) + "local.";
    std::vector<Packet> packets;
    ASSERT_NO_THROW(packets = SingleQuestion(name).Packets());
    ASSERT_EQ(packets.size(), 1u);

    const IncomingMessage parsed(packets[0]);
    EXPECT_FALSE(parsed.Valid());
}

TEST(NamesTest, NamePartTooLong)
{
    const auto name = std::string(1000, 'a') + ".local.";
    EXPECT_THROW(SingleQuestion(name).Packets(), NamePartTooLongError);
}

TEST(NamesTest, LabelAtLimitEncodes)
{
    const auto name = std::string(63, 'a') + ".local.";
    const auto packets = SingleQuestion(name).Packets();
    const IncomingMessage parsed(packets.at(0));
    ASSERT_TRUE(parsed.Valid()) << parsed.Error();
    EXPECT_EQ(parsed.Questions().at(0).name, name);
}

TEST(NamesTest, EmptyLabelIsRejected)
{
    EXPECT_THROW(SingleQuestion("bad..local.").Packets(), BadNameError);
}

TEST(NamesTest, SameNameTwice)
{
    OutgoingMessage out(kFlagsQrResponse);
    const Question question{"paired.local.", kTypeSrv, kClassIn, false};
    out.AddQuestion(question);
    out.AddQuestion(question);

    const IncomingMessage parsed(out.Packets().at(0));
    ASSERT_TRUE(parsed.Valid()) << parsed.Error();
    ASSERT_EQ(parsed.Questions().size(), 2u);
    EXPECT_EQ(parsed.Questions()[0], question);
    EXPECT_EQ(parsed.Questions()[1], question);
}

TEST(NamesTest, CompressionSharesSuffixes)
{
    OutgoingMessage compressed(kFlagsQrResponse | kFlagsAa);
    compressed.AddAnswer(MakePointerRecord("_http._tcp.local.", kDnsOtherTtl, "first._http._tcp.local."));
    compressed.AddAnswer(MakePointerRecord("_http._tcp.local.", kDnsOtherTtl, "second._http._tcp.local."));
    const auto packet = compressed.Packets().at(0);

    // Each name after the first costs its own label plus a two byte pointer
    EXPECT_LT(packet.size(), 100u);

    const IncomingMessage parsed(packet);
    ASSERT_TRUE(parsed.Valid()) << parsed.Error();
    ASSERT_EQ(parsed.Answers().size(), 2u);
    EXPECT_EQ(std::get<PointerRecord>(parsed.Answers()[0]).alias, "first._http._tcp.local.");
    EXPECT_EQ(std::get<PointerRecord>(parsed.Answers()[1]).alias, "second._http._tcp.local.");
}

TEST(NamesTest, AnswerPayloadsSurviveTheWire)
{
    HostInfoRecord hinfo;
    hinfo.header.name = "host.local.";
    hinfo.header.type = kTypeHinfo;
    hinfo.header.unique = true;
    hinfo.header.ttl = kDnsHostTtl;
    hinfo.cpu = "ARM64";
    hinfo.os = "Linux";

    OutgoingMessage out(kFlagsQrResponse | kFlagsAa);
    out.AddAnswer(MakeServiceRecord("svc._http._tcp.local.", kDnsHostTtl, 1, 2, 8080, "host.local."), 77);
    out.AddAnswer(MakeTextRecord("svc._http._tcp.local.", kDnsOtherTtl, std::string("\x05" "a=b c")));
    out.AddAnswer(MakeTextRecord("empty._http._tcp.local.", kDnsOtherTtl, ""));
    out.AddAnswer(MakeAddressRecord("host.local.", kDnsHostTtl, *ParseAddress("192.168.1.20")));
    out.AddAnswer(MakeAddressRecord("host.local.", kDnsHostTtl, *ParseAddress("fe80::1")));
    out.AddAnswer(hinfo);

    const auto packets = out.Packets();
    ASSERT_EQ(packets.size(), 1u);
    const IncomingMessage parsed(packets[0]);
    ASSERT_TRUE(parsed.Valid()) << parsed.Error();
    ASSERT_EQ(parsed.Answers().size(), 6u);

    const auto& srv = std::get<ServiceRecord>(parsed.Answers()[0]);
    EXPECT_EQ(srv.header.name, "svc._http._tcp.local.");
    EXPECT_EQ(srv.header.ttl, 77u);
    EXPECT_TRUE(srv.header.unique);
    EXPECT_EQ(srv.priority, 1);
    EXPECT_EQ(srv.weight, 2);
    EXPECT_EQ(srv.port, 8080);
    EXPECT_EQ(srv.server, "host.local.");

    const auto& txt = std::get<TextRecord>(parsed.Answers()[1]);
    EXPECT_EQ(txt.header.ttl, kDnsOtherTtl);
    EXPECT_EQ(txt.text, std::string("\x05" "a=b c"));

    const auto& empty = std::get<TextRecord>(parsed.Answers()[2]);
    EXPECT_EQ(empty.header.name, "empty._http._tcp.local.");
    EXPECT_TRUE(empty.text.empty());

    const auto& ipv4 = std::get<AddressRecord>(parsed.Answers()[3]);
    EXPECT_EQ(ipv4.header.type, kTypeA);
    EXPECT_EQ(ipv4.header.ttl, kDnsHostTtl);
    EXPECT_EQ(AddressToString(ipv4.address), "192.168.1.20");

    const auto& ipv6 = std::get<AddressRecord>(parsed.Answers()[4]);
    EXPECT_EQ(ipv6.header.type, kTypeAaaa);
    EXPECT_EQ(AddressToString(ipv6.address), "fe80::1");

    const auto& host = std::get<HostInfoRecord>(parsed.Answers()[5]);
    EXPECT_EQ(host.header.name, "host.local.");
    EXPECT_EQ(host.cpu, "ARM64");
    EXPECT_EQ(host.os, "Linux");
}

TEST(NamesTest, ForwardPointerIsRejected)
{
    // Header with one question whose name is a pointer to itself
    const std::vector<std::uint8_t> packet = {
        0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0xC0, 0x0C, 0x00, 0x21, 0x00, 0x01,
    };
    const IncomingMessage parsed(packet);
    EXPECT_FALSE(parsed.Valid());
}

TEST(NamesTest, TruncatedPacketIsRejected)
{
    const std::vector<std::uint8_t> packet = {0x00, 0x00, 0x84, 0x00, 0x00, 0x00, 0x00, 0x01};
    const IncomingMessage parsed(packet);
    EXPECT_FALSE(parsed.Valid());
}
