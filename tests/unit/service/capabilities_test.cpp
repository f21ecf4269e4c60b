#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "gnb/service/capabilities.hpp"

using namespace gnb::service;

TEST(CapabilitiesTest, NameLookup) {
    EXPECT_EQ(capabilityFromName("body-markup"), Capability::BodyMarkup);
    EXPECT_EQ(capabilityFromName("inline-reply"), Capability::InlineReply);
    EXPECT_FALSE(capabilityFromName("x-vendor-thing").has_value());
    EXPECT_EQ(capabilityName(Capability::ActionIcons), "action-icons");
}

TEST(CapabilitiesTest, ParseIgnoresUnknownNames) {
    auto caps = Capabilities::parse({"actions", "x-kde-urls", "persistence", "body"});
    EXPECT_TRUE(caps.has(Capability::Actions));
    EXPECT_TRUE(caps.has(Capability::Persistence));
    EXPECT_TRUE(caps.has(Capability::Body));
    EXPECT_FALSE(caps.has(Capability::BodyMarkup));
    EXPECT_FALSE(caps.has(Capability::Sound));
}

TEST(CapabilitiesTest, EmptyByDefault) {
    Capabilities caps;
    EXPECT_EQ(caps.bits(), 0);
    EXPECT_TRUE(caps.names().empty());
}

TEST(CapabilitiesTest, NamesInDeclarationOrder) {
    Capabilities caps;
    caps.add(Capability::Actions);
    caps.add(Capability::Body);
    caps.add(Capability::Sound);
    EXPECT_EQ(caps.names(), (std::vector<std::string>{"body", "sound", "actions"}));
}

TEST(CapabilitiesTest, Equality) {
    auto a = Capabilities::parse({"body", "actions"});
    auto b = Capabilities::parse({"actions", "body", "actions"});
    EXPECT_EQ(a, b);
    b.add(Capability::Sound);
    EXPECT_NE(a.bits(), b.bits());
}
