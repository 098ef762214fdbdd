#include <algorithm>
#include <gtest/gtest.h>
#include <set>
#include "../../src/core/types/constants.hpp"
#include "../../src/network/http/header_generator.hpp"

using namespace Egress::Network::Http;

namespace {

std::string find(const Headers& headers, const std::string& name) {
    for (const auto& header : headers) {
        if (header.name == name)
            return header.value;
    }
    return "";
}

}  // namespace

TEST(HeaderGeneratorTest, DefaultAgents) {
    HeaderGenerator generator;
    EXPECT_EQ(generator.user_agents(), Egress::Core::get_default_user_agents());
}

TEST(HeaderGeneratorTest, BrowserLikeHeaderSet) {
    HeaderGenerator generator({}, 42);
    auto            headers = generator.generate();

    const auto& agents = Egress::Core::get_default_user_agents();
    EXPECT_NE(std::find(agents.begin(), agents.end(), find(headers, "User-Agent")), agents.end());
    EXPECT_FALSE(find(headers, "Accept").empty());
    EXPECT_FALSE(find(headers, "Accept-Language").empty());
    EXPECT_EQ(find(headers, "DNT"), "1");
    EXPECT_EQ(find(headers, "Upgrade-Insecure-Requests"), "1");
    EXPECT_TRUE(find(headers, "Accept-Encoding").empty());
}

TEST(HeaderGeneratorTest, CustomAgentsAreUsed) {
    HeaderGenerator generator({"agent-a", "agent-b"}, 7);
    std::set<std::string> seen;
    for (int i = 0; i < 64; ++i)
        seen.insert(find(generator.generate(), "User-Agent"));

    EXPECT_EQ(seen, (std::set<std::string>{"agent-a", "agent-b"}));
}

TEST(HeaderGeneratorTest, SameSeedSameSequence) {
    HeaderGenerator a({}, 1234);
    HeaderGenerator b({}, 1234);
    for (int i = 0; i < 10; ++i)
        EXPECT_EQ(find(a.generate(), "User-Agent"), find(b.generate(), "User-Agent"));
}
