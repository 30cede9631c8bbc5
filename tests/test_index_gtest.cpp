// ==============================================================================
// test_index_gtest.cpp - Тесты группировки записей (GoogleTest)
// ==============================================================================

#include "domaindump/index.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace domaindump::index::test {

namespace {

Entity make_computer(const std::string& cn, const char* os) {
    Entity computer("CN=" + cn + ",CN=Computers,DC=corp,DC=local");
    computer.set("cn", Value(cn));
    if (os != nullptr) {
        computer.set("operatingSystem", Value(os));
    }
    return computer;
}

Entity make_user(const std::string& cn, std::vector<std::string> member_of,
                 std::int64_t primary_group) {
    Entity user("CN=" + cn + ",CN=Users,DC=corp,DC=local");
    user.set("cn", Value(cn));
    if (!member_of.empty()) {
        user.set("memberOf", Value::make_list(std::move(member_of)));
    }
    user.set("primaryGroupID", Value::make_int(primary_group));
    return user;
}

identity::RidMap make_rid_map() {
    identity::RidMap map;
    map.names[513] = "Domain Users";
    map.names[512] = "Domain Admins";
    return map;
}

}  // anonymous namespace

// ==============================================================================
// GroupedEntities
// ==============================================================================

TEST(IndexTest, Grouped_KeysInFirstSeenOrder) {
    GroupedEntities g;
    g.add("b", 0);
    g.add("a", 1);
    g.add("b", 2);

    ASSERT_EQ(g.size(), 2u);
    EXPECT_EQ(g.groups()[0].key, "b");
    EXPECT_EQ(g.groups()[1].key, "a");
    EXPECT_EQ(g.groups()[0].members, (std::vector<std::size_t>{0, 2}));
    EXPECT_EQ(g.total_members(), 3u);
    EXPECT_EQ(g.find("c"), nullptr);
}

// ==============================================================================
// Компьютеры по ОС
// ==============================================================================

TEST(IndexTest, GroupByOs_Scenario) {
    std::vector<Entity> computers = {
        make_computer("ws1", "Windows 10 Pro"),
        make_computer("dc1", "Windows Server 2019 Standard"),
        make_computer("ws2", "Windows 10 Pro"),
        make_computer("nas", nullptr),
    };

    GroupedEntities g = group_by_os(computers);

    ASSERT_EQ(g.size(), 3u);
    EXPECT_EQ(g.groups()[0].key, "Windows 10 Pro");
    EXPECT_EQ(g.groups()[0].members, (std::vector<std::size_t>{0, 2}));
    EXPECT_EQ(g.groups()[1].key, "Windows Server 2019 Standard");
    ASSERT_NE(g.find(UNKNOWN_KEY), nullptr);
    EXPECT_EQ(g.find(UNKNOWN_KEY)->members, (std::vector<std::size_t>{3}));
    EXPECT_EQ(g.total_members(), computers.size());
}

TEST(IndexTest, GroupByOs_Empty) {
    EXPECT_TRUE(group_by_os({}).empty());
}

// ==============================================================================
// Пользователи по группам
// ==============================================================================

TEST(IndexTest, Membership_MemberOfAndPrimary) {
    std::vector<Entity> users = {
        make_user("alice", {"CN=Domain Admins,CN=Users,DC=corp,DC=local",
                            "CN=IT,OU=Groups,DC=corp,DC=local"},
                  513),
        make_user("bob", {}, 513),
    };

    Membership m = group_by_membership(users, make_rid_map());

    EXPECT_TRUE(m.faults.empty());
    ASSERT_EQ(m.groups.size(), 3u);
    EXPECT_EQ(m.groups.groups()[0].key, "Domain Admins");
    EXPECT_EQ(m.groups.groups()[1].key, "IT");
    EXPECT_EQ(m.groups.groups()[2].key, "Domain Users");
    EXPECT_EQ(m.groups.find("Domain Users")->members, (std::vector<std::size_t>{0, 1}));
}

TEST(IndexTest, Membership_EachUserAppearsOncePerGroup) {
    std::vector<Entity> users = {
        make_user("alice", {"CN=A,DC=x", "CN=B,DC=x"}, 513),
        make_user("bob", {"CN=A,DC=x"}, 512),
        make_user("carol", {}, 513),
    };

    Membership m = group_by_membership(users, make_rid_map());

    // memberOf + одна primary group на пользователя
    std::size_t bound = 0;
    for (const auto& u : users) {
        bound += u.strings("memberOf").value_or(std::vector<std::string>{}).size() + 1;
    }
    EXPECT_EQ(m.groups.total_members(), bound);

    for (std::size_t i = 0; i < users.size(); ++i) {
        std::size_t appearances = 0;
        for (const auto& g : m.groups.groups()) {
            for (std::size_t member : g.members) {
                if (member == i) {
                    ++appearances;
                }
            }
        }
        EXPECT_GE(appearances, 1u);
        EXPECT_LE(appearances,
                  users[i].strings("memberOf").value_or(std::vector<std::string>{}).size() + 1);
    }
}

TEST(IndexTest, Membership_UnresolvedPrimary_UnknownPolicy) {
    std::vector<Entity> users = {make_user("eve", {"CN=A,DC=x"}, 1234)};

    Membership m = group_by_membership(users, make_rid_map(), UnresolvedGroupPolicy::Unknown);

    ASSERT_EQ(m.faults.size(), 1u);
    EXPECT_EQ(m.faults[0].kind, MembershipFaultKind::UnresolvedPrimaryGroup);
    EXPECT_EQ(m.faults[0].primary_group_id, 1234);
    EXPECT_NE(m.faults[0].message().find("1234"), std::string::npos);
    ASSERT_NE(m.groups.find(UNKNOWN_KEY), nullptr);
    EXPECT_EQ(m.groups.find(UNKNOWN_KEY)->members, (std::vector<std::size_t>{0}));
}

TEST(IndexTest, Membership_UnresolvedPrimary_SkipPolicy) {
    std::vector<Entity> users = {make_user("eve", {"CN=A,DC=x"}, 1234)};

    Membership m = group_by_membership(users, make_rid_map(), UnresolvedGroupPolicy::Skip);

    ASSERT_EQ(m.faults.size(), 1u);
    EXPECT_EQ(m.groups.find(UNKNOWN_KEY), nullptr);
    ASSERT_EQ(m.groups.size(), 1u);
    EXPECT_EQ(m.groups.groups()[0].key, "A");
}

TEST(IndexTest, Membership_MissingPrimaryGroupId) {
    Entity user("CN=svc,CN=Users,DC=corp,DC=local");
    user.set("cn", Value("svc"));
    std::vector<Entity> users = {user};

    Membership m = group_by_membership(users, make_rid_map());

    ASSERT_EQ(m.faults.size(), 1u);
    EXPECT_EQ(m.faults[0].kind, MembershipFaultKind::MissingPrimaryGroupId);
    EXPECT_NE(m.groups.find(UNKNOWN_KEY), nullptr);
}

}  // namespace domaindump::index::test
