// ==============================================================================
// test_dumper_gtest.cpp - Тесты прогона и записи отчётов (GoogleTest)
// ==============================================================================
//
// Каталог и DNS подменяются фейками; отчёты пишутся во временный каталог.
//
// ==============================================================================

#include "domaindump/dumper.hpp"
#include "domaindump/platform.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <map>
#include <rapidjson/document.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace domaindump::dump::test {

namespace {

const std::string ROOT = "DC=corp,DC=local";

Entity make_group(const std::string& cn, const std::string& sid) {
    Entity group("CN=" + cn + ",CN=Users," + ROOT);
    group.set("cn", Value(cn));
    group.set("sAMAccountName", Value(cn));
    group.set("objectSid", Value(sid));
    return group;
}

Entity make_user(const std::string& cn, std::vector<std::string> member_of,
                 std::int64_t primary_group) {
    Entity user("CN=" + cn + ",CN=Users," + ROOT);
    user.set("cn", Value(cn));
    user.set("sAMAccountName", Value(cn));
    if (!member_of.empty()) {
        user.set("memberOf", Value::make_list(std::move(member_of)));
    }
    user.set("primaryGroupID", Value::make_int(primary_group));
    user.set("userAccountControl", Value::make_int(0x200));
    return user;
}

Entity make_computer(const std::string& cn, const char* host, const char* os) {
    Entity computer("CN=" + cn + ",CN=Computers," + ROOT);
    computer.set("cn", Value(cn));
    if (host != nullptr) {
        computer.set("dNSHostName", Value(host));
    }
    if (os != nullptr) {
        computer.set("operatingSystem", Value(os));
    }
    return computer;
}

class FakeDirectory : public directory::DirectorySource {
public:
    std::vector<Entity> users;
    std::vector<Entity> computers;
    std::vector<Entity> groups;
    std::vector<Entity> policy;

    std::vector<std::pair<std::string, std::string>> searches;
    int naming_context_calls = 0;
    std::string fail_on_filter;

    std::string default_naming_context() override {
        ++naming_context_calls;
        return ROOT;
    }

    std::vector<Entity> search(const std::string& base, const std::string& filter) override {
        searches.emplace_back(base, filter);
        if (filter == fail_on_filter) {
            throw directory::DirectoryError(directory::ErrorKind::Search,
                                            "search failed: Operations error (0x01)");
        }
        if (filter == USERS_FILTER) {
            return users;
        }
        if (filter == COMPUTERS_FILTER) {
            return computers;
        }
        if (filter == GROUPS_FILTER) {
            return groups;
        }
        if (filter == POLICY_FILTER) {
            return policy;
        }
        return {};
    }
};

class FakeResolver : public resolver::HostResolver {
public:
    std::map<std::string, resolver::ResolveResult> answers;
    std::atomic<int> calls{0};

    resolver::ResolveResult resolve_a(const std::string& host) override {
        ++calls;
        auto it = answers.find(host);
        if (it == answers.end()) {
            return {resolver::ResolveStatus::NxDomain, {}};
        }
        return it->second;
    }
};

FakeDirectory sample_directory() {
    FakeDirectory dir;
    dir.groups = {make_group("Domain Users", "S-1-5-21-1-2-3-513"),
                  make_group("Domain Admins", "S-1-5-21-1-2-3-512")};
    dir.users = {make_user("alice", {"CN=Domain Admins,CN=Users," + ROOT}, 513),
                 make_user("bob", {}, 513)};
    dir.computers = {make_computer("ws1", "ws1.corp.local", "Windows 10 Pro"),
                     make_computer("dc1", "dc1.corp.local", "Windows Server 2019 Standard"),
                     make_computer("ws2", "ws2.corp.local", "Windows 10 Pro")};
    Entity builtin("CN=Builtin," + ROOT);
    builtin.set("cn", Value("Builtin"));
    builtin.set("maxPwdAge", Value::make_int(-36288000000000LL));
    builtin.set("pwdProperties", Value::make_int(1));
    dir.policy = {builtin};
    return dir;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

class DumperTest : public ::testing::Test {
protected:
    void SetUp() override {
        tmp_ = platform::make_temp_dir("domaindump_dumper");
        config_.basepath = platform::path_to_utf8(tmp_ / "out");
        config_.stylesheet = DOMAINDUMP_TEST_STYLESHEET;
    }

    void TearDown() override { std::filesystem::remove_all(tmp_); }

    std::filesystem::path out() const { return tmp_ / "out"; }

    std::filesystem::path tmp_;
    config::DumpConfig config_;
    output::OutputConfig out_cfg_{true, 0, true};
    output::Writer writer_{out_cfg_};
};

}  // anonymous namespace

// ==============================================================================
// Столбцы и пул потоков
// ==============================================================================

TEST(DumperColumnsTest, ComputerColumns_Ipv4AfterHostname) {
    auto plain = computer_columns(false);
    auto with_ip = computer_columns(true);

    EXPECT_EQ(with_ip.size(), plain.size() + 1);
    auto host = std::find(with_ip.begin(), with_ip.end(), "dNSHostName");
    ASSERT_NE(host, with_ip.end());
    ASSERT_NE(host + 1, with_ip.end());
    EXPECT_EQ(*(host + 1), IPV4_ATTRIBUTE);
    EXPECT_EQ(std::find(plain.begin(), plain.end(), IPV4_ATTRIBUTE), plain.end());
}

TEST(DumperColumnsTest, ComputersBase) {
    EXPECT_EQ(computers_base(ROOT), "CN=Computers,DC=corp,DC=local");
}

TEST(DumperColumnsTest, WorkerCount_Bounds) {
    EXPECT_EQ(worker_count(4, 100), 4u);
    EXPECT_EQ(worker_count(8, 3), 3u);
    EXPECT_EQ(worker_count(4, 0), 1u);
    EXPECT_GE(worker_count(0, 100), 1u);
    EXPECT_LE(worker_count(0, 2), 2u);
}

// ==============================================================================
// Разрешение имён
// ==============================================================================

TEST(ResolveHostnamesTest, Sentinels) {
    std::vector<Entity> computers = {
        make_computer("ok", "ok.corp.local", nullptr),
        make_computer("gone", "gone.corp.local", nullptr),
        make_computer("slow", "slow.corp.local", nullptr),
        make_computer("bare", nullptr, nullptr),
    };
    FakeResolver dns;
    dns.answers["ok.corp.local"] = {resolver::ResolveStatus::Ok, "10.0.0.5"};
    dns.answers["slow.corp.local"] = {resolver::ResolveStatus::Timeout, {}};

    ResolveStats stats = resolve_hostnames(computers, dns, 1);

    EXPECT_EQ(computers[0].first_string(IPV4_ATTRIBUTE), "10.0.0.5");
    EXPECT_EQ(computers[1].first_string(IPV4_ATTRIBUTE), resolver::SENTINEL_NXDOMAIN);
    EXPECT_EQ(computers[2].first_string(IPV4_ATTRIBUTE), resolver::SENTINEL_TIMEOUT);
    EXPECT_EQ(computers[3].first_string(IPV4_ATTRIBUTE), resolver::SENTINEL_NOHOSTNAME);
    EXPECT_EQ(stats.resolved, 1u);
    EXPECT_EQ(stats.nxdomain, 1u);
    EXPECT_EQ(stats.timeout, 1u);
    EXPECT_EQ(stats.no_hostname, 1u);
    EXPECT_EQ(dns.calls.load(), 3);
}

TEST(ResolveHostnamesTest, ThreadPool_EveryComputerOnce) {
    std::vector<Entity> computers;
    FakeResolver dns;
    for (int i = 0; i < 200; ++i) {
        std::string host = "host" + std::to_string(i) + ".corp.local";
        computers.push_back(make_computer("host" + std::to_string(i), host.c_str(), nullptr));
        dns.answers[host] = {resolver::ResolveStatus::Ok, "10.0.1." + std::to_string(i)};
    }

    ResolveStats stats = resolve_hostnames(computers, dns, 8);

    EXPECT_EQ(stats.resolved, computers.size());
    EXPECT_EQ(dns.calls.load(), 200);
    for (int i = 0; i < 200; ++i) {
        EXPECT_EQ(computers[static_cast<std::size_t>(i)].first_string(IPV4_ATTRIBUTE),
                  "10.0.1." + std::to_string(i));
    }
}

TEST(ResolveHostnamesTest, Empty) {
    std::vector<Entity> computers;
    FakeResolver dns;
    ResolveStats stats = resolve_hostnames(computers, dns, 4);
    EXPECT_EQ(stats.resolved + stats.nxdomain + stats.timeout + stats.no_hostname, 0u);
}

TEST(DumperThreadsTest, ThreadGroup_JoinsAll) {
    std::atomic<int> done{0};
    ThreadGroup group;
    for (int i = 0; i < 4; ++i) {
        group.spawn([&done] { ++done; });
    }
    EXPECT_EQ(group.size(), 4u);

    group.join();

    EXPECT_EQ(done.load(), 4);
}

TEST(DumperThreadsTest, ThreadGroup_JoinsWhenUnwinding) {
    std::atomic<int> done{0};
    try {
        ThreadGroup group;
        group.spawn([&done] {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            ++done;
        });
        // Сбой посреди запуска потоков
        throw std::runtime_error("cannot create thread");
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "cannot create thread");
    }
    EXPECT_EQ(done.load(), 1);
}

// ==============================================================================
// Полный прогон
// ==============================================================================

TEST_F(DumperTest, Run_WritesAllReports) {
    FakeDirectory dir = sample_directory();
    DomainDumper dumper(dir, nullptr, config_, writer_);

    DumpSummary summary = dumper.run();

    EXPECT_EQ(summary.root, ROOT);
    EXPECT_EQ(summary.warnings, 0u);
    for (const char* name : {"domain_users", "domain_groups", "domain_computers", "domain_policy"}) {
        for (const char* ext : {".html", ".json", ".grep"}) {
            EXPECT_TRUE(std::filesystem::exists(out() / (std::string(name) + ext)))
                << name << ext;
        }
    }
    for (const char* name : {"domain_users_by_group", "domain_computers_by_os"}) {
        EXPECT_TRUE(std::filesystem::exists(out() / (std::string(name) + ".html")));
        EXPECT_TRUE(std::filesystem::exists(out() / (std::string(name) + ".json")));
        EXPECT_FALSE(std::filesystem::exists(out() / (std::string(name) + ".grep")));
    }

    ASSERT_EQ(summary.reports.size(), 6u);
    EXPECT_EQ(summary.reports[0].name, "domain_users");
    EXPECT_EQ(summary.reports[0].entries, 2u);
    EXPECT_EQ(summary.reports[3].name, "domain_users_by_group");
    EXPECT_EQ(summary.reports[3].entries, 3u);  // alice x2, bob x1
    EXPECT_EQ(summary.reports[4].name, "domain_computers_by_os");
    EXPECT_EQ(summary.reports[4].entries, 3u);
    EXPECT_EQ(summary.reports[5].name, "domain_policy");
}

TEST_F(DumperTest, Run_SearchOrderAndBases) {
    FakeDirectory dir = sample_directory();
    DomainDumper dumper(dir, nullptr, config_, writer_);
    dumper.run();

    ASSERT_EQ(dir.searches.size(), 4u);
    EXPECT_EQ(dir.searches[0], std::make_pair(ROOT, std::string(USERS_FILTER)));
    EXPECT_EQ(dir.searches[1], std::make_pair(computers_base(ROOT), std::string(COMPUTERS_FILTER)));
    EXPECT_EQ(dir.searches[2], std::make_pair(ROOT, std::string(GROUPS_FILTER)));
    EXPECT_EQ(dir.searches[3], std::make_pair(ROOT, std::string(POLICY_FILTER)));
    EXPECT_EQ(dir.naming_context_calls, 1);
}

TEST_F(DumperTest, Run_BaseDnOverridesNamingContext) {
    FakeDirectory dir = sample_directory();
    config_.base_dn = "OU=Branch,DC=corp,DC=local";
    DomainDumper dumper(dir, nullptr, config_, writer_);

    DumpSummary summary = dumper.run();

    EXPECT_EQ(summary.root, "OU=Branch,DC=corp,DC=local");
    EXPECT_EQ(dir.naming_context_calls, 0);
    EXPECT_EQ(dir.searches[0].first, "OU=Branch,DC=corp,DC=local");
}

TEST_F(DumperTest, Run_ReportContents) {
    FakeDirectory dir = sample_directory();
    DomainDumper dumper(dir, nullptr, config_, writer_);
    dumper.run();

    std::string users_html = read_file(out() / "domain_users.html");
    EXPECT_NE(users_html.find("href=\"domain_users_by_group.html#cn_Domain_Admins\""),
              std::string::npos);
    EXPECT_NE(users_html.find("<style type=\"text/css\">"), std::string::npos);

    std::string by_group = read_file(out() / "domain_users_by_group.html");
    EXPECT_NE(by_group.find("id=\"cn_Domain_Admins\""), std::string::npos);
    EXPECT_NE(by_group.find("id=\"cn_Domain_Users\""), std::string::npos);

    rapidjson::Document users_json;
    users_json.Parse(read_file(out() / "domain_users.json").c_str());
    ASSERT_FALSE(users_json.HasParseError());
    ASSERT_TRUE(users_json.IsArray());
    EXPECT_EQ(users_json.Size(), 2u);

    std::string policy_grep = read_file(out() / "domain_policy.grep");
    EXPECT_NE(policy_grep.find("42.00 days"), std::string::npos);
    EXPECT_NE(policy_grep.find("PASSWORD_COMPLEX"), std::string::npos);
}

TEST_F(DumperTest, Run_ListReportsHaveTitleRow) {
    FakeDirectory dir = sample_directory();
    DomainDumper dumper(dir, nullptr, config_, writer_);
    dumper.run();

    std::string users_html = read_file(out() / "domain_users.html");
    EXPECT_NE(users_html.find("id=\"cn_Domain_users\">Domain users</td>"), std::string::npos);
    EXPECT_NE(read_file(out() / "domain_groups.html").find("id=\"cn_Domain_groups\""),
              std::string::npos);
    EXPECT_NE(read_file(out() / "domain_computers.html")
                  .find("id=\"cn_Domain_computer_accounts\""),
              std::string::npos);
    EXPECT_NE(read_file(out() / "domain_policy.html").find("id=\"cn_Domain_policy\""),
              std::string::npos);

    // Заголовок секции не попадает в grep
    std::string grep = read_file(out() / "domain_users.grep");
    EXPECT_EQ(grep.find("Domain users"), std::string::npos);
}

TEST_F(DumperTest, Run_CustomDelimiterAndDisabledFormats) {
    FakeDirectory dir = sample_directory();
    config_.output_html = false;
    config_.output_json = false;
    config_.grep_delimiter = "|";
    DomainDumper dumper(dir, nullptr, config_, writer_);

    DumpSummary summary = dumper.run();

    EXPECT_FALSE(std::filesystem::exists(out() / "domain_users.html"));
    EXPECT_FALSE(std::filesystem::exists(out() / "domain_users.json"));
    std::string grep = read_file(out() / "domain_users.grep");
    EXPECT_EQ(grep.rfind("cn|name|sAMAccountName|", 0), 0u);
    EXPECT_TRUE(summary.reports[3].files.empty());
}

TEST_F(DumperTest, Run_FetchFailureWritesNothing) {
    FakeDirectory dir = sample_directory();
    dir.fail_on_filter = GROUPS_FILTER;
    DomainDumper dumper(dir, nullptr, config_, writer_);

    EXPECT_THROW(dumper.run(), directory::DirectoryError);
    EXPECT_FALSE(std::filesystem::exists(out()));
}

TEST_F(DumperTest, Run_UnresolvedPrimaryGroupIsWarning) {
    FakeDirectory dir = sample_directory();
    dir.users.push_back(make_user("eve", {}, 4242));
    DomainDumper dumper(dir, nullptr, config_, writer_);

    DumpSummary summary = dumper.run();

    EXPECT_EQ(summary.warnings, 1u);
    std::string json = read_file(out() / "domain_users_by_group.json");
    EXPECT_NE(json.find("\"Unknown\""), std::string::npos);
}

TEST_F(DumperTest, Run_SkipPolicyLeavesNoUnknownKey) {
    FakeDirectory dir = sample_directory();
    dir.users.push_back(make_user("eve", {}, 4242));
    config_.unresolved_group = index::UnresolvedGroupPolicy::Skip;
    DomainDumper dumper(dir, nullptr, config_, writer_);

    DumpSummary summary = dumper.run();

    EXPECT_EQ(summary.warnings, 1u);
    std::string json = read_file(out() / "domain_users_by_group.json");
    EXPECT_EQ(json.find("\"Unknown\""), std::string::npos);
}

TEST_F(DumperTest, Run_MissingStylesheetIsWarning) {
    FakeDirectory dir = sample_directory();
    config_.stylesheet = platform::path_to_utf8(tmp_ / "missing.css");
    DomainDumper dumper(dir, nullptr, config_, writer_);

    DumpSummary summary = dumper.run();

    EXPECT_EQ(summary.warnings, 1u);
    std::string html = read_file(out() / "domain_users.html");
    EXPECT_EQ(html.find("<style"), std::string::npos);
}

TEST_F(DumperTest, Run_WithResolver) {
    FakeDirectory dir = sample_directory();
    dir.computers.push_back(make_computer("printer", nullptr, nullptr));
    FakeResolver dns;
    dns.answers["ws1.corp.local"] = {resolver::ResolveStatus::Ok, "10.0.0.11"};
    dns.answers["dc1.corp.local"] = {resolver::ResolveStatus::Ok, "10.0.0.1"};
    dns.answers["ws2.corp.local"] = {resolver::ResolveStatus::Timeout, {}};
    config_.lookup_hostnames = true;
    config_.num_threads = 2;
    DomainDumper dumper(dir, &dns, config_, writer_);

    DumpSummary summary = dumper.run();

    EXPECT_EQ(summary.dns.resolved, 2u);
    EXPECT_EQ(summary.dns.timeout, 1u);
    EXPECT_EQ(summary.dns.no_hostname, 1u);
    EXPECT_EQ(summary.warnings, 1u);  // таймауты

    std::string grep = read_file(out() / "domain_computers.grep");
    EXPECT_NE(grep.find("dNSHostName\tIPv4\t"), std::string::npos);
    EXPECT_NE(grep.find("10.0.0.11"), std::string::npos);
    EXPECT_NE(grep.find(resolver::SENTINEL_TIMEOUT), std::string::npos);
    EXPECT_NE(grep.find(resolver::SENTINEL_NOHOSTNAME), std::string::npos);

    std::string by_os = read_file(out() / "domain_computers_by_os.json");
    EXPECT_NE(by_os.find("\"Unknown\""), std::string::npos);
}

TEST_F(DumperTest, Constructor_RequiresResolverWhenLookupEnabled) {
    FakeDirectory dir = sample_directory();
    config_.lookup_hostnames = true;
    EXPECT_THROW({ DomainDumper dumper(dir, nullptr, config_, writer_); }, std::invalid_argument);
}

}  // namespace domaindump::dump::test
