#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

#include "execbox/security/policy.hpp"

using namespace execbox;
using namespace execbox::security;

namespace {

auto base_config() -> PolicyConfig {
    PolicyConfig config;
    config.allowed_commands = {"Get-Date", "Get-ChildItem"};
    config.allowed_directories = {"C:\\Users\\Public*", "C:\\Data"};
    config.blocked_patterns = {
        {R"([;&|`])", std::nullopt},
        {"Remove-Item", std::nullopt},
        {R"(\.ps1)", std::string("custom label")},
    };
    config.max_command_length = 200;
    config.timeout_seconds = 30;
    return config;
}

} // anonymous namespace

TEST_CASE("SecurityPolicy::create builds a valid policy", "[security][policy]") {
    auto policy = SecurityPolicy::create(base_config());
    REQUIRE(policy.has_value());

    CHECK(policy->allowed_commands().size() == 2);
    CHECK(policy->allowed_directories().size() == 2);
    CHECK(policy->directory_rules().size() == 2);
    CHECK(policy->blocked_patterns().size() == 3);
    CHECK(policy->max_command_length() == 200);
    CHECK(policy->timeout_seconds() == 30);
}

TEST_CASE("SecurityPolicy::create rejects bad rules", "[security][policy]") {
    SECTION("invalid regex") {
        auto config = base_config();
        config.blocked_patterns.push_back({"([unclosed", std::nullopt});
        auto policy = SecurityPolicy::create(config);
        REQUIRE_FALSE(policy.has_value());
        CHECK(policy.error().code() == ErrorCode::InvalidConfig);
    }

    SECTION("relative directory") {
        auto config = base_config();
        config.allowed_directories.push_back("Users\\Public*");
        auto policy = SecurityPolicy::create(config);
        REQUIRE_FALSE(policy.has_value());
        CHECK(policy.error().code() == ErrorCode::InvalidConfig);
    }

    SECTION("non-positive limits") {
        auto config = base_config();
        config.timeout_seconds = 0;
        CHECK_FALSE(SecurityPolicy::create(config).has_value());
    }
}

TEST_CASE("command membership ignores case", "[security][policy]") {
    auto policy = SecurityPolicy::create(base_config());
    REQUIRE(policy.has_value());

    CHECK(policy->is_command_allowed("Get-Date"));
    CHECK(policy->is_command_allowed("get-date"));
    CHECK(policy->is_command_allowed("GET-CHILDITEM"));
    CHECK_FALSE(policy->is_command_allowed("Get-Dat"));
    CHECK_FALSE(policy->is_command_allowed("Stop-Computer"));
}

TEST_CASE("find_blocked_pattern searches the whole string in order", "[security][policy]") {
    auto policy = SecurityPolicy::create(base_config());
    REQUIRE(policy.has_value());

    SECTION("no match") {
        CHECK(policy->find_blocked_pattern("Get-Date") == nullptr);
    }

    SECTION("case-insensitive match anywhere") {
        const auto* hit = policy->find_blocked_pattern("Get-ChildItem | remove-item x");
        REQUIRE(hit != nullptr);
        // The separator pattern comes first.
        CHECK(hit->label == "command separator");
    }

    SECTION("explicit label is kept") {
        const auto* hit = policy->find_blocked_pattern("Get-Content run.PS1");
        REQUIRE(hit != nullptr);
        CHECK(hit->label == "custom label");
    }
}

TEST_CASE("classify_blocked_pattern derives a class name", "[security][policy]") {
    CHECK(classify_blocked_pattern(R"([;&|`])") == "command separator");
    CHECK(classify_blocked_pattern("Invoke-Expression") == "dangerous cmdlet");
    CHECK(classify_blocked_pattern(R"(iex\s)") == "dangerous cmdlet");
    CHECK(classify_blocked_pattern(R"(\.ps1)") == "script extension");
    CHECK(classify_blocked_pattern(R"(\.bat)") == "script extension");
    CHECK(classify_blocked_pattern(R"(\.exe)") == "executable extension");
    CHECK(classify_blocked_pattern(R"(powershell\.exe)") == "nested interpreter");
    CHECK(classify_blocked_pattern(R"(cmd\.exe)") == "nested interpreter");
    CHECK(classify_blocked_pattern(R"(\$\()") == "blocked pattern");
}

TEST_CASE("the default policy compiles", "[security][policy]") {
    auto policy = SecurityPolicy::create(default_policy_config());
    REQUIRE(policy.has_value());
    CHECK(policy->blocked_patterns().size() == 19);
}

TEST_CASE("load_policy reads a config file", "[security][policy]") {
    auto dir = std::filesystem::temp_directory_path() / "execbox_test_policy";
    std::filesystem::create_directories(dir);
    auto path = dir / "config.json";

    auto config = default_config();
    config.policy.allowed_commands = {"Get-Date"};
    REQUIRE(save_config(config, path).has_value());

    auto policy = load_policy(path);
    REQUIRE(policy.has_value());
    REQUIRE(*policy != nullptr);
    CHECK((*policy)->allowed_commands() == std::vector<std::string>{"Get-Date"});

    std::filesystem::remove_all(dir);
}
