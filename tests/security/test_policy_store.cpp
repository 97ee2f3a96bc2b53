#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

#include "execbox/security/policy_store.hpp"

using namespace execbox;
using namespace execbox::security;

namespace {

auto policy_with(std::vector<std::string> commands) -> std::shared_ptr<const SecurityPolicy> {
    auto config = default_policy_config();
    config.allowed_commands = std::move(commands);
    auto policy = SecurityPolicy::create(config);
    REQUIRE(policy.has_value());
    return std::make_shared<const SecurityPolicy>(std::move(*policy));
}

struct TempDir {
    std::filesystem::path path;

    TempDir() : path(std::filesystem::temp_directory_path() / "execbox_test_store") {
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

} // anonymous namespace

TEST_CASE("PolicyStore hands out the installed policy", "[security][policy_store]") {
    auto initial = policy_with({"Get-Date"});
    PolicyStore store(initial);
    CHECK(store.current() == initial);
}

TEST_CASE("PolicyStore replace swaps the whole policy", "[security][policy_store]") {
    PolicyStore store(policy_with({"Get-Date"}));
    auto snapshot = store.current();

    store.replace(policy_with({"Get-Process"}));

    CHECK(store.current()->is_command_allowed("Get-Process"));
    CHECK_FALSE(store.current()->is_command_allowed("Get-Date"));
    // A snapshot taken earlier keeps its rules.
    CHECK(snapshot->is_command_allowed("Get-Date"));
}

TEST_CASE("PolicyStore ignores a null policy", "[security][policy_store]") {
    auto initial = policy_with({"Get-Date"});
    PolicyStore store(initial);
    store.replace(nullptr);
    CHECK(store.current() == initial);
}

TEST_CASE("PolicyStore reload", "[security][policy_store]") {
    TempDir dir;
    auto path = dir.path / "config.json";
    PolicyStore store(policy_with({"Get-Date"}));

    SECTION("a valid file replaces the policy") {
        auto config = default_config();
        config.policy.allowed_commands = {"Get-Service"};
        REQUIRE(save_config(config, path).has_value());

        REQUIRE(store.reload(path).has_value());
        CHECK(store.current()->is_command_allowed("Get-Service"));
    }

    SECTION("an invalid file keeps the current policy") {
        {
            std::ofstream out(path);
            out << R"({"allowed_commands": ["Get-Service"]})";
        }
        auto before = store.current();

        auto result = store.reload(path);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::InvalidConfig);
        CHECK(store.current() == before);
    }

    SECTION("a missing file keeps the current policy") {
        auto before = store.current();
        CHECK_FALSE(store.reload(dir.path / "missing.json").has_value());
        CHECK(store.current() == before);
    }
}
