// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "foreign_runtime.hpp"
#include "testpkg.hpp"

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace npbindtest {

std::shared_ptr<ForeignRuntime> foreign;
npbind::Bridge* bridge;
std::shared_ptr<testpkg::Package> package;
npbind::handle_t package_handle = npbind::null_handle;

inline std::filesystem::path assets_dir()
{
    return std::filesystem::temp_directory_path() / "npbind_test_assets";
}

// Google Test Environment for setup and teardown
class NpbindTestEnvironment : public ::testing::Environment
{
public:
    void SetUp() override
    {
        std::filesystem::create_directories(assets_dir());
        std::ofstream(assets_dir() / "hello.txt") << "Hello, Assets.\n";

        try {
            testpkg::register_capabilities();

            foreign = std::make_shared<ForeignRuntime>();
            bridge = npbind::BridgeBuilder()
                         .set_log_level(npbind::LogLevel::warn)
                         .set_max_handles(1024 * 64)
                         .set_transport(foreign)
                         .build();

            package = std::make_shared<testpkg::Package>(
                std::make_shared<npbind::FileAssetSource>(assets_dir()));
            package_handle = bridge->pin(package).value();
        } catch (npbind::Exception& ex) {
            FAIL() << "Failed to initialize the bridge: " << ex.what();
        }
    }

    void TearDown() override
    {
        if (bridge) {
            bridge->destroy();
            bridge = nullptr;
        }
        package.reset();
        // joins the foreign threads, late completions run before this returns
        foreign.reset();

        std::error_code ec;
        std::filesystem::remove_all(assets_dir(), ec);
    }
};

// Test fixture class for shared functionality
class NpbindTest : public ::testing::Test
{
protected:
    // Calls a package function the way the foreign side does
    FValues call_package(std::string_view method, const FValues& args = {})
    {
        return foreign->call(package_handle,
                             "testpkg.Package."s + std::string(method), args);
    }

    FReply try_call_package(std::string_view method, const FValues& args = {})
    {
        return foreign->call_host(package_handle,
                                  "testpkg.Package."s + std::string(method), args);
    }

    // Host handle returned in a reply
    static npbind::handle_t host_ref(const FValues& values, std::size_t ix)
    {
        auto& ref = fget<npbind::WireRef>(values, ix);
        EXPECT_EQ(ref.kind, npbind::RefKind::Host);
        return ref.value;
    }
};

} // namespace npbindtest
