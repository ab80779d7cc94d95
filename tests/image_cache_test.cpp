#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include "fake_runtime.hpp"
#include "sandbox/image_cache.hpp"
#include "sandbox/image_recipe.hpp"
#include "sandbox/sandbox_errors.hpp"
#include "sandbox/workspace.hpp"

using codeloop::sandbox::ImageBuildError;
using codeloop::sandbox::ImageCache;
using codeloop::sandbox::ImageDescriptor;
using codeloop::sandbox::ImageHandle;
using codeloop::test::LocalProcessRuntime;

namespace {

ImageDescriptor Descriptor(const std::string& tag) {
    return ImageDescriptor{tag, "FROM python:3.12-slim\n"};
}

}  // namespace

TEST(ImageCacheTest, ExistingImageIsNotRebuilt) {
    LocalProcessRuntime runtime;
    runtime.AddImage("py:1");
    ImageCache cache(runtime);

    const auto handle = cache.Ensure(Descriptor("py:1"));
    EXPECT_EQ(handle.tag, "py:1");
    EXPECT_FALSE(handle.built_by_this_process);
    EXPECT_EQ(runtime.Builds(), 0);
    EXPECT_EQ(cache.BuildCount(), 0u);
    EXPECT_TRUE(cache.IsReady("py:1"));
}

TEST(ImageCacheTest, MissingImageIsBuiltOnce) {
    LocalProcessRuntime runtime;
    ImageCache cache(runtime);

    const auto first = cache.Ensure(Descriptor("py:1"));
    const auto second = cache.Ensure(Descriptor("py:1"));
    EXPECT_TRUE(first.built_by_this_process);
    EXPECT_EQ(first, second);
    EXPECT_EQ(runtime.Builds(), 1);
}

TEST(ImageCacheTest, ConcurrentCallersShareOneBuild) {
    LocalProcessRuntime runtime;
    runtime.build_delay = std::chrono::milliseconds(300);
    ImageCache cache(runtime);

    constexpr int kCallers = 8;
    std::vector<ImageHandle> handles(kCallers);
    std::vector<std::thread> threads;
    for (int i = 0; i < kCallers; ++i) {
        threads.emplace_back([&cache, &handles, i]() { handles[i] = cache.Ensure(Descriptor("py:1")); });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(runtime.Builds(), 1);
    for (const auto& handle : handles) {
        EXPECT_EQ(handle, handles.front());
    }
}

TEST(ImageCacheTest, DifferentTagsBuildIndependently) {
    LocalProcessRuntime runtime;
    runtime.build_delay = std::chrono::milliseconds(300);
    ImageCache cache(runtime);

    const auto start = std::chrono::steady_clock::now();
    std::thread first([&cache]() { cache.Ensure(Descriptor("py:1")); });
    std::thread second([&cache]() { cache.Ensure(Descriptor("py:2")); });
    first.join();
    second.join();

    EXPECT_EQ(runtime.Builds(), 2);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(550));
}

TEST(ImageCacheTest, FailedBuildCarriesLogAndIsRetried) {
    LocalProcessRuntime runtime;
    runtime.failing_builds = 1;
    ImageCache cache(runtime);

    try {
        cache.Ensure(Descriptor("py:1"));
        FAIL() << "expected ImageBuildError";
    } catch (const ImageBuildError& ex) {
        EXPECT_NE(ex.BuildLog().find("no such package"), std::string::npos);
    }
    EXPECT_FALSE(cache.IsReady("py:1"));

    const auto handle = cache.Ensure(Descriptor("py:1"));
    EXPECT_EQ(handle.tag, "py:1");
    EXPECT_EQ(runtime.Builds(), 2);
    EXPECT_EQ(cache.BuildCount(), 2u);
}

TEST(ImageCacheTest, WaitersSeeTheLeadersFailure) {
    LocalProcessRuntime runtime;
    runtime.build_delay = std::chrono::milliseconds(300);
    runtime.failing_builds = 1;
    ImageCache cache(runtime);

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&cache, &failures]() {
            try {
                cache.Ensure(Descriptor("py:1"));
            } catch (const ImageBuildError&) {
                failures.fetch_add(1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // A caller arriving after the failed entry was dropped starts one new build.
    EXPECT_GE(failures.load(), 1);
    EXPECT_LE(runtime.Builds(), 2);
}

TEST(ImageCacheTest, EditedRecipeFileGetsItsOwnImage) {
    auto dir = codeloop::sandbox::Workspace::Create({}, "codeloop_recipe_");
    const auto recipe = dir.Path() / "Dockerfile";
    codeloop::config::SandboxConfig config{};
    config.image = "custom:1";
    config.recipe_path = recipe.string();

    std::ofstream(recipe, std::ios::trunc) << "FROM python:3.11-slim\n";
    const auto first = codeloop::sandbox::DescriptorFromConfig(config);
    EXPECT_EQ(first.tag.rfind("custom:1-", 0), 0u);
    EXPECT_EQ(first.tag.size(), std::string("custom:1-").size() + 12);
    EXPECT_EQ(codeloop::sandbox::DescriptorFromConfig(config).tag, first.tag);

    std::ofstream(recipe, std::ios::trunc) << "FROM python:3.12-slim\n";
    const auto second = codeloop::sandbox::DescriptorFromConfig(config);
    EXPECT_NE(second.tag, first.tag);

    LocalProcessRuntime runtime;
    ImageCache cache(runtime);
    EXPECT_TRUE(cache.Ensure(first).built_by_this_process);
    EXPECT_TRUE(cache.Ensure(second).built_by_this_process);
    EXPECT_EQ(runtime.Builds(), 2);
}

TEST(ImageCacheTest, BuiltInRecipeKeepsTheConfiguredTag) {
    codeloop::config::SandboxConfig config{};
    config.image = "prebuilt:7";
    const auto descriptor = codeloop::sandbox::DescriptorFromConfig(config);
    EXPECT_EQ(descriptor.tag, "prebuilt:7");
    EXPECT_EQ(descriptor.recipe, codeloop::sandbox::DefaultRecipe());

    config.recipe_path = "/nonexistent/codeloop/Dockerfile";
    EXPECT_THROW(codeloop::sandbox::DescriptorFromConfig(config), ImageBuildError);
}
