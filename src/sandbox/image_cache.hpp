#pragma once

#include <atomic>
#include <cstddef>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

#include "sandbox/container_runtime.hpp"

namespace codeloop::sandbox {

// Process-wide holder of execution images, keyed by tag. A tag is assumed to
// name one recipe; DescriptorFromConfig() makes tags of recipe files
// content-addressed.
//
// Ensure() is single-flight per tag: the first caller inspects and, when the
// image is missing, builds it; concurrent callers for the same tag block on
// that result and receive the same handle. Different tags proceed in
// parallel. Successful entries live until the cache is destroyed; a failed
// build is dropped so the next call retries it.
class ImageCache {
public:
    explicit ImageCache(ContainerRuntime& runtime);

    ImageCache(const ImageCache&) = delete;
    ImageCache& operator=(const ImageCache&) = delete;

    // Throws ImageBuildError with the build log.
    ImageHandle Ensure(const ImageDescriptor& descriptor);

    bool IsReady(const std::string& tag) const;
    // Builds started by this cache, successful or not.
    std::size_t BuildCount() const { return builds_.load(); }

private:
    ImageHandle Resolve(const ImageDescriptor& descriptor);

    ContainerRuntime& runtime_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_future<ImageHandle>> entries_;
    std::atomic<std::size_t> builds_{0};
};

}  // namespace codeloop::sandbox
