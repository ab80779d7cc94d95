#include "sandbox/image_cache.hpp"

#include <chrono>
#include <exception>

#include "sandbox/sandbox_errors.hpp"
#include "utils/logging.hpp"

namespace codeloop::sandbox {

ImageCache::ImageCache(ContainerRuntime& runtime)
    : runtime_(runtime) {}

ImageHandle ImageCache::Ensure(const ImageDescriptor& descriptor) {
    std::promise<ImageHandle> promise;
    std::shared_future<ImageHandle> pending;
    bool leader = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(descriptor.tag);
        if (it != entries_.end()) {
            pending = it->second;
        } else {
            pending = promise.get_future().share();
            entries_.emplace(descriptor.tag, pending);
            leader = true;
        }
    }

    if (!leader) {
        return pending.get();
    }

    try {
        auto handle = Resolve(descriptor);
        promise.set_value(handle);
        return handle;
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.erase(descriptor.tag);
        }
        promise.set_exception(std::current_exception());
        throw;
    }
}

bool ImageCache::IsReady(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(tag);
    if (it == entries_.end()) {
        return false;
    }
    return it->second.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

ImageHandle ImageCache::Resolve(const ImageDescriptor& descriptor) {
    if (auto existing = runtime_.InspectImage(descriptor.tag)) {
        codeloop::utils::LogInfo("image", "using existing image " + descriptor.tag);
        return ImageHandle{descriptor.tag, *existing, false};
    }

    builds_.fetch_add(1);
    codeloop::utils::LogInfo("image", "image " + descriptor.tag + " not found, building");
    auto outcome = runtime_.BuildImage(descriptor);
    if (!outcome.success) {
        codeloop::utils::LogError("image", "build failed for " + descriptor.tag + "\n" + outcome.log);
        throw ImageBuildError("image build failed for " + descriptor.tag, std::move(outcome.log));
    }

    const auto image_id = runtime_.InspectImage(descriptor.tag);
    if (!image_id) {
        throw ImageBuildError("image " + descriptor.tag + " missing after a successful build",
                              std::move(outcome.log));
    }
    codeloop::utils::LogInfo("image", "built image " + descriptor.tag + " id=" + *image_id);
    return ImageHandle{descriptor.tag, *image_id, true};
}

}  // namespace codeloop::sandbox
