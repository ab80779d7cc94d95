#include "sandbox/image_recipe.hpp"

#include <cstdint>
#include <fstream>
#include <iomanip>
#include <sstream>

#include "sandbox/sandbox_errors.hpp"
#include "utils/common.hpp"

namespace codeloop::sandbox {

std::string DefaultRecipe() {
    return R"(FROM ghcr.io/astral-sh/uv:latest AS uv-installer
FROM python:3.12-slim
ENV PYTHONUNBUFFERED=1 \
    PYTHONDONTWRITEBYTECODE=1 \
    PYTHONPATH=/app
COPY --from=uv-installer /uv /usr/local/bin/uv
COPY --from=uv-installer /uvx /usr/local/bin/uvx
RUN uv pip install --system --no-cache pytest && python -V && uv --version
WORKDIR /app
CMD ["bash"]
)";
}

std::string RecipeDigest(const std::string& recipe) {
    // 64-bit FNV-1a
    std::uint64_t hash = 0xcbf29ce484222325ULL;
    for (const unsigned char c : recipe) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << hash;
    return oss.str();
}

ImageDescriptor DescriptorFromConfig(const codeloop::config::SandboxConfig& config) {
    ImageDescriptor descriptor{};
    descriptor.tag = config.image;
    if (config.recipe_path.empty()) {
        descriptor.recipe = DefaultRecipe();
        return descriptor;
    }

    const auto path = codeloop::utils::ExpandHome(config.recipe_path);
    std::ifstream input(path);
    if (!input.is_open()) {
        throw ImageBuildError("cannot read image recipe " + path.string(), "");
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    descriptor.recipe = buffer.str();
    descriptor.tag += "-" + RecipeDigest(descriptor.recipe).substr(0, 12);
    return descriptor;
}

}  // namespace codeloop::sandbox
