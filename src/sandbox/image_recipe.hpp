#pragma once

#include <string>

#include "config/config_schema.hpp"
#include "sandbox/container_runtime.hpp"

namespace codeloop::sandbox {

// Python 3.12 with uv and pytest preinstalled; the network is gone at run
// time, so everything a generated program may import has to be baked in here.
std::string DefaultRecipe();

// Hex FNV-1a digest of the recipe text.
std::string RecipeDigest(const std::string& recipe);

// Recipe text from sandbox.recipePath, or DefaultRecipe() when unset. A
// recipe file's digest is appended to the tag ("<image>-<12 hex>"), so
// editing the file yields a new image instead of reusing a stale one. The
// built-in recipe keeps sandbox.image as is, which also lets a prebuilt image
// be used under that tag. Throws ImageBuildError when the file cannot be read.
ImageDescriptor DescriptorFromConfig(const codeloop::config::SandboxConfig& config);

}  // namespace codeloop::sandbox
