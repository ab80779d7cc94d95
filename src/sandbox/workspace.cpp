#include "sandbox/workspace.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <vector>
#include <stdlib.h>

#include "sandbox/sandbox_errors.hpp"
#include "utils/logging.hpp"

namespace codeloop::sandbox {
namespace {

bool EscapesRoot(const std::filesystem::path& relative) {
    int depth = 0;
    for (const auto& part : relative) {
        const auto text = part.string();
        if (text == "..") {
            depth -= 1;
            if (depth < 0) {
                return true;
            }
        } else if (!text.empty() && text != ".") {
            depth += 1;
        }
    }
    return false;
}

}  // namespace

Workspace Workspace::Create(const std::filesystem::path& root, const std::string& prefix) {
    std::error_code ec;
    auto base = root.empty() ? std::filesystem::temp_directory_path(ec) : root;
    if (ec) {
        throw WorkspaceError("cannot locate temp directory: " + ec.message());
    }
    std::filesystem::create_directories(base, ec);
    if (ec) {
        throw WorkspaceError("cannot create workspace root " + base.string() + ": " + ec.message());
    }

    const auto pattern = (base / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        throw WorkspaceError("mkdtemp failed for " + pattern + ": " + std::strerror(errno));
    }
    std::filesystem::path path(buffer.data());
    codeloop::utils::LogDebug("workspace", "created " + path.string());
    return Workspace(std::move(path));
}

Workspace::Workspace(std::filesystem::path path)
    : path_(std::move(path)) {}

Workspace::~Workspace() {
    const auto ec = Remove();
    if (ec) {
        codeloop::utils::LogWarn("workspace", "failed to remove " + path_.string() + ": " + ec.message());
    }
}

Workspace::Workspace(Workspace&& other) noexcept
    : path_(std::move(other.path_))
    , removed_(other.removed_) {
    other.removed_ = true;
}

Workspace& Workspace::operator=(Workspace&& other) noexcept {
    if (this != &other) {
        const auto ec = Remove();
        if (ec) {
            codeloop::utils::LogWarn("workspace", "failed to remove " + path_.string() + ": " + ec.message());
        }
        path_ = std::move(other.path_);
        removed_ = other.removed_;
        other.removed_ = true;
    }
    return *this;
}

void Workspace::WriteFile(const std::string& relative_path, const std::string& content) const {
    if (removed_) {
        throw WorkspaceError("workspace already removed: " + path_.string());
    }
    const std::filesystem::path relative(relative_path);
    if (relative_path.empty() || relative.is_absolute() || relative.has_root_name() || EscapesRoot(relative)) {
        throw WorkspaceError("invalid workspace path: '" + relative_path + "'");
    }

    const auto target = path_ / relative;
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        throw WorkspaceError("cannot create directory for " + relative_path + ": " + ec.message());
    }

    std::ofstream output(target, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw WorkspaceError("cannot open " + target.string() + " for writing");
    }
    output.write(content.data(), static_cast<std::streamsize>(content.size()));
    output.flush();
    if (!output) {
        throw WorkspaceError("write failed for " + target.string());
    }
}

std::error_code Workspace::Remove() noexcept {
    if (removed_ || path_.empty()) {
        removed_ = true;
        return {};
    }
    removed_ = true;
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (!ec) {
        codeloop::utils::LogDebug("workspace", "removed " + path_.string());
    }
    return ec;
}

}  // namespace codeloop::sandbox
