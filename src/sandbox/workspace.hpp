#pragma once

#include <filesystem>
#include <string>
#include <system_error>

namespace codeloop::sandbox {

// A uniquely named temporary directory that deletes itself. Move-only; the
// directory is removed at most once, by Remove() or the destructor.
class Workspace {
public:
    // Creates <root>/<prefix>XXXXXX with mkdtemp. An empty root means the
    // system temp directory. Throws WorkspaceError.
    static Workspace Create(const std::filesystem::path& root, const std::string& prefix);

    ~Workspace();

    Workspace(Workspace&& other) noexcept;
    Workspace& operator=(Workspace&& other) noexcept;
    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    const std::filesystem::path& Path() const { return path_; }

    // Writes content at a path relative to the root, creating parent
    // directories. Absolute paths and paths leaving the root are rejected.
    // Throws WorkspaceError.
    void WriteFile(const std::string& relative_path, const std::string& content) const;

    // Recursive delete. Returns the first error; later calls are no-ops.
    std::error_code Remove() noexcept;
    bool Removed() const { return removed_; }

private:
    explicit Workspace(std::filesystem::path path);

    std::filesystem::path path_;
    bool removed_ = false;
};

}  // namespace codeloop::sandbox
