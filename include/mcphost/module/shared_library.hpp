#pragma once
#include <filesystem>
#include <memory>
#include <string>

namespace mcphost {

/// An open dlopen() handle, closed when the last owner lets go.
class SharedLibrary {
public:
    /// Throws PluginLoadError with the dlerror() text.
    static std::shared_ptr<SharedLibrary> open(const std::filesystem::path& path);

    ~SharedLibrary();

    SharedLibrary(const SharedLibrary&) = delete;
    SharedLibrary& operator=(const SharedLibrary&) = delete;

    /// Address of an exported symbol, or null when it is absent.
    [[nodiscard]] void* symbol(const char* name) const;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    SharedLibrary(void* handle, std::filesystem::path path);

    void* handle_;
    std::filesystem::path path_;
};

} // namespace mcphost
