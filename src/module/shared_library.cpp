#include "mcphost/module/shared_library.hpp"
#include "mcphost/error.hpp"
#include <dlfcn.h>

namespace mcphost {

SharedLibrary::SharedLibrary(void* handle, std::filesystem::path path)
    : handle_(handle), path_(std::move(path)) {
}

SharedLibrary::~SharedLibrary() {
    if (handle_) dlclose(handle_);
}

std::shared_ptr<SharedLibrary> SharedLibrary::open(const std::filesystem::path& path) {
    void* h = dlopen(path.string().c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!h) {
        const char* dl_err = dlerror();  // reading clears it
        throw PluginLoadError("dlopen failed for " + path.string() + ": " +
                              (dl_err ? dl_err : "(unknown)"));
    }
    return std::shared_ptr<SharedLibrary>(new SharedLibrary(h, path));
}

void* SharedLibrary::symbol(const char* name) const {
    dlerror();
    void* sym = dlsym(handle_, name);
    if (dlerror() != nullptr) return nullptr;
    return sym;
}

} // namespace mcphost
