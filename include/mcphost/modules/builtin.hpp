#pragma once
#include "../module/module.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace mcphost {
namespace modules {

/// Live state of the `echo` module. Other modules may take it as a dependency.
class EchoService : public ModuleInstance {
public:
    std::string echo(const std::string& message);
    [[nodiscard]] uint64_t count() const { return count_.load(); }

private:
    std::atomic<uint64_t> count_{0};
};

/// `math:add`, `math:subtract`, `math:multiply`.
std::unique_ptr<Module> make_math_module();

/// `echo:echo`.
std::unique_ptr<Module> make_echo_module();

/// `hello:greet`. Uses the echo service when it is running.
std::unique_ptr<Module> make_hello_module();

/// Adds the factories above under the ids "math", "echo" and "hello".
void register_builtin_modules(ModuleCatalog& catalog);

} // namespace modules
} // namespace mcphost
