#include "mcphost/modules/builtin.hpp"

namespace mcphost {
namespace modules {

void register_builtin_modules(ModuleCatalog& catalog) {
    catalog.add("math", make_math_module);
    catalog.add("echo", make_echo_module);
    catalog.add("hello", make_hello_module);
}

} // namespace modules
} // namespace mcphost
