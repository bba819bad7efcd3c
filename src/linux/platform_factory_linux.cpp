#include "../platform_factory.hpp"

#include "xdg_scheme_registrar.hpp"

namespace statisfy {

std::unique_ptr<ISchemeRegistrar> make_scheme_registrar(const AppConfig& config) {
    return std::make_unique<XdgSchemeRegistrar>(config);
}

} // namespace statisfy
