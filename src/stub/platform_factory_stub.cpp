#include "../platform_factory.hpp"
#include "unsupported_scheme_registrar.hpp"

namespace statisfy {

std::unique_ptr<ISchemeRegistrar> make_scheme_registrar(const AppConfig& config) {
    return std::make_unique<UnsupportedSchemeRegistrar>(config);
}

} // namespace statisfy
