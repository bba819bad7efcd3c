#pragma once

#include "interfaces/i_scheme_registrar.hpp"
#include "config.hpp"
#include <memory>

namespace statisfy {

// Implemented per-platform; freedesktop systems get the XDG registrar,
// everything else the unsupported stub.
std::unique_ptr<ISchemeRegistrar> make_scheme_registrar(const AppConfig& config);

} // namespace statisfy
