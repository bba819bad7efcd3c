#pragma once

#include <functional>
#include <string>
#include <vector>

namespace statisfy {

// URLs delivered by a single scheme activation, in delivery order
struct ActivationEvent {
    std::vector<std::string> urls;
};

using ActivationCallback = std::function<void(const ActivationEvent&)>;

} // namespace statisfy
