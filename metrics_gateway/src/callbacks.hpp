#pragma once
#include <nlohmann/json.hpp>
#include <functional>

namespace prometheus {
class Registry;
}

// Produces this process's health status as a JSON object. May throw.
using HealthCallback = std::function<nlohmann::json()>;

// Registers application collectors on the registry during server setup.
using MetricsSetupCallback = std::function<void(prometheus::Registry&)>;
