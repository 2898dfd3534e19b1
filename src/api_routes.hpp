#pragma once

#include "mode_controller.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct ApiResponse {
    int status = 200;
    nlohmann::json body;
};

// Maps REST calls onto the mode controller. Transport independent.
class ApiRoutes {
public:
    explicit ApiRoutes(ModeController& controller);

    ApiResponse handle(const std::string& method, const std::string& path, const std::string& body);

    static const std::vector<std::string>& endpoints();

private:
    ApiResponse home() const;
    ApiResponse test() const;
    ApiResponse status() const;
    ApiResponse updateSettings(const std::string& body);

    ModeController& controller;
};
