#include "api_routes.hpp"
#include "logger.hpp"
#include <chrono>
#include <cstdlib>
#include <stdexcept>

using namespace std;
using namespace nlohmann;

ApiRoutes::ApiRoutes(ModeController& controller) : controller(controller) {}

const vector<string>& ApiRoutes::endpoints() {
    static const vector<string> list = {
        "/api/status",
        "/api/start_tracking",
        "/api/stop_tracking",
        "/api/start_alert",
        "/api/stop_alert",
        "/api/spin_once",
        "/api/settings"
    };
    return list;
}

static ApiResponse success(bool ok) {
    return { 200, json{ {"success", ok} } };
}

// Numbers, or strings holding a number such as "0.5"
static double factorValue(const json& value) {
    if (value.is_string()) {
        const string& text = value.get_ref<const string&>();
        char* end = nullptr;
        double parsed = strtod(text.c_str(), &end);
        if (text.empty() || *end != '\0') {
            throw runtime_error("Could not convert string to float: '" + text + "'");
        }
        return parsed;
    }
    return value.get<double>();
}

ApiResponse ApiRoutes::handle(const string& method, const string& path, const string& body) {
    LOG_DEBUG(method + " " + path);

    // Strip any query string
    string route = path.substr(0, path.find('?'));
    if (route.size() > 1 && route.back() == '/') {
        route.pop_back();
    }

    if (method == "GET") {
        if (route == "/")           return home();
        if (route == "/api/test")   return test();
        if (route == "/api/status") return status();
    } else if (method == "POST") {
        if (route == "/api/start_tracking") return success(controller.startTracking());
        if (route == "/api/stop_tracking")  { controller.stopTracking(); return success(true); }
        if (route == "/api/start_alert")    return success(controller.startAlert());
        if (route == "/api/stop_alert")     return success(controller.stopAlert());
        if (route == "/api/spin_once")      return success(controller.spinOnce());
        if (route == "/api/settings")       return updateSettings(body);
    }

    bool known = route == "/" || route == "/api/test";
    for (const auto& endpoint : endpoints()) {
        if (route == endpoint) known = true;
    }
    if (known) {
        return { 405, json{ {"error", "Method not allowed"} } };
    }

    json available = json::array({"/"});
    for (const auto& endpoint : endpoints()) {
        available.push_back(endpoint);
    }
    return { 404, json{ {"error", "Endpoint not found"}, {"available_endpoints", available} } };
}

ApiResponse ApiRoutes::home() const {
    return { 200, json{
        {"message", "Face Centering API Server"},
        {"status", "running"},
        {"endpoints", endpoints()}
    } };
}

ApiResponse ApiRoutes::test() const {
    double now = chrono::duration<double>(chrono::system_clock::now().time_since_epoch()).count();
    return { 200, json{ {"message", "API is working!"}, {"timestamp", now} } };
}

ApiResponse ApiRoutes::status() const {
    ControllerStatus s = controller.status();
    return { 200, json{
        {"camera_available", s.cameraAvailable},
        {"arduino_connected", s.arduinoConnected},
        {"tracking_active", s.trackingActive},
        {"alert_mode", s.alertMode},
        {"audio_active", s.audioActive},
        {"smoothing_factor", s.smoothingFactor}
    } };
}

ApiResponse ApiRoutes::updateSettings(const string& body) {
    try {
        json data = json::parse(body);
        if (!data.is_object()) {
            throw runtime_error("Request body must be a JSON object");
        }

        if (data.contains("smoothing_factor")) {
            controller.setSmoothingFactor(factorValue(data["smoothing_factor"]));
        }

        return { 200, json{
            {"success", true},
            {"smoothing_factor", controller.smoothingFactor()}
        } };
    } catch (const invalid_argument& e) {
        return { 400, json{ {"error", e.what()} } };
    } catch (const exception& e) {
        LOG_ERROR(string("Settings update failed: ") + e.what());
        return { 500, json{ {"error", e.what()} } };
    }
}
