// Facewatch controller.
// Main program: webcam face tracking and alert mode, driven over HTTP.

#include "actuator.hpp"
#include "api_routes.hpp"
#include "audio_looper.hpp"
#include "camera.hpp"
#include "face_locator.hpp"
#include "http_server.hpp"
#include "logger.hpp"
#include "mode_controller.hpp"
#include "settings.hpp"
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>

using namespace std;

static atomic<bool> quit{false};

static void handleSignal(int) {
    quit = true;
}

int main(int argc, char **argv) {
    try {
        Settings settings = loadSettings(argc, argv);
        if (settings.showHelp) {
            cout << usage(argv[0]);
            return 0;
        }
        logger.setLevel(settings.logLevel);
        LOG_INFO("Starting Face Centering API with Alert Integration...");

        // Devices. Any of them may be missing.
        Camera camera(settings.camera);
        camera.initialize();
        CascadeFaceLocator locator(settings.cascadePath);
        unique_ptr<ActuatorChannel> actuator = connectActuator(settings.serial);

        if (filesystem::exists(settings.audio.file)) {
            LOG_INFO("Audio file found: " + settings.audio.file);
        } else {
            LOG_WARN("Audio file not found: " + settings.audio.file);
        }
        AlsaAudioLooper audio(settings.audio.file, settings.audio.device);

        ModeController controller(camera, locator, *actuator, audio, settings.timing, settings.smoothingFactor);
        ApiRoutes routes(controller);
        HttpServer server(routes, settings.httpPort);
        if (!server.start()) {
            return 1;
        }

        signal(SIGINT, handleSignal);
        signal(SIGTERM, handleSignal);

        server.run(quit);

        LOG_INFO("Shutting down");
        server.stop();
        controller.shutdown();
        camera.release();
        LOG_INFO("Cleanup complete");
        return 0;

    } catch (const exception& e) {
        LOG_ERROR(string("Error: ") + e.what());
        return 1;
    }
}
