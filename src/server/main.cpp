#include "common/config_loader.hpp"
#include "common/logger.hpp"
#include "config_path.hpp"
#include "maintenance/sweeper.hpp"
#include "server/auth_runtime.hpp"
#include "server/auth_service_impl.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <grpcpp/grpcpp.h>
#include <thread>

namespace {

volatile std::sig_atomic_t g_stop_signal = 0;

void HandleSignal(int signal) {
    g_stop_signal = signal;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    if (argc > 1) {
        config_path = argv[1];
    } else if (const char* env = std::getenv("ENDURAIN_AUTH_CONFIG")) {
        config_path = env;
    } else {
        config_path = endurain::common::GetConfigPath("app.example.json");
    }

    endurain::common::AppConfig config;
    try {
        config = endurain::common::ConfigLoader::Load(config_path);
    } catch (const std::exception& ex) {
        fprintf(stderr, "Failed to load config %s: %s\n", config_path.c_str(), ex.what());
        return EXIT_FAILURE;
    }

    endurain::common::InitLogger(config.logging);
    ENDURAIN_LOG_INFO("Auth server starting with config {}", config_path);

    auto runtime = endurain::server::BuildAuthRuntime(config, std::make_shared<endurain::common::SystemClock>());
    if (!runtime.IsOk()) {
        ENDURAIN_LOG_CRITICAL("Failed to assemble auth runtime: {}", runtime.GetStatus().Message());
        endurain::common::ShutdownLogger();
        return EXIT_FAILURE;
    }

    endurain::maintenance::Sweeper sweeper(std::chrono::seconds(config.maintenance.sweep_interval_seconds));
    endurain::server::RegisterSweepJobs(runtime.Value(), sweeper);

    endurain::server::AuthServiceImpl auth_service(runtime.Value().auth);

    grpc::ServerBuilder builder;
    std::string address = config.server.host + ":" + std::to_string(config.server.port);
    builder.AddListeningPort(address, grpc::InsecureServerCredentials());
    builder.RegisterService(&auth_service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        ENDURAIN_LOG_ERROR("Failed to start gRPC server on {}", address);
        endurain::common::ShutdownLogger();
        return EXIT_FAILURE;
    }

    sweeper.Start();
    ENDURAIN_LOG_INFO("Auth server listening on {}", address);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    std::thread shutdown_thread([&server]() {
        while (g_stop_signal == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        ENDURAIN_LOG_WARN("Signal {} received, shutting down gRPC server...", g_stop_signal);
        server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
    });

    server->Wait();
    shutdown_thread.join();
    sweeper.Stop();
    endurain::common::ShutdownLogger();
    return EXIT_SUCCESS;
}
