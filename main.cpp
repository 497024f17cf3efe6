#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>

#include "app/SchedSyncApp.hpp"

namespace {
std::atomic<bool> g_stopRequested{false};

void OnSignal(int) {
    g_stopRequested = true;
}
} // namespace

int main(int argc, char** argv) {
    std::string root = argc > 1 ? argv[1] : std::filesystem::current_path().string();
    if (argc > 2 || root == "-h" || root == "--help") {
        std::cerr << "Usage: " << argv[0] << " [project-root]\n"
                  << "Reads settings.json, students.json and the mailbox spool under project-root." << std::endl;
        return argc > 2 ? 1 : 0;
    }

    std::signal(SIGINT, OnSignal);
    std::signal(SIGTERM, OnSignal);

    schedsync::app::SchedSyncApp app(root);
    return app.Run(g_stopRequested);
}
