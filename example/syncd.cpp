#include <amisync/client.hpp>
#include <amisync/sync_worker.hpp>

#include <cstdlib>
#include <iostream>
#include <system_error>
#include <utility>

#include <signal.h>
#include <spdlog/cfg/env.h>

int main(int argc, char **argv) {
    spdlog::cfg::load_env_levels();

    if (argc != 2 && argc != 6) {
        std::cerr << "usage: " << argv[0] << " <database> [host port username secret]\n";
        return EXIT_FAILURE;
    }

    amisync::worker_config config{ .database_path = argv[1] };
    if (argc == 6) {
        config.connection = amisync::connect_config{
            .hostname = argv[2],
            .port = argv[3],
            .username = argv[4],
            .secret = argv[5],
        };
    }

    // Block the signals before any thread exists so only sigwait() sees them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
        std::cerr << "could not block termination signals\n";
        return EXIT_FAILURE;
    }

    auto worker = amisync::sync_worker::start(std::move(config));
    if (!worker) {
        const auto &err = worker.error();
        std::cerr << "[" << err.category().name() << "]: " << err.message() << '\n';
        return EXIT_FAILURE;
    }

    int received = 0;
    if (sigwait(&signals, &received) != 0) {
        std::cerr << "sigwait failed\n";
    }

    worker->stop();
    return EXIT_SUCCESS;
}
