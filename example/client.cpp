#include <amisync/actions.hpp>
#include <amisync/client.hpp>
#include <amisync/display.hpp>
#include <amisync/snapshot.hpp>

#include <cstdlib>
#include <iostream>
#include <string_view>
#include <system_error>

#include <unistd.h>

int main(int argc, char **argv) {
    auto client = amisync::client::connect({
        .hostname = argc > 1 ? argv[1] : "localhost",
        .port = argc > 2 ? argv[2] : "5038",
        .username = argc > 3 ? argv[3] : "admin",
        .secret = argc > 4 ? argv[4] : "pass",
    });

    if (!client) {
        const auto &err = client.error();
        std::cout << "Could not connect - [" << err.category().name() << "]: " << err.message() << '\n';
        return EXIT_FAILURE;
    }

    client->on_event([](const amisync::event &ev) { std::cout << "Event: " << ev.name() << '\n'; });

    const auto pong = amisync::actions::ping(*client);
    std::cout << "Ping: " << (pong.success ? "ok" : "no reply") << '\n';

    for (const auto &queue : amisync::actions::queue_status(*client)) {
        std::cout << "Queue " << queue.params.value_or("Queue") << ": " << queue.members.size() << " members\n";
        for (const auto &member : queue.members) {
            std::cout << "  " << member.value_or("Name") << " <" << member.value_or("Location") << ">"
                      << (member.value_or("Paused") == "1" ? " paused" : "") << '\n';
        }
    }

    const auto snap = amisync::fetch_snapshot(*client, amisync::display_maps{}, {});
    std::cout << "Active calls: " << snap.active_calls_count << ", waiting: " << snap.waiting_calls_count
              << ", operators: " << snap.active_operators_count << '\n';
    for (const auto &call : snap.active_calls) {
        std::cout << "  " << call.channel << ": " << call.caller << " -> " << call.connected << " (" << call.duration
                  << "s, " << call.application << ")\n";
    }

    sleep(5);
    client->disconnect();

    std::cout << "Press Enter to exit...";
    std::cin.get();
}
