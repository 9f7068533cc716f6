/**
 * @file orders_example.cpp
 * @brief Minimal end‑to‑end demonstration of the msgbroker core.
 *
 * A producer pushes messages onto topic `orders` before anybody listens.
 * The in‑memory buffer only holds two of them, so the rest spill to the
 * disk queue under `./msgbroker-example-data`.  Two channels then subscribe
 * and each drains its own copy of every message, memory and disk alike.
 */

#include <msgbroker/msgbroker.hpp>

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using Channel = msgbroker::QueueChannel<>;

int main() {
    // Quill uses a dedicated backend thread. Start it once per process.
    msgbroker::logging::start_backend();

    msgbroker::TopicOptions options;
    options.mem_queue_size = 2;
    options.data_path = "msgbroker-example-data";

    msgbroker::Broker broker(options);
    broker.on_new_topic([](const std::shared_ptr<msgbroker::Topic>& topic) {
        std::cout << "new topic: " << topic->name() << "\n";
    });

    for (int i = 1; i <= 6; ++i) {
        broker.put_message("orders",
                           msgbroker::to_bytes("order #" + std::to_string(i)));
    }

    auto topic = broker.get_topic("orders");
    auto billing = std::static_pointer_cast<Channel>(topic->get_channel("billing"));
    auto shipping =
        std::static_pointer_cast<Channel>(topic->get_channel("shipping"));

    int received = 0;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (received < 12 && std::chrono::steady_clock::now() < deadline) {
        for (auto* channel : {billing.get(), shipping.get()}) {
            while (auto msg = channel->pop()) {
                const auto& body = (*msg)->body();
                std::cout << channel->name() << ": "
                          << std::string(body.begin(), body.end()) << "\n";
                ++received;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    const auto stats = topic->stats();
    std::cout << "memory=" << stats.routed_to_memory
              << " disk=" << stats.routed_to_backend
              << " delivered=" << received << "\n";

    try {
        broker.close();
    } catch (const msgbroker::error& e) {
        std::cerr << "close failed: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
