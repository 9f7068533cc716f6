#include <benchmark/benchmark.h>

#include <msgbroker/msgbroker.hpp>

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

// Counts deliveries without keeping them.
class CountingChannel : public msgbroker::Channel {
  private:
    const std::string m_name;

  public:
    std::atomic<int64_t> received{0};

    explicit CountingChannel(const std::string& name) : m_name(name) {}

    const std::string& name() const override { return m_name; }
    void put_message(std::unique_ptr<msgbroker::Message>) override {
        received.fetch_add(1, std::memory_order_relaxed);
    }
    void close() override {}
};

class NullBackend : public msgbroker::BackendQueue {
  public:
    void put(const msgbroker::Bytes&) override {}
    std::optional<msgbroker::Bytes> try_receive() override {
        return std::nullopt;
    }
    std::int64_t depth() const override { return 0; }
    void close() override {}
};

} // anonymous namespace

static void fanout(benchmark::State& st) {
    const auto n_channels = static_cast<int>(st.range(0));

    msgbroker::TopicOptions options;
    options.mem_queue_size = 4096;
    options.dispatch_threads = 2;

    std::vector<std::shared_ptr<CountingChannel>> channels;
    msgbroker::Topic topic(
        "bench", options, std::make_unique<NullBackend>(),
        [&channels](const std::string&, const std::string& name) {
            auto channel = std::make_shared<CountingChannel>(name);
            channels.push_back(channel);
            return channel;
        });
    for (int i = 0; i < n_channels; ++i) {
        topic.get_channel("c" + std::to_string(i));
    }

    const msgbroker::Bytes body(128, 'x');
    int64_t sent = 0;
    for (auto _ : st) {
        topic.put_message(std::make_unique<msgbroker::Message>(
            msgbroker::make_message_id(), body));
        ++sent;
    }

    // Wait for the last copies so the next run starts clean. Anything the
    // router spilled went to the null backend and is never delivered.
    auto routed = [&topic] {
        const auto s = topic.stats();
        return s.routed_to_memory + s.routed_to_backend + s.dropped;
    };
    while (routed() < static_cast<uint64_t>(sent)) {
        std::this_thread::yield();
    }
    const auto in_memory =
        static_cast<int64_t>(topic.stats().routed_to_memory);
    for (auto& channel : channels) {
        while (channel->received.load(std::memory_order_relaxed) < in_memory) {
            std::this_thread::yield();
        }
    }
    topic.close();

    st.SetItemsProcessed(st.iterations());
}

BENCHMARK(fanout)->Arg(1)->Arg(4)->Arg(16);

BENCHMARK_MAIN();
