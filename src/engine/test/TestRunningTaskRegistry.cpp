#include "RunningTaskRegistry.hpp"
#include "DummyWorker.hpp"
#include <algorithm>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <thread>

namespace fs = std::filesystem;

namespace {

std::string temp_state_file(const std::string& name) {
    fs::path path = fs::temp_directory_path() / name;
    fs::remove(path);
    return path.string();
}

RunningTask make_task(const std::string& name, int port, std::shared_ptr<DummyWorker> worker) {
    return RunningTask{name, port, std::move(worker), std::chrono::system_clock::now()};
}

}

void test_ports_are_monotonic() {
    RunningTaskRegistry registry(4000, "");
    assert(registry.allocate_port() == 4000);
    assert(registry.allocate_port() == 4001);
    assert(registry.allocate_port() == 4002);
    std::cout << "test_ports_are_monotonic passed" << std::endl;
}

void test_ports_unique_across_threads() {
    RunningTaskRegistry registry(5000, "");
    std::vector<int> ports(64);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < ports.size(); ++i) {
        threads.emplace_back([&registry, &ports, i] { ports[i] = registry.allocate_port(); });
    }
    for (auto& t : threads) t.join();

    std::sort(ports.begin(), ports.end());
    assert(std::adjacent_find(ports.begin(), ports.end()) == ports.end());
    assert(ports.front() == 5000);
    assert(ports.back() == 5063);
    std::cout << "test_ports_unique_across_threads passed" << std::endl;
}

void test_remove_hands_over_ownership_once() {
    RunningTaskRegistry registry(3284, "");
    auto worker = std::make_shared<DummyWorker>();
    registry.add(make_task("architect", 3284, worker));
    assert(registry.contains("architect"));
    assert(registry.size() == 1);

    auto owned = registry.remove("architect");
    assert(owned == worker);
    assert(!registry.contains("architect"));
    assert(registry.remove("architect") == nullptr);
    std::cout << "test_remove_hands_over_ownership_once passed" << std::endl;
}

void test_stop_all_stops_each_worker() {
    RunningTaskRegistry registry(3284, "");
    auto first = std::make_shared<DummyWorker>();
    auto second = std::make_shared<DummyWorker>();
    registry.add(make_task("qa", 3285, first));
    registry.add(make_task("security", 3286, second));

    registry.stop_all();
    registry.stop_all();

    assert(registry.size() == 0);
    assert(first->stop_calls == 1);
    assert(second->stop_calls == 1);
    std::cout << "test_stop_all_stops_each_worker passed" << std::endl;
}

void test_state_file_mirrors_registry() {
    const std::string state_file = temp_state_file("agentpipe-registry-test.json");
    RunningTaskRegistry registry(3284, state_file);

    registry.add(make_task("qa", 3285, std::make_shared<DummyWorker>()));
    registry.add(make_task("security", 3286, std::make_shared<DummyWorker>()));

    auto state = RunningTaskRegistry::load_state(state_file);
    assert(state.size() == 2);
    assert(state.at("qa") == 3285);
    assert(state.at("security") == 3286);

    registry.remove("qa");
    state = RunningTaskRegistry::load_state(state_file);
    assert(state.size() == 1);
    assert(state.count("qa") == 0);

    registry.clear_state_file();
    assert(!fs::exists(state_file));

    bool thrown = false;
    try {
        RunningTaskRegistry::load_state(state_file);
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    (void)thrown;
    std::cout << "test_state_file_mirrors_registry passed" << std::endl;
}

int main() {
    test_ports_are_monotonic();
    test_ports_unique_across_threads();
    test_remove_hands_over_ownership_once();
    test_stop_all_stops_each_worker();
    test_state_file_mirrors_registry();

    std::cout << "All RunningTaskRegistry tests passed!" << std::endl;
    return 0;
}
