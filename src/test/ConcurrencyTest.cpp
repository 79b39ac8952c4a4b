#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "application/RecipeGenerationService.hpp"
#include "test/FakeCompletionService.hpp"

using namespace smartcook;

int main() {
    std::cout << "[Test] Starting Concurrency Stress Test..." << std::endl;

    // Even-numbered requests get an unparsable first reply, so they go through repair and one retry.
    auto seenMutex = std::make_shared<std::mutex>();
    auto seen = std::make_shared<std::set<std::string>>();
    auto completion = std::make_shared<test::FakeCompletionService>(
        [seenMutex, seen](const std::string& user, int) -> std::string {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            auto pos = user.find("User message: ") + 14;
            std::string message = user.substr(pos, user.find('\n', pos) - pos);
            int id = std::stoi(message.substr(message.find('-') + 1));
            bool firstTime = false;
            {
                std::lock_guard<std::mutex> lock(*seenMutex);
                firstTime = seen->insert(message).second;
            }
            if (firstTime && id % 2 == 0) return "not json at all";
            return "{\"recipes\": [{\"title\": \"" + message + "\", \"instructions\": [\"go\"]}]}";
        });
    auto units = std::make_shared<test::RecordingUnitNormalizer>();

    std::atomic<int> sleeps{0};
    application::RecipeGenerationService service(
        completion, units,
        std::make_shared<test::FixedSpices>(std::vector<std::string>{"salt"}),
        std::make_shared<test::FixedRatings>(""),
        application::GenerationSettings{},
        [&sleeps](std::chrono::milliseconds) { ++sleeps; });

    const int NUM_REQUESTS = 32;
    std::vector<std::thread> threads;
    std::vector<domain::GenerationResult> results(NUM_REQUESTS);

    std::cout << "[Test] Spawning " << NUM_REQUESTS << " concurrent generate() calls..." << std::endl;
    for (int i = 0; i < NUM_REQUESTS; ++i) {
        threads.emplace_back([&service, &results, i]() {
            domain::InventoryItem rice;
            rice.name = "rice";
            results[i] = service.generate(i, {rice}, "request-" + std::to_string(i), {});
        });
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }

    int ok = 0;
    for (int i = 0; i < NUM_REQUESTS; ++i) {
        const auto& result = results[i];
        if (!result.ok()) continue;
        ++ok;
        assert(result.userId == i);
        assert(result.recipes.size() == 1);
        // Each request only ever sees its own prompt.
        assert(result.recipes[0].title == "request-" + std::to_string(i));
    }

    std::cout << "[Test] Successful requests: " << ok << "/" << NUM_REQUESTS
              << ", primary calls: " << completion->primaryCalls()
              << ", repair calls: " << completion->repairCalls()
              << ", backoffs: " << sleeps.load() << std::endl;

    assert(ok == NUM_REQUESTS);
    assert(completion->repairCalls() == NUM_REQUESTS / 2);
    assert(sleeps.load() == NUM_REQUESTS / 2);
    assert(completion->primaryCalls() == NUM_REQUESTS + NUM_REQUESTS / 2);
    assert(units->m_calls == NUM_REQUESTS);

    std::cout << "[PASS] Concurrency Stress Test." << std::endl;
    return 0;
}
