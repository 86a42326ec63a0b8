#include "../include/Logger.h"
#include "../include/docs_fetch/crawler/DocsExplorer.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <chrono>
#include <cstdlib>

// Usage: explore_example <url> [depth]
// Prints the exploration result as JSON on stdout; logs go to stderr.
int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 3) {
        std::cerr << "Usage: " << argv[0] << " <url> [depth]" << std::endl;
        return 2;
    }

    const char* levelEnv = std::getenv("LOG_LEVEL");
    Logger::getInstance().init(levelEnv ? Logger::parseLevel(levelEnv) : LogLevel::INFO,
                               true, "", ConsoleStream::STDERR);

    int depth = 1;
    if (argc == 3) {
        try {
            depth = std::stoi(argv[2]);
        } catch (const std::exception& e) {
            std::cerr << "Invalid depth '" << argv[2] << "': " << e.what() << std::endl;
            return 2;
        }
    }

    docs_fetch::crawler::DocsExplorer explorer(docs_fetch::crawler::loadExploreConfigFromEnv());

    auto start = std::chrono::steady_clock::now();
    docs_fetch::crawler::ExplorationResult result = explorer.explore(argv[1], depth);
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    nlohmann::json output = docs_fetch::crawler::toJson(result);
    std::cout << output.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;

    LOG_INFO("Explored " + std::to_string(result.pagesExplored) + " pages in " +
             std::to_string(duration.count()) + "ms (" +
             docs_fetch::crawler::explorationStateName(result.state) + ")");

    return result.failed() ? 1 : 0;
}
