#include "loopsaver/infrastructure/config/config_manager.hpp"
#include "loopsaver/infrastructure/logging/logger.hpp"
#include "loopsaver/iteration/file_position_tracker.hpp"
#include "loopsaver/iteration/requeueing_iterator.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    auto& logger = LSV::Logger::getInstance();
    logger.setLogLevel(LSV::LogLevel::DEBUG);
    logger.addGlobalMetadata("example", "resume_loop");

    auto& config = LSV::ConfigManager::getInstance();
    config.addValidationRules(LSV::IterationOptions::validationRules());
    if (argc > 2 && !config.loadFromFile(argv[2])) {
        return 1;
    }
    config.loadEnvironmentOverrides();

    std::vector<std::string> errors;
    if (!config.validate(errors)) {
        for (const auto& error : errors) {
            LSV_LOG_ERROR("main", error);
        }
        return 1;
    }

    try {
        LSV::IterationOptions options = LSV::IterationOptions::fromConfig(config);

        // Run twice with a stop in between: the second run picks up at "gamma".
        std::vector<std::string> targets = {"alpha", "beta", "gamma", "delta"};
        LSV::RequeueingIterator<std::string> work("targets.ckpt", LSV::makeVectorSource(targets), options);
        work.forEach([](const std::string& target) {
            std::cout << "processing " << target << std::endl;
            return target == "gamma" ? LSV::LoopControl::Stop : LSV::LoopControl::Continue;
        });

        if (argc > 1) {
            auto lines = LSV::FilePositionTracker::openFile(argv[1], "input.pos", options);
            size_t count = 0;
            for (const std::string& line : *lines) {
                if (!line.empty()) {
                    ++count;
                }
            }
            LSV_LOG_INFO_META("main", "Input consumed", {{"non_empty_lines", std::to_string(count)}});
        }
    } catch (const std::exception& e) {
        LSV_LOG_ERROR("main", std::string("Run failed: ") + e.what());
        return 1;
    }

    logger.flush();
    return 0;
}
