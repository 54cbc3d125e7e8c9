#include "modes/merge_mode.hpp"
#include "modes/plan_mode.hpp"
#include "modes/split_mode.hpp"
#include "options.hpp"
#include "utils/logger.hpp"

#include <exception>
#include <string>

int main(int argc, char** argv) {
    Options opts;
    if (!parse_options(argc, argv, opts)) {
        return 1;
    }

    if (opts.debug) {
        logger::set_level(logger::Level::Debug);
    } else {
        logger::set_level(opts.verbose ? logger::Level::Info : logger::Level::Warn);
    }

    try {
        switch (opts.mode) {
            case Options::Mode::Plan:
                return run_plan_mode(opts);
            case Options::Mode::Split:
                return run_split_mode(opts);
            case Options::Mode::Merge:
                return run_merge_mode(opts);
        }
    } catch (const std::exception& e) {
        logger::error("Unhandled exception: " + std::string(e.what()));
        return 1;
    }

    return 1;
}
