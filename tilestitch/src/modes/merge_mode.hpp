#pragma once

#include "../options.hpp"

int run_merge_mode(const Options& opts);
