#pragma once

#include "../options.hpp"

int run_split_mode(const Options& opts);
