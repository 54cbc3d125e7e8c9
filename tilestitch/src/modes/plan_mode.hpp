#pragma once

#include "../options.hpp"

int run_plan_mode(const Options& opts);
