#pragma once
// Common helpers shared by every module
#include "utils/logging.hpp"
#include "utils/debug.hpp"
