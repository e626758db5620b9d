#pragma once

#include "duolock/logger.hpp"

constinit inline duo::Logger SmpLog { "SMP" };
constinit inline duo::Logger BugLog { "BUG" };
