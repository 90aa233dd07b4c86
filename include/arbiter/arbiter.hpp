#pragma once

// Logging
#include "core/log.hpp"

// Core structures
#include "rule/structure/context.hpp"
#include "rule/structure/error.hpp"
#include "rule/structure/result.hpp"
#include "rule/structure/rule.hpp"

// Execution
#include "rule/runner.hpp"

// Construction
#include "rule/builder.hpp"
#include "rule/hooks.hpp"
#include "rule/options.hpp"
