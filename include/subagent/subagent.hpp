#pragma once

// Core types
#include "core/config.hpp"
#include "core/context.hpp"
#include "core/message.hpp"
#include "core/types.hpp"
#include "core/uuid.hpp"

// Event bus
#include "bus/bus.hpp"

// LLM providers
#include "llm/provider.hpp"
#include "llm/replay.hpp"

// Tool system
#include "tool/builtin/builtins.hpp"
#include "tool/tool.hpp"

// Subagent orchestration
#include "subagent/context_forker.hpp"
#include "subagent/executor.hpp"
#include "subagent/lifecycle_manager.hpp"
#include "subagent/types.hpp"

// Initialization and wiring
#include "sdk/sdk.hpp"
