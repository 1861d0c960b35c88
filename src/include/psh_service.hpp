#pragma once
/**
 * @file psh_service.hpp
 * @brief Layer 2: Service modules built on psh_base.
 *
 * Provides logging and the JSON runtime configuration (log level and file,
 * named kernel resources, stream sizing).
 */
#include "psh_base.hpp"

#include "utils/logger.hpp"
#include "utils/runtime_config.hpp"
