#pragma once
/**
 * @file psh_share.hpp
 * @brief Layer 3: Buffer sharing built on psh_service.
 *
 * Provides the kernel sharing ABI, share-state capabilities, the pinned Buffer
 * and StaticBuffer, the double-buffered stream, and the in-process simulated
 * kernel used by tests and examples.
 */
#include "psh_service.hpp"

#include "share/kernel_abi.hpp"
#include "share/share_state.hpp"
#include "share/buffer.hpp"
#include "share/static_buffer.hpp"
#include "share/double_buffer_stream.hpp"
#include "share/sim_kernel.hpp"
