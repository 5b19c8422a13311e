#pragma once

/// @file stream.hpp
/// @brief Main include header for beacon_stream
///
/// beacon_stream turns push-style producers into pull-style consumers:
/// - AsyncBuffer: unbounded ordered buffer, many producers, one consumer
/// - RunLoop: per-thread queue the consumer is resumed from
/// - Task / sync_wait: coroutine plumbing for sequential consumer loops
/// - UnsafeSendable: opaque wrapper for payloads crossing threads

#include "fwd.hpp"
#include "unsafe_sendable.hpp"
#include "run_loop.hpp"
#include "async_buffer.hpp"
#include "task.hpp"
