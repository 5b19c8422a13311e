#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for beacon_stream

namespace beacon_stream {

class RunLoop;

template<typename T>
class AsyncBuffer;

template<typename T = void>
class Task;

template<typename T>
class UnsafeSendable;

} // namespace beacon_stream
