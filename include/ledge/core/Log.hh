#pragma once

// Ledge Logging Subsystem
// Wraps Quill v11.x async structured logging.
//
// Usage:
//   #include "ledge/core/Log.hh"
//   LEDGE_LOG_INFO("Loaded movement config from {}", path);
//   LEDGE_MOVEMENT_DEBUG("Wall jump dispatched: {}", kind);
//
// The controller is embedded in hosts that may never call init(). All macros
// check for a null logger first, so logging before init() is a no-op.

// Neutralize X11 macro pollution.  <X11/X.h> (pulled in through SDL on some
// Linux setups) defines bare-word macros that collide with Quill's enum
// member names.
#ifdef Always
#undef Always
#endif
#ifdef None
#undef None
#endif
#ifdef Never
#undef Never
#endif
#ifdef Bool
#undef Bool
#endif
#ifdef Status
#undef Status
#endif
#ifdef Success
#undef Success
#endif
#ifdef True
#undef True
#endif
#ifdef False
#undef False
#endif

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>

namespace ledge::log {

/// Initialize the logging subsystem (console output only).
/// Call once at startup before any logging.
void init();

/// Initialize with a file sink in addition to console.
void init(const char* log_file_path);

/// Flush pending messages and stop the backend thread.
void shutdown();

/// Root logger. Null before init().
quill::Logger* logger();

/// Movement channel (jump dispatch, phase changes, config warnings).
quill::Logger* movementLogger();

/// Physics channel (Jolt adapter lifecycle, body creation).
quill::Logger* physicsLogger();

/// Set runtime log level (within compile-time ceiling).
void setLevel(quill::LogLevel level);
void setMovementLevel(quill::LogLevel level);
void setPhysicsLevel(quill::LogLevel level);

} // namespace ledge::log

#define LEDGE_DETAIL_LOG(getter, quillMacro, fmt, ...)                                                                \
    do {                                                                                                               \
        if (quill::Logger* ledgeLogger_ = (getter)) {                                                                  \
            quillMacro(ledgeLogger_, fmt, ##__VA_ARGS__);                                                              \
        }                                                                                                              \
    } while (0)

// Root logger macros. Compile-time filtering: in Release builds, DEBUG and
// TRACE are absent.
#define LEDGE_LOG_TRACE(fmt, ...) LEDGE_DETAIL_LOG(ledge::log::logger(), QUILL_LOG_TRACE_L1, fmt, ##__VA_ARGS__)
#define LEDGE_LOG_DEBUG(fmt, ...) LEDGE_DETAIL_LOG(ledge::log::logger(), QUILL_LOG_DEBUG, fmt, ##__VA_ARGS__)
#define LEDGE_LOG_INFO(fmt, ...) LEDGE_DETAIL_LOG(ledge::log::logger(), QUILL_LOG_INFO, fmt, ##__VA_ARGS__)
#define LEDGE_LOG_WARN(fmt, ...) LEDGE_DETAIL_LOG(ledge::log::logger(), QUILL_LOG_WARNING, fmt, ##__VA_ARGS__)
#define LEDGE_LOG_ERROR(fmt, ...) LEDGE_DETAIL_LOG(ledge::log::logger(), QUILL_LOG_ERROR, fmt, ##__VA_ARGS__)
#define LEDGE_LOG_CRITICAL(fmt, ...) LEDGE_DETAIL_LOG(ledge::log::logger(), QUILL_LOG_CRITICAL, fmt, ##__VA_ARGS__)

// Channel macros
#define LEDGE_MOVEMENT_DEBUG(fmt, ...)                                                                                 \
    LEDGE_DETAIL_LOG(ledge::log::movementLogger(), QUILL_LOG_DEBUG, fmt, ##__VA_ARGS__)
#define LEDGE_MOVEMENT_WARN(fmt, ...)                                                                                  \
    LEDGE_DETAIL_LOG(ledge::log::movementLogger(), QUILL_LOG_WARNING, fmt, ##__VA_ARGS__)
#define LEDGE_PHYSICS_DEBUG(fmt, ...)                                                                                  \
    LEDGE_DETAIL_LOG(ledge::log::physicsLogger(), QUILL_LOG_DEBUG, fmt, ##__VA_ARGS__)
#define LEDGE_PHYSICS_WARN(fmt, ...)                                                                                   \
    LEDGE_DETAIL_LOG(ledge::log::physicsLogger(), QUILL_LOG_WARNING, fmt, ##__VA_ARGS__)
