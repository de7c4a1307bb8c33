#include "ledge/core/Log.hh"

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

#include <memory>
#include <string>
#include <vector>

namespace ledge::log {

namespace {
quill::Logger* g_logger = nullptr;
quill::Logger* g_logger_movement = nullptr;
quill::Logger* g_logger_physics = nullptr;

std::shared_ptr<quill::Sink> makeFileSink(const std::string& filename) {
    return quill::Frontend::create_or_get_sink<quill::FileSink>(filename, []() {
        quill::FileSinkConfig cfg;
        cfg.set_open_mode('w');
        cfg.set_filename_append_option(quill::FilenameAppendOption::StartDateTime);
        return cfg;
    }());
}

quill::PatternFormatterOptions makePattern() {
    quill::PatternFormatterOptions pattern;
    pattern.format_pattern = "%(time) [%(logger:<8)] %(short_source_location:<28) "
                             "%(log_level:<9) %(message)";
    pattern.timestamp_pattern = "%H:%M:%S.%Qms";
    return pattern;
}

void startBackend() {
    quill::BackendOptions backend_opts;
    backend_opts.thread_name = "LedgeLog";
    backend_opts.wait_for_queues_to_empty_before_exit = true;
    quill::Backend::start(backend_opts);
}

void createLoggers(const std::vector<std::shared_ptr<quill::Sink>>& sinks) {
    auto pattern = makePattern();

    g_logger = quill::Frontend::create_or_get_logger("ledge", sinks, pattern);
    g_logger_movement = quill::Frontend::create_or_get_logger("movement", sinks, pattern);
    g_logger_physics = quill::Frontend::create_or_get_logger("physics", sinks, pattern);

    for (auto* lg : {g_logger, g_logger_movement, g_logger_physics})
        lg->set_log_level(quill::LogLevel::Info);
}

} // namespace

void init() {
    startBackend();
    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
    createLoggers({console_sink});
}

void init(const char* log_file_path) {
    startBackend();
    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
    auto file_sink = makeFileSink(log_file_path);
    createLoggers({console_sink, file_sink});
}

void shutdown() {
    for (auto* lg : {g_logger, g_logger_movement, g_logger_physics}) {
        if (lg)
            lg->flush_log();
    }
    quill::Backend::stop();

    g_logger = nullptr;
    g_logger_movement = nullptr;
    g_logger_physics = nullptr;
}

quill::Logger* logger() {
    return g_logger;
}

quill::Logger* movementLogger() {
    return g_logger_movement;
}

quill::Logger* physicsLogger() {
    return g_logger_physics;
}

void setLevel(quill::LogLevel level) {
    if (g_logger)
        g_logger->set_log_level(level);
}

void setMovementLevel(quill::LogLevel level) {
    if (g_logger_movement)
        g_logger_movement->set_log_level(level);
}

void setPhysicsLevel(quill::LogLevel level) {
    if (g_logger_physics)
        g_logger_physics->set_log_level(level);
}

} // namespace ledge::log
