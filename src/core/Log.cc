#include "strata/core/Log.hh"

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace strata::log {

namespace {
quill::Logger* g_logger = nullptr;
quill::Logger* g_logger_render = nullptr;
quill::Logger* g_logger_terrain = nullptr;

const std::string kLogsDir = "logs";

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
    pattern.format_pattern = "%(time) [%(thread_id)] %(short_source_location:<28) "
                             "%(log_level:<9) %(message)";
    pattern.timestamp_pattern = "%H:%M:%S.%Qms";
    return pattern;
}

void startBackend() {
    quill::BackendOptions backend_opts;
    backend_opts.thread_name = "StrataLog";
    backend_opts.wait_for_queues_to_empty_before_exit = true;
    quill::Backend::start(backend_opts);
}

// Builds the three loggers. `extra` (may be null) is attached to every logger.
void createLoggers(const std::shared_ptr<quill::Sink>& extra) {
    std::filesystem::create_directories(kLogsDir);

    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
    auto pattern = makePattern();

    auto sinksWith = [&](std::shared_ptr<quill::Sink> file) {
        std::vector<std::shared_ptr<quill::Sink>> sinks{console_sink, std::move(file)};
        if (extra) {
            sinks.push_back(extra);
        }
        return sinks;
    };

    // Root logger: console + strata.log
    g_logger = quill::Frontend::create_or_get_logger("strata", sinksWith(makeFileSink(kLogsDir + "/strata.log")),
                                                     pattern);

    // Render logger: console + render.log (draw validation, pipeline specialization)
    g_logger_render =
        quill::Frontend::create_or_get_logger("render", sinksWith(makeFileSink(kLogsDir + "/render.log")), pattern);

    // Terrain logger: console + terrain.log (noise sampling)
    g_logger_terrain =
        quill::Frontend::create_or_get_logger("terrain", sinksWith(makeFileSink(kLogsDir + "/terrain.log")), pattern);

    for (auto* lg : {g_logger, g_logger_render, g_logger_terrain}) {
        lg->set_log_level(quill::LogLevel::Info);
    }
}

} // namespace

void init() {
    startBackend();
    createLoggers(nullptr);
}

void init(const char* log_file_path) {
    startBackend();
    createLoggers(makeFileSink(log_file_path));
}

void shutdown() {
    for (auto* lg : {g_logger, g_logger_render, g_logger_terrain}) {
        if (lg)
            lg->flush_log();
    }
    quill::Backend::stop();
}

quill::Logger* logger() {
    return g_logger;
}

quill::Logger* renderLogger() {
    return g_logger_render ? g_logger_render : g_logger;
}

quill::Logger* terrainLogger() {
    return g_logger_terrain ? g_logger_terrain : g_logger;
}

void applyLevels(const LogLevels& levels) {
    if (g_logger)
        g_logger->set_log_level(levels.root);
    if (g_logger_render)
        g_logger_render->set_log_level(levels.render);
    if (g_logger_terrain)
        g_logger_terrain->set_log_level(levels.terrain);
}

LogLevels currentLevels() {
    LogLevels levels;
    if (g_logger)
        levels.root = g_logger->get_log_level();
    if (g_logger_render)
        levels.render = g_logger_render->get_log_level();
    if (g_logger_terrain)
        levels.terrain = g_logger_terrain->get_log_level();
    return levels;
}

std::optional<quill::LogLevel> levelFromName(std::string_view name) {
    struct Entry {
        std::string_view name;
        quill::LogLevel level;
    };
    static constexpr Entry kLevels[] = {
        {"trace", quill::LogLevel::TraceL1}, {"debug", quill::LogLevel::Debug},
        {"info", quill::LogLevel::Info},     {"warning", quill::LogLevel::Warning},
        {"warn", quill::LogLevel::Warning},  {"error", quill::LogLevel::Error},
        {"critical", quill::LogLevel::Critical},
    };
    for (const auto& entry : kLevels) {
        if (entry.name == name) {
            return entry.level;
        }
    }
    return std::nullopt;
}

} // namespace strata::log
