#include <clusterlb/core/log.h>

#include <array>
#include <memory>
#include <mutex>

namespace clusterlb::log {
namespace {

struct LevelName {
    std::string_view name;
    chlog::level level;
};

constexpr std::array<LevelName, 8> kLevels{{
    {"trace", chlog::level::trace},
    {"debug", chlog::level::debug},
    {"info", chlog::level::info},
    {"warn", chlog::level::warn},
    {"warning", chlog::level::warn},
    {"error", chlog::level::error},
    {"critical", chlog::level::critical},
    {"off", chlog::level::off},
}};

const LevelName* FindLevel(std::string_view level) {
    for (const auto& l : kLevels) {
        if (l.name == level) {
            return &l;
        }
    }
    return nullptr;
}

std::once_flag g_once;
std::unique_ptr<chlog::logger> g_logger;

} // namespace

chlog::level ParseLevel(std::string_view level) {
    const auto* l = FindLevel(level);
    return l != nullptr ? l->level : chlog::level::info;
}

void Init(std::string_view level) {
    std::call_once(g_once, [] {
        chlog::logger_config cfg;
        cfg.name = "clusterlb";
        cfg.level = chlog::level::info;
        cfg.pattern = "[{date} {time}.{ms}][{lvl}][tid={tid}] {msg}";
        cfg.async.enabled = false;
        cfg.parallel_sinks = false;

        g_logger = std::make_unique<chlog::logger>(std::move(cfg));
        g_logger->add_sink(std::make_shared<chlog::console_sink>(chlog::console_sink::style::color));
    });

    Get().set_level(ParseLevel(level));
    if (FindLevel(level) == nullptr) {
        warn("unknown log level '{}', using info", level);
    }
}

chlog::logger& Get() {
    if (!g_logger) {
        Init("info");
    }
    return *g_logger;
}

} // namespace clusterlb::log
