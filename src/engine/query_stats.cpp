#include <strata/engine/query_stats.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace strata::engine {

namespace {

auto format_elapsed(QueryStats::Clock::duration elapsed) -> std::string {
    using namespace std::chrono;
    auto micros = duration_cast<microseconds>(elapsed).count();
    if (micros < 1000) {
        return fmt::format("{} us", micros);
    }
    if (micros < 1000 * 1000) {
        return fmt::format("{:.3f} ms", static_cast<double>(micros) / 1000.0);
    }
    return fmt::format("{:.3f} s", static_cast<double>(micros) / 1'000'000.0);
}

}  // namespace

void QueryStats::start() {
    started_ = Clock::now();
}

void QueryStats::record(std::string_view stage) {
    if (!started_.has_value()) {
        return;
    }
    const auto elapsed = Clock::now() - *started_;
    started_.reset();
    auto it = std::find_if(stages_.begin(), stages_.end(),
                           [&](const Stage& s) { return s.first == stage; });
    if (it == stages_.end()) {
        stages_.emplace_back(std::string(stage), elapsed);
    } else {
        it->second += elapsed;
    }
}

auto QueryStats::elapsed(std::string_view stage) const -> std::optional<Clock::duration> {
    for (const auto& [name, duration] : stages_) {
        if (name == stage) {
            return duration;
        }
    }
    return std::nullopt;
}

auto QueryStats::total() const -> Clock::duration {
    Clock::duration sum{0};
    for (const auto& stage : stages_) {
        sum += stage.second;
    }
    return sum;
}

auto QueryStats::summary() const -> std::string {
    std::string out;
    for (const auto& [name, duration] : stages_) {
        out += fmt::format("{}: {}\n", name, format_elapsed(duration));
    }
    out += fmt::format("total: {}", format_elapsed(total()));
    return out;
}

void QueryStats::log_summary() const {
    for (const auto& [name, duration] : stages_) {
        spdlog::debug("stage {}: {}", name, format_elapsed(duration));
    }
    spdlog::debug("query total: {}", format_elapsed(total()));
}

}  // namespace strata::engine
