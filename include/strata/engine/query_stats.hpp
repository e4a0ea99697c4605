#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace strata::engine {

/// Wall-clock time spent per query stage.
///
/// `start()` opens an interval and `record(stage)` closes it, adding the
/// elapsed time to `stage`. Stages keep the order in which they were first
/// recorded; recording the same stage again accumulates.
class QueryStats {
   public:
    using Clock = std::chrono::steady_clock;
    using Stage = std::pair<std::string, Clock::duration>;

    void start();
    /// No-op when no interval is open.
    void record(std::string_view stage);

    [[nodiscard]] auto stages() const noexcept -> const std::vector<Stage>& { return stages_; }
    [[nodiscard]] auto elapsed(std::string_view stage) const -> std::optional<Clock::duration>;
    [[nodiscard]] auto total() const -> Clock::duration;

    /// One line per stage, e.g. "compile_filter: 12 us".
    [[nodiscard]] auto summary() const -> std::string;
    void log_summary() const;

   private:
    std::optional<Clock::time_point> started_;
    std::vector<Stage> stages_;
};

}  // namespace strata::engine
