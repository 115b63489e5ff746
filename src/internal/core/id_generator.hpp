// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - Record Id Generator                                               ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace chartdb::core {

/// Issues decimal millisecond timestamps as record ids. Ids from one
/// generator are strictly increasing even when the clock stalls or steps back.
class IdGenerator {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    IdGenerator();
    explicit IdGenerator(Clock clock);

    [[nodiscard]] std::string next();

private:
    Clock clock_;
    std::int64_t last_{0};
};

} // namespace chartdb::core
