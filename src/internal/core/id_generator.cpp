// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - Record Id Generator Implementation                                ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "id_generator.hpp"

#include <utility>

namespace chartdb::core {

IdGenerator::IdGenerator()
    : IdGenerator([] { return std::chrono::system_clock::now(); })
{
}

IdGenerator::IdGenerator(Clock clock)
    : clock_(std::move(clock))
{
}

std::string IdGenerator::next() {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        clock_().time_since_epoch()).count();

    auto id = static_cast<std::int64_t>(millis);
    if (id <= last_) {
        id = last_ + 1;
    }
    last_ = id;

    return std::to_string(id);
}

} // namespace chartdb::core
