/**
 * @file profile.hpp
 * @brief Lightweight timing of named code sections
 *
 * Sections are timed with an RAII guard and aggregated by name: call count,
 * total, fastest and slowest duration.
 *
 * Example usage:
 * @code
 * void World::step(double dt) {
 *     PROFILE_SCOPE("World::step");
 *     // ...
 * }
 *
 * std::cout << Profiling::Profiler::report();
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace Profiling {

/**
 * @brief Process-wide store of section timings.
 *
 * Single-threaded by design, like the simulation it measures.
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using Duration  = std::chrono::nanoseconds;

    /**
     * @brief Aggregated timings of one named section
     */
    struct SectionStats {
        uint64_t call_count{0};
        Duration total_time{0};
        Duration min_time{Duration::max()};
        Duration max_time{0};
    };

    /**
     * @brief Adds one measured run of a section.
     */
    static void record(const std::string& name, Duration elapsed);

    /**
     * @brief Stats for a section; a default record if it never ran.
     */
    static SectionStats stats(const std::string& name);

    /**
     * @brief One line per section, sorted by name:
     *        "name [N calls] total X.XXms (min A.AAus, max B.BBus)"
     */
    static std::string report();

    /** @brief Forget everything recorded so far */
    static void reset();

private:
    Profiler() = default;
    static Profiler& getInstance();

    std::map<std::string, SectionStats> sections;
};

/**
 * @brief RAII guard: starts the clock on construction, records on destruction.
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string section_name;
    Profiler::Clock::time_point start_time;
};

} // namespace Profiling

#define CORE2D_PROFILE_CONCAT_INNER(a, b) a##b
#define CORE2D_PROFILE_CONCAT(a, b) CORE2D_PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the rest of the enclosing scope under the given name.
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler CORE2D_PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
