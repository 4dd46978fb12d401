/**
 * @file profile.cpp
 * @brief Implementation of the section profiler described in profile.hpp
 */

#include "core2d/core/profile.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::record(const std::string& name, Duration elapsed) {
    auto& section = getInstance().sections[name];
    section.call_count += 1;
    section.total_time += elapsed;
    if (elapsed < section.min_time) {
        section.min_time = elapsed;
    }
    if (elapsed > section.max_time) {
        section.max_time = elapsed;
    }
}

Profiler::SectionStats Profiler::stats(const std::string& name) {
    const auto& sections = getInstance().sections;
    auto it = sections.find(name);
    if (it == sections.end()) {
        return {};
    }
    return it->second;
}

std::string Profiler::report() {
    using std::chrono::duration;
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);
    for (const auto& [name, s] : getInstance().sections) {
        double const totalMs = duration<double, std::milli>(s.total_time).count();
        double const minUs = duration<double, std::micro>(s.min_time).count();
        double const maxUs = duration<double, std::micro>(s.max_time).count();
        out << name << " [" << s.call_count << " calls] total " << totalMs
            << "ms (min " << minUs << "us, max " << maxUs << "us)\n";
    }
    return out.str();
}

void Profiler::reset() {
    getInstance().sections.clear();
}

ScopedProfiler::ScopedProfiler(std::string name)
    : section_name(std::move(name))
    , start_time(Profiler::Clock::now())
{
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::record(section_name,
                     std::chrono::duration_cast<Profiler::Duration>(Profiler::Clock::now() - start_time));
}

} // namespace Profiling
