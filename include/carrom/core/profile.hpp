/**
 * @file profile.hpp
 * @brief Scope timing for the tick loop and the physics systems
 *
 * Sections nest: a section started while another is open becomes its child.
 * The profiler aggregates total time, self time (total minus children) and
 * call counts per section name, and prints them as a tree.
 *
 * Example usage:
 * @code
 * void PhysicsWorld::tick() {
 *     PROFILE_SCOPE("PhysicsWorld::tick");
 *     // ... code ...
 * }
 *
 * Profiling::Profiler::printStats(std::cout);
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <stack>
#include <string>
#include <unordered_map>
#include <vector>

namespace Profiling {

/**
 * @brief Process-wide timing registry.
 *
 * Singleton; use the static methods. Not thread safe, which matches the
 * single-threaded tick loop.
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;
    using Duration  = std::chrono::nanoseconds;

    /**
     * @brief Aggregated statistics for one named section
     */
    struct ProfileData {
        Duration total_time{0};
        Duration self_time{0};
        uint64_t call_count{0};
        Duration max_time{0};

        std::string parent_name;
        std::vector<std::string> children;
    };

    /**
     * @brief Open a section. Must be closed with endSection in LIFO order.
     */
    static void startSection(const std::string& name);

    /**
     * @brief Close the most recently opened section.
     *
     * A mismatched name is reported on stderr and ignored.
     */
    static void endSection(const std::string& name);

    /**
     * @brief Statistics for a section, or nullptr if it never ran.
     */
    static const ProfileData* find(const std::string& name);

    /**
     * @brief Print the section tree with call counts and time shares.
     */
    static void printStats(std::ostream& out);

    /**
     * @brief Drop all recorded sections.
     */
    static void reset();

private:
    struct SectionData {
        TimePoint start_time;
        ProfileData profile_data;
    };

    std::unordered_map<std::string, SectionData> sections;
    std::stack<std::string> scope_stack;

    Profiler() = default;

    static Profiler& getInstance();

    static void printNode(std::ostream& out,
                          const std::string& name,
                          const std::string& prefix,
                          bool is_last,
                          Duration total_program_time);
};

/**
 * @brief RAII guard: starts a section on construction, ends it on destruction.
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string section_name;
};

} // namespace Profiling

#define PROFILE_CONCAT_INNER(a, b) a##b
#define PROFILE_CONCAT(a, b) PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Time the enclosing scope under the given section name.
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
