/**
 * @file profile.hpp
 * @brief Scope timer for the stages of a collision step
 *
 * Sections nest: a section started while another is open becomes its child,
 * so a step prints as a tree (broadphase, narrowphase, solve, ...). Timing is
 * accumulated across steps until reset().
 *
 * @code
 * void RigidBodyCollisionSystem::update(entt::registry& registry) {
 *     PROFILE_SCOPE("RigidBodyCollision");
 *     {
 *         PROFILE_SCOPE("Broadphase");
 *         // ...
 *     }
 * }
 *
 * Profiling::Profiler::printStats();
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <stack>
#include <string>
#include <unordered_map>
#include <vector>

namespace Profiling {

/**
 * @brief Process-wide timing registry. All access goes through static methods.
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::nanoseconds;

    /**
     * @brief Aggregated timing for one named section
     */
    struct ProfileData {
        Duration total_time{0};
        Duration self_time{0};         ///< total minus time spent in children
        uint64_t call_count{0};
        Duration min_time{Duration::max()};
        Duration max_time{0};

        std::string parent_name;
        std::vector<std::string> children;
    };

    /** @brief Opens a section; it must be closed by endSection with the same name */
    static void startSection(const std::string& name);

    /** @brief Closes the innermost section. Mismatched names are reported and ignored */
    static void endSection(const std::string& name);

    /** @brief Writes the section tree with call counts and time shares to stdout */
    static void printStats();

    /** @brief Number of completed calls of a section (0 if never seen) */
    static uint64_t getCallCount(const std::string& name);

    /** @brief Accumulated time of a section (0 if never seen) */
    static Duration getTotalTime(const std::string& name);

    /** @brief Forgets all sections */
    static void reset();

private:
    struct SectionData {
        TimePoint start_time;
        ProfileData profile_data;
    };

    std::unordered_map<std::string, SectionData> sections;
    std::stack<std::string> open_sections;

    Profiler() = default;

    static Profiler& getInstance();

    void attachToParent(const std::string& name, SectionData& section);

    static void printNode(const std::string& name,
                          const std::string& prefix,
                          bool is_last,
                          Duration total_time);
};

/**
 * @brief Opens a section on construction and closes it on destruction
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
 * @brief Times the enclosing scope under the given section name
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler PROFILE_CONCAT(scopedProfiler_, __LINE__) { name }
