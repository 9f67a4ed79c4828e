/**
 * @file profile.cpp
 * @brief Implementation of the scope timer described in profile.hpp
 */

#include "collide2d/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::attachToParent(const std::string& name, SectionData& section) {
    if (open_sections.empty()) {
        section.profile_data.parent_name.clear();
        return;
    }

    const std::string parent = open_sections.top();
    std::string& previous = section.profile_data.parent_name;

    // a section re-entered under a different parent moves in the tree
    if (!previous.empty() && previous != parent) {
        auto& siblings = sections[previous].profile_data.children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), name), siblings.end());
    }
    previous = parent;

    auto& children = sections[parent].profile_data.children;
    if (std::find(children.begin(), children.end(), name) == children.end()) {
        children.push_back(name);
    }
}

void Profiler::startSection(const std::string& name) {
    auto& instance = getInstance();
    auto& section = instance.sections[name];
    instance.attachToParent(name, section);
    instance.open_sections.push(name);
    section.start_time = Clock::now();
}

void Profiler::endSection(const std::string& name) {
    auto const now = Clock::now();
    auto& instance = getInstance();

    if (instance.open_sections.empty() || instance.open_sections.top() != name) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name
                  << "\") does not match the innermost open section.\n";
        return;
    }

    auto& data = instance.sections[name].profile_data;
    Duration const elapsed = std::chrono::duration_cast<Duration>(now - instance.sections[name].start_time);

    data.total_time += elapsed;
    data.self_time += elapsed;
    data.call_count++;
    data.min_time = std::min(data.min_time, elapsed);
    data.max_time = std::max(data.max_time, elapsed);

    if (!data.parent_name.empty()) {
        instance.sections[data.parent_name].profile_data.self_time -= elapsed;
    }

    instance.open_sections.pop();
}

uint64_t Profiler::getCallCount(const std::string& name) {
    auto& instance = getInstance();
    auto it = instance.sections.find(name);
    return it == instance.sections.end() ? 0 : it->second.profile_data.call_count;
}

Profiler::Duration Profiler::getTotalTime(const std::string& name) {
    auto& instance = getInstance();
    auto it = instance.sections.find(name);
    return it == instance.sections.end() ? Duration{0} : it->second.profile_data.total_time;
}

void Profiler::printStats() {
    auto& instance = getInstance();

    std::vector<std::string> roots;
    Duration total{0};
    for (const auto& [name, section] : instance.sections) {
        if (section.profile_data.parent_name.empty()) {
            roots.push_back(name);
            total += section.profile_data.total_time;
        }
    }
    std::sort(roots.begin(), roots.end());

    std::cout << "\nCollision pipeline timing:\n";
    for (std::size_t i = 0; i < roots.size(); ++i) {
        printNode(roots[i], "", i + 1 == roots.size(), total);
    }
}

void Profiler::printNode(const std::string& name,
                         const std::string& prefix,
                         bool is_last,
                         Duration total_time)
{
    const auto& pd = getInstance().sections.at(name).profile_data;

    double totalShare = 0.0;
    double selfShare = 0.0;
    if (total_time.count() > 0) {
        totalShare = 100.0 * static_cast<double>(pd.total_time.count()) / static_cast<double>(total_time.count());
        selfShare = 100.0 * static_cast<double>(pd.self_time.count()) / static_cast<double>(total_time.count());
    }
    double const avgUs = pd.call_count > 0
        ? static_cast<double>(pd.total_time.count()) / 1000.0 / static_cast<double>(pd.call_count)
        : 0.0;

    std::cout << prefix << (is_last ? "└── " : "├── ")
              << name << " [" << pd.call_count << " calls, avg "
              << std::fixed << std::setprecision(1) << avgUs << "us] "
              << std::setprecision(2) << totalShare << "% (self " << selfShare << "%)\n";

    std::string const childPrefix = prefix + (is_last ? "    " : "│   ");
    for (std::size_t i = 0; i < pd.children.size(); ++i) {
        printNode(pd.children[i], childPrefix, i + 1 == pd.children.size(), total_time);
    }
}

void Profiler::reset() {
    auto& instance = getInstance();
    instance.sections.clear();
    instance.open_sections = std::stack<std::string>();
}

ScopedProfiler::ScopedProfiler(std::string name)
    : section_name(std::move(name))
{
    Profiler::startSection(section_name);
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::endSection(section_name);
}

} // namespace Profiling
