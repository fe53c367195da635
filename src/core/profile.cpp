/**
 * @file profile.cpp
 * @brief Implementation of the scope profiler described in profile.hpp
 */

#include "carrom/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::startSection(const std::string& name) {
    auto& instance = getInstance();
    auto& section  = instance.sections[name];

    section.start_time = Clock::now();

    if (!instance.scope_stack.empty()) {
        const std::string parentName = instance.scope_stack.top();

        // A section called from a different parent than last time moves in the tree
        if (!section.profile_data.parent_name.empty() &&
            section.profile_data.parent_name != parentName)
        {
            auto& oldSiblings =
                instance.sections[section.profile_data.parent_name].profile_data.children;
            oldSiblings.erase(std::remove(oldSiblings.begin(), oldSiblings.end(), name),
                              oldSiblings.end());
        }
        section.profile_data.parent_name = parentName;

        auto& siblings = instance.sections[parentName].profile_data.children;
        if (std::find(siblings.begin(), siblings.end(), name) == siblings.end()) {
            siblings.push_back(name);
        }
    } else {
        section.profile_data.parent_name.clear();
    }

    instance.scope_stack.push(name);
}

void Profiler::endSection(const std::string& name) {
    auto& instance = getInstance();

    if (instance.scope_stack.empty() || instance.scope_stack.top() != name) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name
                  << "\") does not match the innermost open section.\n";
        return;
    }

    auto& section = instance.sections[name];
    Duration const duration = Clock::now() - section.start_time;

    section.profile_data.total_time += duration;
    section.profile_data.self_time  += duration;
    section.profile_data.call_count += 1;
    section.profile_data.max_time = std::max(section.profile_data.max_time, duration);

    if (!section.profile_data.parent_name.empty()) {
        instance.sections[section.profile_data.parent_name].profile_data.self_time -= duration;
    }

    instance.scope_stack.pop();
}

const Profiler::ProfileData* Profiler::find(const std::string& name) {
    auto& instance = getInstance();
    auto it = instance.sections.find(name);
    if (it == instance.sections.end()) {
        return nullptr;
    }
    return &it->second.profile_data;
}

void Profiler::printStats(std::ostream& out) {
    auto& instance = getInstance();
    out << "\nProfiling Statistics:\n";

    std::vector<std::string> roots;
    for (auto& [name, sdata] : instance.sections) {
        if (sdata.profile_data.parent_name.empty()) {
            roots.push_back(name);
        }
    }
    // unordered_map order is unspecified; keep the report stable
    std::sort(roots.begin(), roots.end());

    Duration totalTime{0};
    for (auto& r : roots) {
        totalTime += instance.sections[r].profile_data.total_time;
    }

    for (size_t i = 0; i < roots.size(); ++i) {
        printNode(out, roots[i], "", i == roots.size() - 1, totalTime);
    }
}

void Profiler::printNode(std::ostream& out,
                         const std::string& name,
                         const std::string& prefix,
                         bool isLast,
                         Duration totalProgramTime)
{
    const auto& pd = getInstance().sections.at(name).profile_data;

    double totalPercent = 0.0;
    double selfPercent = 0.0;
    if (totalProgramTime.count() > 0) {
        totalPercent = (pd.total_time.count() * 100.0) / totalProgramTime.count();
        selfPercent  = (pd.self_time.count()  * 100.0) / totalProgramTime.count();
    }

    auto totalUs = std::chrono::duration_cast<std::chrono::microseconds>(pd.total_time).count();

    out << prefix << (isLast ? "`-- " : "|-- ")
        << name << " [" << pd.call_count << " calls] "
        << totalUs << "us (total: "
        << std::fixed << std::setprecision(2) << totalPercent << "%, "
        << "self: " << selfPercent << "%)\n";

    for (size_t i = 0; i < pd.children.size(); ++i) {
        std::string const childPrefix = prefix + (isLast ? "    " : "|   ");
        printNode(out, pd.children[i], childPrefix, i == pd.children.size() - 1, totalProgramTime);
    }
}

void Profiler::reset() {
    auto& instance = getInstance();
    instance.sections.clear();
    instance.scope_stack = {};
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
