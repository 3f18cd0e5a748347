#include "rha/graph/graph.hpp"

#include <algorithm>
#include <iterator>
#include <ranges>

namespace rha::graph {

    namespace {
        const std::set<std::string> no_edges;

        enum class Mark {
            Unvisited,
            OnPath,
            Done
        };

        struct Frame {
            std::string module;
            std::set<std::string>::const_iterator next;
            std::set<std::string>::const_iterator end;
        };
    }

    void DependencyGraph::add_module(const std::string& module) {
        edges_.try_emplace(module);
    }

    bool DependencyGraph::add_dependency(const std::string& from, const std::string& to) {
        auto& source = edges_[from];
        auto& target = edges_[to];
        if (from == to || !source.out.insert(to).second) {
            return false;
        }
        target.in.insert(from);
        ++dependency_count_;
        return true;
    }

    bool DependencyGraph::contains(const std::string& module) const {
        return edges_.contains(module);
    }

    bool DependencyGraph::depends_on(const std::string& from, const std::string& to) const {
        const auto it = edges_.find(from);
        return it != edges_.end() && it->second.out.contains(to);
    }

    std::vector<std::string> DependencyGraph::modules() const {
        std::vector<std::string> result;
        result.reserve(edges_.size());
        std::ranges::copy(edges_ | std::views::keys, std::back_inserter(result));
        return result;
    }

    const std::set<std::string>& DependencyGraph::dependencies(const std::string& module) const {
        const auto it = edges_.find(module);
        return it == edges_.end() ? no_edges : it->second.out;
    }

    const std::set<std::string>& DependencyGraph::dependents(const std::string& module) const {
        const auto it = edges_.find(module);
        return it == edges_.end() ? no_edges : it->second.in;
    }

    std::vector<Cycle> find_cycles(const DependencyGraph& graph, const std::size_t limit) {
        std::vector<Cycle> cycles;
        std::map<std::string, Mark> marks;

        const auto enter = [&](std::vector<Frame>& stack, const std::string& module) {
            marks[module] = Mark::OnPath;
            const auto& out = graph.dependencies(module);
            stack.push_back({module, out.begin(), out.end()});
        };

        for (const auto& start : graph.modules()) {
            if (cycles.size() >= limit) {
                break;
            }
            if (marks[start] != Mark::Unvisited) {
                continue;
            }

            std::vector<Frame> stack;
            enter(stack, start);
            while (!stack.empty() && cycles.size() < limit) {
                auto& top = stack.back();
                if (top.next == top.end) {
                    marks[top.module] = Mark::Done;
                    stack.pop_back();
                    continue;
                }

                const std::string& target = *top.next++;
                const Mark mark = marks[target];
                if (mark == Mark::Unvisited) {
                    enter(stack, target);
                } else if (mark == Mark::OnPath) {
                    const auto first = std::ranges::find(stack, target, &Frame::module);
                    Cycle cycle;
                    for (auto it = first; it != stack.end(); ++it) {
                        cycle.push_back(it->module);
                    }
                    cycle.push_back(target);
                    cycles.push_back(std::move(cycle));
                }
            }
        }
        return cycles;
    }

}  // namespace rha::graph
