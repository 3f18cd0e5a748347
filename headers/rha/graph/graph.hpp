#ifndef RHA_GRAPH_HPP
#define RHA_GRAPH_HPP

/**
 * @file graph.hpp
 * @brief File-level dependency graph and cycle sampling.
 *
 * An edge A -> B means "A imports B". Edges are unique and a file never
 * depends on itself, so out-degree is Ce and in-degree is Ca.
 */

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace rha::graph {

    /// Files of a cycle in traversal order, closed by repeating the first.
    using Cycle = std::vector<std::string>;

    class DependencyGraph {
    public:
        /**
         * Registers a file with no edges. Re-adding is a no-op.
         */
        void add_module(const std::string& module);

        /**
         * Records that @p from imports @p to, registering both files.
         *
         * @return true if the edge is new; false for duplicates and self edges.
         */
        bool add_dependency(const std::string& from, const std::string& to);

        [[nodiscard]] bool contains(const std::string& module) const;
        [[nodiscard]] bool depends_on(const std::string& from, const std::string& to) const;

        /// Files in lexicographic order.
        [[nodiscard]] std::vector<std::string> modules() const;

        [[nodiscard]] std::size_t module_count() const noexcept {
            return edges_.size();
        }

        [[nodiscard]] std::size_t dependency_count() const noexcept {
            return dependency_count_;
        }

        /// Files imported by @p module (empty for unknown files).
        [[nodiscard]] const std::set<std::string>& dependencies(const std::string& module) const;

        /// Files importing @p module (empty for unknown files).
        [[nodiscard]] const std::set<std::string>& dependents(const std::string& module) const;

    private:
        struct Edges {
            std::set<std::string> out;
            std::set<std::string> in;
        };

        std::map<std::string, Edges> edges_;
        std::size_t dependency_count_ = 0;
    };

    /**
     * Samples dependency cycles with a depth-first walk from each file in
     * lexicographic order. Stops after @p limit cycles.
     */
    [[nodiscard]] std::vector<Cycle> find_cycles(const DependencyGraph& graph, std::size_t limit = 10);

}  // namespace rha::graph

#endif // RHA_GRAPH_HPP
