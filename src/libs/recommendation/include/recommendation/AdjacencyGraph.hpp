/*
 * Copyright (C) 2025 The Fooder Authors
 *
 * This file is part of Fooder.
 *
 * Fooder is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Fooder is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Fooder.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <boost/graph/adjacency_list.hpp>

#include "recommendation/Types.hpp"

namespace fooder::recommendation
{
    class InteractionTable;
    class PreferenceLedger;

    enum class GraphPruning
    {
        ConnectedComponent, // only keep the nodes that have a path to the active user
        None,               // keep all the neighbors, even isolated ones
    };

    // Multigraph of the active user and their neighbors
    // Each edge stands for a recipe both endpoints rated the same way
    class AdjacencyGraph
    {
    public:
        using NodeIndex = std::size_t;

        struct Node
        {
            std::optional<UserId> userId; // not set for the active user

            bool isActiveUser() const { return !userId.has_value(); }
            std::string getLabel() const;
        };

        static constexpr NodeIndex activeUserNode{ 0 };
        static constexpr std::string_view activeUserLabel{ "you" };

        // Starts with the active user node only
        AdjacencyGraph();

        NodeIndex addNode(UserId userId);
        void addEdge(NodeIndex source, NodeIndex target, RecipeId recipeId);

        const Node& getNode(NodeIndex node) const;
        std::size_t getNodeCount() const;
        std::size_t getEdgeCount() const;

        std::optional<NodeIndex> findNode(std::string_view label) const;

        // Edges between the two nodes, whatever their direction
        std::vector<RecipeId> getEdgeRecipes(std::string_view labelA, std::string_view labelB) const;

        // Removes the nodes that cannot be reached from the active user (which is always kept)
        void pruneUnreachableNodes();

        // Graphviz DOT output, one edge per shared recipe
        void writeGraphviz(std::ostream& os, std::string_view graphName = "neighbors") const;

    private:
        struct EdgeProperties
        {
            RecipeId recipeId{ 0 };
        };

        using Graph = boost::adjacency_list<boost::vecS, boost::vecS, boost::undirectedS, Node, EdgeProperties>;
        Graph _graph;
    };

    // Throws NoNeighborException if neighbors is empty
    AdjacencyGraph buildAdjacencyGraph(const InteractionTable& table, const PreferenceLedger& ledger, std::span<const UserId> neighbors, Rating polarity, GraphPruning pruning);
} // namespace fooder::recommendation
