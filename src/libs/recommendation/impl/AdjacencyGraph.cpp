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

#include "recommendation/AdjacencyGraph.hpp"

#include <algorithm>
#include <cassert>
#include <ostream>
#include <unordered_set>

#include <boost/graph/connected_components.hpp>
#include <boost/graph/graphviz.hpp>

#include "core/ILogger.hpp"
#include "recommendation/Exception.hpp"
#include "recommendation/InteractionTable.hpp"
#include "recommendation/PreferenceLedger.hpp"
#include "recommendation/RatingMatrix.hpp"

namespace fooder::recommendation
{
    namespace
    {
        // Rows: the active user first, then the neighbors
        // Columns: the ledger recipes, then the ones only rated by the neighbors
        RatingMatrix buildGraphMatrix(const InteractionTable& table, const PreferenceLedger& ledger, std::span<const UserId> neighbors, Rating polarity)
        {
            const std::unordered_set<UserId> neighborUsers(std::cbegin(neighbors), std::cend(neighbors));
            const std::vector<InteractionRecord> neighborRecords{ table.select([&](const InteractionRecord& record) { return neighborUsers.contains(record.userId); }) };
            const RatingMatrix neighborMatrix{ RatingMatrix::build(neighborRecords) };

            std::vector<RecipeId> recipeIds{ ledger.getRecipeIds() };
            std::sort(std::begin(recipeIds), std::end(recipeIds));
            for (RecipeId recipeId : neighborMatrix.getRecipeIds())
            {
                if (!ledger.contains(recipeId))
                    recipeIds.push_back(recipeId);
            }

            std::vector<UserId> userIds;
            userIds.reserve(neighbors.size() + 1);
            userIds.push_back(UserId{}); // placeholder for the active user, overwritten below
            userIds.insert(std::end(userIds), std::cbegin(neighbors), std::cend(neighbors));

            RatingMatrix matrix{ neighborMatrix.reindex(userIds, recipeIds) };

            // active user row: only the ratings of the requested polarity
            for (std::size_t column{}; column < matrix.getColumnCount(); ++column)
            {
                const std::optional<Rating> rating{ ledger.find(recipeIds[column]) };
                matrix.set(0, column, rating == polarity ? toRatingValue(polarity) : noRating);
            }

            return matrix;
        }
    } // namespace

    std::string AdjacencyGraph::Node::getLabel() const
    {
        if (!userId)
            return std::string{ activeUserLabel };

        return "user: " + std::to_string(userId->value());
    }

    AdjacencyGraph::AdjacencyGraph()
    {
        boost::add_vertex(Node{}, _graph);
    }

    AdjacencyGraph::NodeIndex AdjacencyGraph::addNode(UserId userId)
    {
        return boost::add_vertex(Node{ userId }, _graph);
    }

    void AdjacencyGraph::addEdge(NodeIndex source, NodeIndex target, RecipeId recipeId)
    {
        assert(source < getNodeCount() && target < getNodeCount());
        boost::add_edge(source, target, EdgeProperties{ recipeId }, _graph);
    }

    const AdjacencyGraph::Node& AdjacencyGraph::getNode(NodeIndex node) const
    {
        assert(node < getNodeCount());
        return _graph[node];
    }

    std::size_t AdjacencyGraph::getNodeCount() const
    {
        return boost::num_vertices(_graph);
    }

    std::size_t AdjacencyGraph::getEdgeCount() const
    {
        return boost::num_edges(_graph);
    }

    std::optional<AdjacencyGraph::NodeIndex> AdjacencyGraph::findNode(std::string_view label) const
    {
        for (auto [it, end]{ boost::vertices(_graph) }; it != end; ++it)
        {
            if (_graph[*it].getLabel() == label)
                return *it;
        }

        return std::nullopt;
    }

    std::vector<RecipeId> AdjacencyGraph::getEdgeRecipes(std::string_view labelA, std::string_view labelB) const
    {
        std::vector<RecipeId> res;

        const std::optional<NodeIndex> nodeA{ findNode(labelA) };
        const std::optional<NodeIndex> nodeB{ findNode(labelB) };
        if (!nodeA || !nodeB)
            return res;

        for (auto [it, end]{ boost::out_edges(*nodeA, _graph) }; it != end; ++it)
        {
            if (boost::target(*it, _graph) == *nodeB)
                res.push_back(_graph[*it].recipeId);
        }

        return res;
    }

    void AdjacencyGraph::pruneUnreachableNodes()
    {
        std::vector<std::size_t> components(getNodeCount());
        boost::connected_components(_graph, boost::make_iterator_property_map(std::begin(components), boost::get(boost::vertex_index, _graph)));

        const std::size_t activeUserComponent{ components[activeUserNode] };

        Graph prunedGraph;
        std::vector<NodeIndex> newIndexes(getNodeCount());
        for (NodeIndex node{}; node < getNodeCount(); ++node)
        {
            if (components[node] == activeUserComponent)
                newIndexes[node] = boost::add_vertex(_graph[node], prunedGraph);
        }

        // both ends of an edge are in the same component
        for (auto [it, end]{ boost::edges(_graph) }; it != end; ++it)
        {
            const NodeIndex source{ boost::source(*it, _graph) };
            if (components[source] == activeUserComponent)
                boost::add_edge(newIndexes[source], newIndexes[boost::target(*it, _graph)], _graph[*it], prunedGraph);
        }

        _graph = std::move(prunedGraph);
    }

    void AdjacencyGraph::writeGraphviz(std::ostream& os, std::string_view graphName) const
    {
        boost::write_graphviz(
            os, _graph,
            [this](std::ostream& out, Graph::vertex_descriptor node) { out << "[label=" << boost::escape_dot_string(_graph[node].getLabel()) << "]"; },
            [this](std::ostream& out, Graph::edge_descriptor edge) { out << "[label=" << _graph[edge].recipeId.value() << "]"; },
            [graphName](std::ostream& out) { out << "label=" << boost::escape_dot_string(std::string{ graphName }) << ";" << std::endl; });
    }

    AdjacencyGraph buildAdjacencyGraph(const InteractionTable& table, const PreferenceLedger& ledger, std::span<const UserId> neighbors, Rating polarity, GraphPruning pruning)
    {
        if (neighbors.empty())
        {
            FOODER_LOG(RECOMMENDATION, WARNING, "No neighbor found");
            throw NoNeighborException{};
        }

        const RatingMatrix matrix{ buildGraphMatrix(table, ledger, neighbors, polarity) };
        const RatingValue polarityValue{ toRatingValue(polarity) };

        AdjacencyGraph graph;
        for (UserId neighbor : neighbors)
            graph.addNode(neighbor);

        // node i is matrix row i
        for (std::size_t rowA{}; rowA < matrix.getRowCount(); ++rowA)
        {
            for (std::size_t rowB{ rowA + 1 }; rowB < matrix.getRowCount(); ++rowB)
            {
                for (std::size_t column{}; column < matrix.getColumnCount(); ++column)
                {
                    const RatingValue valueA{ matrix.get(rowA, column) };
                    const RatingValue valueB{ matrix.get(rowB, column) };

                    // only the columns where at least one of them holds the polarity
                    if (valueA != polarityValue && valueB != polarityValue)
                        continue;

                    if (valueA == valueB)
                        graph.addEdge(rowA, rowB, matrix.getRecipeIds()[column]);
                }
            }
        }

        if (pruning == GraphPruning::ConnectedComponent)
            graph.pruneUnreachableNodes();

        FOODER_LOG(RECOMMENDATION, DEBUG, "Built " << toString(polarity) << " graph with " << graph.getNodeCount() << " nodes and " << graph.getEdgeCount() << " edges");

        return graph;
    }
} // namespace fooder::recommendation
