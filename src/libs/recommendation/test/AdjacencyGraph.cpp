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

#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "recommendation/AdjacencyGraph.hpp"
#include "recommendation/Exception.hpp"
#include "recommendation/PreferenceLedger.hpp"

#include "Common.hpp"

namespace fooder::recommendation::tests
{
    TEST(AdjacencyGraph, labels)
    {
        AdjacencyGraph graph;
        ASSERT_EQ(graph.getNodeCount(), 1);
        EXPECT_TRUE(graph.getNode(AdjacencyGraph::activeUserNode).isActiveUser());
        EXPECT_EQ(graph.getNode(AdjacencyGraph::activeUserNode).getLabel(), "you");

        const AdjacencyGraph::NodeIndex node{ graph.addNode(UserId{ 42 }) };
        EXPECT_EQ(graph.getNode(node).getLabel(), "user: 42");
        EXPECT_EQ(graph.findNode("user: 42"), node);
        EXPECT_FALSE(graph.findNode("user: 43").has_value());
    }

    TEST(AdjacencyGraph, pruneUnreachableNodes)
    {
        AdjacencyGraph graph;
        const AdjacencyGraph::NodeIndex node1{ graph.addNode(UserId{ 1 }) };
        const AdjacencyGraph::NodeIndex node2{ graph.addNode(UserId{ 2 }) };
        const AdjacencyGraph::NodeIndex node3{ graph.addNode(UserId{ 3 }) };
        const AdjacencyGraph::NodeIndex node4{ graph.addNode(UserId{ 4 }) };

        graph.addEdge(AdjacencyGraph::activeUserNode, node2, RecipeId{ 10 });
        graph.addEdge(node2, node4, RecipeId{ 11 });
        graph.addEdge(node1, node3, RecipeId{ 12 });

        graph.pruneUnreachableNodes();

        ASSERT_EQ(graph.getNodeCount(), 3);
        EXPECT_EQ(graph.getEdgeCount(), 2);
        EXPECT_FALSE(graph.findNode("user: 1").has_value());
        EXPECT_FALSE(graph.findNode("user: 3").has_value());
        EXPECT_EQ(graph.getEdgeRecipes("you", "user: 2"), std::vector<RecipeId>{ RecipeId{ 10 } });
        EXPECT_EQ(graph.getEdgeRecipes("user: 4", "user: 2"), std::vector<RecipeId>{ RecipeId{ 11 } });
    }

    TEST(AdjacencyGraph, like)
    {
        const InteractionTable table{ makeMainDishTable() };
        PreferenceLedger ledger;
        ledger.add(RecipeId{ 102 }, Rating::Like);
        const std::vector<UserId> neighbors{ UserId{ 4 } };

        const AdjacencyGraph graph{ buildAdjacencyGraph(table, ledger, neighbors, Rating::Like, GraphPruning::ConnectedComponent) };
        EXPECT_EQ(graph.getNodeCount(), 2);
        EXPECT_EQ(graph.getEdgeCount(), 1);
        EXPECT_EQ(graph.getEdgeRecipes("you", "user: 4"), std::vector<RecipeId>{ RecipeId{ 102 } });
    }

    TEST(AdjacencyGraph, dislike)
    {
        const InteractionTable table{ makeMainDishTable() };
        PreferenceLedger ledger;
        ledger.add(RecipeId{ 102 }, Rating::Like);
        const std::vector<UserId> neighbors{ UserId{ 4 } };

        {
            const AdjacencyGraph graph{ buildAdjacencyGraph(table, ledger, neighbors, Rating::Dislike, GraphPruning::ConnectedComponent) };
            ASSERT_EQ(graph.getNodeCount(), 1);
            EXPECT_TRUE(graph.getNode(AdjacencyGraph::activeUserNode).isActiveUser());
            EXPECT_EQ(graph.getEdgeCount(), 0);
        }

        {
            const AdjacencyGraph graph{ buildAdjacencyGraph(table, ledger, neighbors, Rating::Dislike, GraphPruning::None) };
            EXPECT_EQ(graph.getNodeCount(), 2);
            EXPECT_EQ(graph.getEdgeCount(), 0);
        }
    }

    TEST(AdjacencyGraph, edgesBetweenNeighbors)
    {
        const InteractionTable table{ makeTable({
            { 1, 10, 1 },
            { 1, 20, 1 },
            { 1, 30, -1 },
            { 2, 20, 1 },
            { 2, 30, -1 },
            { 3, 40, 1 },
        }) };
        PreferenceLedger ledger;
        ledger.add(RecipeId{ 10 }, Rating::Like);
        ledger.add(RecipeId{ 30 }, Rating::Dislike);
        const std::vector<UserId> neighbors{ UserId{ 1 }, UserId{ 2 }, UserId{ 3 } };

        {
            const AdjacencyGraph graph{ buildAdjacencyGraph(table, ledger, neighbors, Rating::Like, GraphPruning::ConnectedComponent) };
            EXPECT_EQ(graph.getNodeCount(), 3);
            EXPECT_EQ(graph.getEdgeRecipes("you", "user: 1"), std::vector<RecipeId>{ RecipeId{ 10 } });
            EXPECT_EQ(graph.getEdgeRecipes("user: 1", "user: 2"), std::vector<RecipeId>{ RecipeId{ 20 } });
            EXPECT_TRUE(graph.getEdgeRecipes("you", "user: 2").empty());
            EXPECT_FALSE(graph.findNode("user: 3").has_value());
        }

        {
            const AdjacencyGraph graph{ buildAdjacencyGraph(table, ledger, neighbors, Rating::Dislike, GraphPruning::ConnectedComponent) };
            EXPECT_EQ(graph.getNodeCount(), 3);
            EXPECT_EQ(graph.getEdgeRecipes("you", "user: 1"), std::vector<RecipeId>{ RecipeId{ 30 } });
            EXPECT_EQ(graph.getEdgeRecipes("you", "user: 2"), std::vector<RecipeId>{ RecipeId{ 30 } });
            EXPECT_EQ(graph.getEdgeRecipes("user: 1", "user: 2"), std::vector<RecipeId>{ RecipeId{ 30 } });
        }
    }

    TEST(AdjacencyGraph, noNeighbor)
    {
        const InteractionTable table{ makeMainDishTable() };
        PreferenceLedger ledger;
        ledger.add(RecipeId{ 101 }, Rating::Like);

        EXPECT_THROW(buildAdjacencyGraph(table, ledger, {}, Rating::Like, GraphPruning::ConnectedComponent), NoNeighborException);
    }

    TEST(AdjacencyGraph, writeGraphviz)
    {
        AdjacencyGraph graph;
        const AdjacencyGraph::NodeIndex node{ graph.addNode(UserId{ 4 }) };
        graph.addEdge(AdjacencyGraph::activeUserNode, node, RecipeId{ 102 });

        std::ostringstream oss;
        graph.writeGraphviz(oss, "likes");

        const std::string output{ oss.str() };
        EXPECT_EQ(output.rfind("graph G {", 0), 0);
        EXPECT_NE(output.find("label=likes;"), std::string::npos);
        EXPECT_NE(output.find("0[label=you];"), std::string::npos);
        EXPECT_NE(output.find("1[label=\"user: 4\"];"), std::string::npos);
        EXPECT_NE(output.find("0--1 [label=102];"), std::string::npos);
    }
} // namespace fooder::recommendation::tests
