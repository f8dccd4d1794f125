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

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "catalog/Exception.hpp"
#include "catalog/IRecipeCatalog.hpp"
#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "core/String.hpp"
#include "recommendation/Exception.hpp"
#include "recommendation/IInteractionTableProvider.hpp"
#include "recommendation/IRecipeSession.hpp"

namespace fooder
{
    namespace
    {
        using recommendation::DishType;
        using recommendation::Rating;
        using recommendation::RecipeId;

        recommendation::GraphPruning parseGraphPruning(std::string_view str)
        {
            if (str == "connected-component")
                return recommendation::GraphPruning::ConnectedComponent;
            if (str == "none")
                return recommendation::GraphPruning::None;

            throw core::FooderException{ "Invalid graph-pruning value '" + std::string{ str } + "', expected \"connected-component\" or \"none\"" };
        }

        std::optional<Rating> parsePolarity(std::string_view str)
        {
            if (str == "like")
                return Rating::Like;
            if (str == "dislike")
                return Rating::Dislike;

            return std::nullopt;
        }

        recommendation::RecipeSessionParameters createSessionParameters(core::IConfig& config, std::optional<std::uint_fast32_t> seed)
        {
            recommendation::RecipeSessionParameters parameters;
            parameters.neighborSelection.minNeighborCount = config.getULong("neighbor-min-count", parameters.neighborSelection.minNeighborCount);
            parameters.neighborSelection.maxNeighborCount = config.getULong("neighbor-max-count", parameters.neighborSelection.maxNeighborCount);
            if (parameters.neighborSelection.minNeighborCount > parameters.neighborSelection.maxNeighborCount)
                throw core::FooderException{ "neighbor-min-count must not be greater than neighbor-max-count" };

            parameters.graphPruning = parseGraphPruning(config.getString("graph-pruning", "connected-component"));
            parameters.randomSeed = seed;

            return parameters;
        }

        class Console
        {
        public:
            Console(recommendation::IInteractionTableProvider& tableProvider, const catalog::IRecipeCatalog* recipeCatalog, const recommendation::RecipeSessionParameters& parameters, const std::filesystem::path& graphOutputDirectory)
                : _tableProvider{ tableProvider }
                , _recipeCatalog{ recipeCatalog }
                , _parameters{ parameters }
                , _graphOutputDirectory{ graphOutputDirectory }
            {
            }

            void run(std::string_view dishType)
            {
                startSession(recommendation::parseDishType(dishType));
                displayHelp();
                suggestNext();

                std::string line;
                while (std::cout << "> " << std::flush && std::getline(std::cin, line))
                {
                    std::vector<std::string> args;
                    for (std::string_view arg : core::stringUtils::splitString(core::stringUtils::stringTrim(line), ' '))
                    {
                        if (!arg.empty())
                            args.emplace_back(arg);
                    }

                    if (args.empty())
                        continue;

                    if (args[0] == "quit" || args[0] == "exit")
                        break;

                    try
                    {
                        processCommand(args);
                    }
                    catch (const recommendation::Exception& e)
                    {
                        std::cout << e.what() << std::endl;
                    }
                }
            }

        private:
            void processCommand(const std::vector<std::string>& args)
            {
                const std::string& command{ args[0] };

                if (command == "help")
                    displayHelp();
                else if (const std::optional<Rating> rating{ parsePolarity(command) })
                    rate(args, *rating);
                else if (command == "undo")
                    undo(args);
                else if (command == "history")
                    displayHistory();
                else if (command == "graph")
                    exportGraph(args);
                else if (command == "report")
                    displayReport(args);
                else if (command == "switch")
                    switchDishType(args);
                else
                    std::cout << "Unknown command '" << command << "', type 'help' for the list of commands" << std::endl;
            }

            void displayHelp() const
            {
                std::cout << "Commands:\n"
                             "  like [id]                  like the suggested recipe (or the given one) and get a new suggestion\n"
                             "  dislike [id]               dislike the suggested recipe (or the given one) and get a new suggestion\n"
                             "  undo <id>                  remove a recipe from your preferences\n"
                             "  history                    list your preferences\n"
                             "  graph like|dislike         export the graph of your neighbors\n"
                             "  report like|dislike        list what you share with your neighbors\n"
                             "  switch main|dessert        start over with another type of dish\n"
                             "  help                       display this message\n"
                             "  quit                       exit"
                          << std::endl;
            }

            void startSession(DishType dishType)
            {
                _session = recommendation::createRecipeSession(_tableProvider, dishType, _parameters);
                _currentSuggestion.reset();
                _exhausted = false;

                std::cout << "Suggesting " << recommendation::toString(dishType) << " dishes" << std::endl;
            }

            void suggestNext()
            {
                if (_exhausted)
                {
                    std::cout << "All the recipes have been rated, use 'undo' or 'switch' to go on" << std::endl;
                    return;
                }

                try
                {
                    const recommendation::Suggestion suggestion{ _session->suggest() };
                    _currentSuggestion = suggestion.recipeId;

                    std::cout << "\nSuggested recipe:\n";
                    displayRecipe(suggestion.recipeId);
                    if (!suggestion.neighbors.empty())
                        std::cout << "(based on " << suggestion.neighbors.size() << " users sharing your tastes)" << std::endl;
                }
                catch (const recommendation::NoMoreRecipesException& e)
                {
                    _exhausted = true;
                    _currentSuggestion.reset();
                    std::cout << e.what() << ", use 'undo' or 'switch' to go on" << std::endl;
                }
            }

            void displayRecipe(RecipeId recipeId) const
            {
                std::optional<catalog::Recipe> recipe;
                if (_recipeCatalog)
                    recipe = _recipeCatalog->findRecipe(recipeId);

                if (!recipe)
                {
                    std::cout << "  Recipe #" << recipeId << std::endl;
                    return;
                }

                std::cout << "  " << recipe->name << " (#" << recipeId << ")\n";
                if (!recipe->description.empty())
                    std::cout << "  " << recipe->description << "\n";

                if (!recipe->ingredients.empty())
                    std::cout << "  Ingredients: " << core::stringUtils::joinStrings(recipe->ingredients, ", ") << "\n";

                std::cout << "  Steps:\n";
                for (std::size_t i{}; i < recipe->steps.size(); ++i)
                    std::cout << "    " << (i + 1) << ". " << recipe->steps[i] << "\n";

                std::cout << std::flush;
            }

            std::string getRecipeName(RecipeId recipeId) const
            {
                if (_recipeCatalog)
                {
                    if (const std::optional<catalog::Recipe> recipe{ _recipeCatalog->findRecipe(recipeId) })
                        return recipe->name;
                }

                return "#" + std::to_string(recipeId.value());
            }

            std::optional<RecipeId> parseRecipeIdArg(const std::vector<std::string>& args) const
            {
                if (args.size() < 2)
                    return std::nullopt;

                const std::optional<long long> value{ core::stringUtils::readAs<long long>(args[1]) };
                if (!value)
                    return std::nullopt;

                return RecipeId{ *value };
            }

            void rate(const std::vector<std::string>& args, Rating rating)
            {
                std::optional<RecipeId> recipeId{ args.size() > 1 ? parseRecipeIdArg(args) : _currentSuggestion };
                if (!recipeId)
                {
                    std::cout << "No recipe to rate" << std::endl;
                    return;
                }

                _session->addPreference(*recipeId, rating);
                std::cout << "You " << (rating == Rating::Like ? "liked" : "disliked") << " " << getRecipeName(*recipeId) << std::endl;

                suggestNext();
            }

            void undo(const std::vector<std::string>& args)
            {
                const std::optional<RecipeId> recipeId{ parseRecipeIdArg(args) };
                if (!recipeId)
                {
                    std::cout << "Usage: undo <id>" << std::endl;
                    return;
                }

                _session->undo(*recipeId);
                std::cout << "Removed " << getRecipeName(*recipeId) << " from your preferences" << std::endl;

                // the removed recipe can be suggested again
                if (_exhausted)
                {
                    _exhausted = false;
                    suggestNext();
                }
            }

            void displayHistory() const
            {
                const recommendation::PreferenceLedger& preferences{ _session->getPreferences() };
                if (preferences.empty())
                {
                    std::cout << "Your history is empty" << std::endl;
                    return;
                }

                for (const auto& [recipeId, rating] : preferences.getEntries())
                    std::cout << "  " << std::setw(8) << recipeId << "  " << std::setw(7) << recommendation::toString(rating) << "  " << getRecipeName(recipeId) << "\n";
                std::cout << std::flush;
            }

            std::optional<Rating> parsePolarityArg(const std::vector<std::string>& args, std::string_view command) const
            {
                std::optional<Rating> polarity;
                if (args.size() == 2)
                    polarity = parsePolarity(args[1]);

                if (!polarity)
                    std::cout << "Usage: " << command << " like|dislike" << std::endl;

                return polarity;
            }

            void exportGraph(const std::vector<std::string>& args) const
            {
                const std::optional<Rating> polarity{ parsePolarityArg(args, "graph") };
                if (!polarity)
                    return;

                const recommendation::AdjacencyGraph graph{ _session->getAdjacencyGraph(*polarity) };
                const std::string graphName{ "neighbors-" + std::string{ recommendation::toString(*polarity) } };

                if (_graphOutputDirectory.empty())
                {
                    graph.writeGraphviz(std::cout, graphName);
                    return;
                }

                const std::filesystem::path graphFile{ _graphOutputDirectory / (graphName + ".dot") };
                std::ofstream ofs{ graphFile };
                if (!ofs)
                {
                    FOODER_LOG(MAIN, ERROR, "Cannot open '" << graphFile.string() << "' for writing");
                    std::cout << "Cannot write graph to '" << graphFile.string() << "'" << std::endl;
                    return;
                }

                graph.writeGraphviz(ofs, graphName);
                std::cout << "Graph with " << graph.getNodeCount() << " nodes and " << graph.getEdgeCount() << " edges written to '" << graphFile.string() << "'" << std::endl;
            }

            void displayReport(const std::vector<std::string>& args) const
            {
                const std::optional<Rating> polarity{ parsePolarityArg(args, "report") };
                if (!polarity)
                    return;

                const recommendation::NeighborReport report{ _session->getNeighborReport(*polarity) };

                std::cout << std::setw(10) << "User" << std::setw(14) << "Common likes" << std::setw(17) << "Common dislikes" << std::setw(22) << "Recipes to recommend" << "\n";
                for (const recommendation::NeighborReportEntry& entry : report)
                    std::cout << std::setw(10) << entry.userId << std::setw(14) << entry.commonLikes << std::setw(17) << entry.commonDislikes << std::setw(22) << entry.recipesToRecommend << "\n";
                std::cout << std::flush;
            }

            void switchDishType(const std::vector<std::string>& args)
            {
                if (args.size() != 2)
                {
                    std::cout << "Usage: switch main|dessert" << std::endl;
                    return;
                }

                startSession(recommendation::parseDishType(args[1]));
                suggestNext();
            }

            recommendation::IInteractionTableProvider& _tableProvider;
            const catalog::IRecipeCatalog* _recipeCatalog;
            const recommendation::RecipeSessionParameters _parameters;
            const std::filesystem::path _graphOutputDirectory;

            std::unique_ptr<recommendation::IRecipeSession> _session;
            std::optional<RecipeId> _currentSuggestion;
            bool _exhausted{};
        };
    } // namespace
} // namespace fooder

int main(int argc, char* argv[])
{
    try
    {
        using namespace fooder;
        namespace po = boost::program_options;

        po::options_description desc{ "Allowed options" };
        // clang-format off
        desc.add_options()
            ("help,h", "print usage message")
            ("conf,c", po::value<std::string>()->default_value("conf/fooder.conf"), "Fooder config file")
            ("dish,d", po::value<std::string>()->default_value("main"), "Type of dish to start with (\"main\" or \"dessert\")")
            ("seed,s", po::value<std::uint_fast32_t>(), "Seed of the random suggestions")
            ("graph-output,g", po::value<std::string>(), "Directory where neighbor graphs are written (standard output if not set)");
        // clang-format on

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            std::cout << desc << std::endl;
            return EXIT_SUCCESS;
        }

        core::Service<core::IConfig> config{ core::createConfig(vm["conf"].as<std::string>()) };
        core::Service<core::logging::ILogger> logger{ core::logging::createLogger(core::logging::parseSeverity(config->getString("log-min-severity", "info")), config->getPath("log-file", "")) };

        std::optional<std::uint_fast32_t> seed;
        if (vm.count("seed"))
            seed = vm["seed"].as<std::uint_fast32_t>();
        const recommendation::RecipeSessionParameters parameters{ createSessionParameters(*config, seed) };

        const auto tableProvider{ recommendation::createCsvInteractionTableProvider(config->getPath("interactions-main-file", "data/PP_user_main_dishes.csv"), config->getPath("interactions-dessert-file", "data/PP_user_desserts.csv")) };

        std::unique_ptr<catalog::IRecipeCatalog> recipeCatalog;
        try
        {
            recipeCatalog = catalog::createRecipeCatalog(config->getPath("recipes-file", "data/PP_recipes_data.csv"));
        }
        catch (const catalog::Exception& e)
        {
            FOODER_LOG(MAIN, WARNING, "Recipe details will not be available: " << e.what());
        }

        std::filesystem::path graphOutputDirectory;
        if (vm.count("graph-output"))
            graphOutputDirectory = vm["graph-output"].as<std::string>();

        Console console{ *tableProvider, recipeCatalog.get(), parameters, graphOutputDirectory };
        console.run(vm["dish"].as<std::string>());
    }
    catch (std::exception& e)
    {
        std::cerr << "Caught exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
