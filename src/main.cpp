#include "core/Common.hpp"
#include "core/MazeBuilder.hpp"
#include "core/PathFinder.hpp"
#include "core/MazeText.hpp"
#include "App/Options.hpp"

int main(int argc, char** argv)
{
    const std::string program = (argc > 0) ? argv[0] : "mazesearch";

    AppOptions opt;
    try
    {
        opt = ParseOptions(argc, argv);
        if (opt.help)
        {
            std::cout << Usage(program);
            return 0;
        }
        opt.Validate();
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << "error: " << e.what() << "\n" << Usage(program);
        return 2;
    }

    try
    {
        std::cout << "Generating a " << opt.width << "x" << opt.height << " maze";
        if (opt.seed) std::cout << " (seed " << *opt.seed << ")";
        std::cout << "..." << std::endl;

        Maze maze = MazeBuilder::Generate(opt.width, opt.height, opt.seed);

        const Cell start = opt.StartOrDefault();
        const Cell end = opt.EndOrDefault();

        std::cout << "Finding the shortest path from " << ToString(start)
                  << " to " << ToString(end) << "..." << std::endl;

        PathFinder finder(maze);
        const SearchResult result = finder.FindPath(start, end);

        if (result.Found())
            std::cout << "Path found! Length: " << result.Steps() << " steps"
                      << " (" << result.exploredOrder.size() << " cells explored)" << std::endl;
        else
            std::cout << "No path found!" << std::endl;

        std::cout << "\n" << MazeText::Render(maze, result, opt.showExplored);

        if (opt.trace)
            std::cout << "\nExplored order: " << MazeText::FormatCells(result.exploredOrder) << std::endl;

        return result.Found() ? 0 : 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
}
