#include "core/Common.hpp"
#include "Viewer/core.hpp"
#include "App/Options.hpp"

// interactive viewer front end
int main(int argc, char** argv)
{
    const std::string program = (argc > 0) ? argv[0] : "mazeviewer";

    AppOptions defaults;
    defaults.width = 15;
    defaults.height = 15;

    AppOptions opt;
    try
    {
        opt = ParseOptions(argc, argv, defaults);
        if (opt.help)
        {
            std::cout << Usage(program, defaults);
            return 0;
        }
        opt.Validate();
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << "error: " << e.what() << "\n" << Usage(program, defaults);
        return 2;
    }

    try
    {
        auto& viewer = Viewer::getInstance();
        viewer.configure(opt);
        viewer.run();
    }
    catch (const std::exception& e)
    {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
