#include "app.hpp"
#include "core/Config.hpp"
#include "core/Errors.hpp"

int main(int argc, char** argv)
{
    AppConfig cfg;
    std::string error;
    const std::string program = (argc > 0 && argv[0]) ? argv[0] : "perfectmaze";

    if (!ParseArgs(argc, argv, cfg, error))
    {
        std::cerr << program << ": " << error << "\n" << UsageText(program);
        return 1;
    }
    if (cfg.showHelp)
    {
        std::cout << UsageText(program);
        return 0;
    }

    try {
        return cfg.headless ? runHeadless(cfg) : runWindowed(cfg);
    }
    catch (const ValidationError& e) {
        std::cerr << program << ": " << e.what() << std::endl;
        return 2;
    }
    catch (const std::exception& e) {
        std::cerr << program << ": " << e.what() << std::endl;
        return 3;
    }
}
