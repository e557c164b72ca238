#include <iostream>
#include <stdexcept>

#include "app/RouterCli.hpp"

using namespace storagerouter;

int main(int argc, char** argv) {
    app::CliArgs args;
    try {
        args = app::ParseCli(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n" << app::kUsage;
        return app::kExitError;
    }

    app::RouterCli cli(std::move(args));
    return cli.Run();
}
