#include <iostream>
#include <utility>

#include "remcp/client/config.hpp"
#include "remcp/client/logger.hpp"
#include "remcp/client/session.hpp"

int main(int argc, char *argv[])
{
    using namespace remcp::client;

    try
    {
        auto config = parse_arguments(argc, argv);
        Logger logger(config.log_path, config.debug);
        ClientSession session(std::move(config), std::move(logger));
        return session.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return 1;
    }
}
