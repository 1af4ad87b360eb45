#include "CastClientApplication.hpp"

#include <castlink/core/ConfigLoader.hpp>
#include <castlink/core/Logger.hpp>
#include <castlink/core/LoggingConfig.hpp>

#include <iostream>
#include <memory>

int main(int argc, char **argv)
{
    int rc = 1;
    try
    {
        auto cfg = castlink::core::ConfigLoader::load(argc, argv);
        castlink::core::applyLoggingConfig(cfg.engine);

        auto app = std::make_shared<cast_client::CastClientApplication>(cfg);
        rc = app->run();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal: " << e.what() << "\n";
        rc = 1;
    }

    castlink::core::shutdownLogger();
    return rc;
}
