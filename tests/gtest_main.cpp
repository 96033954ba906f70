#include <gtest/gtest.h>
#include <iostream>

#include "logging.hpp"

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);

    try
    {
        if (!LogRegistry::isInitialized())
        {
            LogRegistry::Settings settings;
            settings.consoleLevel = spdlog::level::err;
            LogRegistry::init(settings);
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Failed to initialize test logging: " << e.what() << std::endl;
        return 1;
    }

    const int status = RUN_ALL_TESTS();
    LogRegistry::shutdown();
    return status;
}
