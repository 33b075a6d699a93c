#include <cstdlib>
#include <filesystem>
#include <lpal/config/config.hpp>
#include <lpal/core/log.hpp>
#include <lpal/launcher.hpp>
#include <string>

namespace fs = std::filesystem;

int main(int argc, char* argv[])
{
    lpal::log::init();

    try
    {
        LOG_INFO("Starting lpal");

        std::string config_path = lpal::resolve_config_path(argc > 1 ? argv[1] : nullptr);
        lpal::Config config;

        if (fs::exists(config_path))
        {
            LOG_INFO("Loading config from: {}", config_path);
            auto loaded = lpal::load_config(config_path);
            if (loaded)
            {
                config = *loaded;
            }
            else
            {
                LOG_WARN("Failed to load config, using defaults");
                config = lpal::default_config();
            }
        }
        else
        {
            LOG_INFO("No config file found, using defaults");
            config = lpal::default_config();
        }

        if (config.log.file != "/tmp/lpal.log")
            lpal::log::init(config.log.file);
        lpal::log::set_level(config.log.level);

        lpal::Launcher launcher(std::move(config));
        launcher.run();
    }
    catch (std::exception const& e)
    {
        LOG_ERROR("Error: {}", e.what());
        lpal::log::shutdown();
        return 1;
    }

    LOG_INFO("lpal exiting");
    lpal::log::shutdown();
    return 0;
}
