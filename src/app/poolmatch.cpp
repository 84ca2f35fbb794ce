#include "app/match_app.hpp"
#include "util/debug.hpp"

using namespace POOLMATCH;
using namespace POOLMATCH::APP;

int main(int argc, char **argv)
{
  try
  {
    MatchAppConfig config(argc, argv);
    if (config.help_specified)
    {
      MatchAppConfig::print_help();
      return 0;
    }
    config.print();
    if (!config.validate())
    {
      SPDLOG_CRITICAL("Validation fail, program stop");
      return 1;
    }
    MatchApp app(config);
    return app.run() == 0 ? 0 : 2;
  }
  catch (const std::exception &e)
  {
    SPDLOG_CRITICAL("poolmatch stopped: {}", e.what());
    return 1;
  }
}
