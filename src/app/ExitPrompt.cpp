#include "app/ExitPrompt.h"

#include <istream>
#include <ostream>
#include <string>

#include <spdlog/spdlog.h>

namespace gw2util::app {

int ExitWithPrompt(const core::Status& status, bool pause, std::istream& in, std::ostream& out)
{
    if (status.ok())
        return 0;

    spdlog::error("{}", core::Describe(status));
    spdlog::default_logger()->flush();

    if (pause)
    {
        out << "\npress the [ENTER] key to exit..." << std::endl;
        std::string line;
        std::getline(in, line);
    }
    return 1;
}

} // namespace gw2util::app
