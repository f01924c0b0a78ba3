#pragma once

#include "core/config_loader.h"

#include <string>

namespace middle_server {
namespace relay {

struct RelayOptions {
    std::string configPath = DEFAULT_CONFIG_FILE;
    std::string inputPath = "-";   // "-" = stdin
    std::string outputPath = "-";  // "-" = stdout, "null" = discard
    AppConfig config{};
};

// Defaults only. Does not touch the environment or the filesystem.
RelayOptions makeDefaultOptions();

// Config file path from -c/--config, else MIDDLE_SERVER_CONFIG, else the default.
std::string resolveConfigPath(int argc, char **argv);

// Loads options.configPath into options.config. A missing file is only an
// error when a path other than the default was requested; parse errors and
// invalid delay/relay values always are.
ConfigResult loadConfigFile(RelayOptions &options);

// Overrides options from the environment. DELAY_THRESHOLD sets the delay
// threshold. Returns false with a message on malformed values.
bool applyEnvOverrides(RelayOptions &options, std::string &error);

// Parses CLI arguments over @p options. showHelp=true means help was printed.
bool parseArgs(int argc, char **argv, RelayOptions &options, bool &showHelp, std::string &error);

void printHelp(const char *exeName);

}  // namespace relay
}  // namespace middle_server
