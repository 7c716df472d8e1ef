#pragma once

namespace sentinel::cli
{
    /** Parse argv, run the selected subcommand and return the process exit code. */
    int run(int argc, char *argv[]);
}
