#include "sentinel/cli.hpp"

int main(int argc, char *argv[])
{
    return sentinel::cli::run(argc, argv);
}
