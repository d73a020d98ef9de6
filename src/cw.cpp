/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <cw/cli.hpp>
#include <cw/config.hpp>

int main(const int argc, const char **argv)
{
    using namespace causeway;
    settings::from_env().apply();
    return cli::run(argc, argv);
}
