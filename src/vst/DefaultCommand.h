// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include "BasicCommand.h"

// Handles `vst`, `vst help` and `vst --version`

class DefaultCommand : public BasicCommand
{
public:
    int run(char* argv[]);

private:
    bool setParam(int number, std::string_view value) override;
    int setOption(std::string_view name, std::string_view value) override;
    void help();

    bool showVersion_ = false;
    bool showHelp_ = false;
};
