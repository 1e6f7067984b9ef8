// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "DefaultCommand.h"
#include <clarisma/cli/CliHelp.h>
#include <clarisma/cli/ConsoleWriter.h>
#include "VistoriaTool.h"

using namespace clarisma;

bool DefaultCommand::setParam(int number, std::string_view value)
{
    if (number != 0) return false;
    if (value == "help")
    {
        showHelp_ = true;
        return true;
    }
    if (value == "version")
    {
        showVersion_ = true;
        return true;
    }
    return false;
}

int DefaultCommand::setOption(std::string_view name, std::string_view value)
{
    if (name == "version" || name == "V")
    {
        showVersion_ = true;
        return 0;
    }
    if (name == "help" || name == "h" || name == "?")
    {
        showHelp_ = true;
        return 0;
    }
    return BasicCommand::setOption(name, value);
}

int DefaultCommand::run(char* argv[])
{
    int res = BasicCommand::run(argv);
    if (res != 0) return res;

    if (showVersion_)
    {
        ConsoleWriter out;
        out << "vst " << VistoriaTool::VERSION << "\n";
        return 0;
    }
    help();
    return showHelp_ ? 0 : 2;
}

void DefaultCommand::help()
{
    CliHelp help;
    help.command("vst <command> <zones-file> <photo-dir> [<options>]",
        "Builds PDF reports of field inspections from geotagged photos.");
    help.beginSection("Commands:");
    help.option("classify", "Show the zone of each photo");
    help.option("rename", "Rename photos by sigla and capture time");
    help.option("init", "Create or extend the edit store of a photo directory");
    help.option("report", "Generate the PDF report");
    help.endSection();
    help.beginSection("Other:");
    help.option("help", "Show this help");
    help.option("-V, --version", "Show the version");
    help.endSection();
}
