// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "BasicCommand.h"
#include <clarisma/cli/CliHelp.h>
#include <clarisma/cli/ConsoleWriter.h>
#include <clarisma/io/File.h>

using namespace clarisma;

BasicCommand::Option BasicCommand::BASIC_OPTIONS[] =
{
	{ "Y", &BasicCommand::setYesToAllPrompts },
	{ "yes", &BasicCommand::setYesToAllPrompts },
	{ "no-color", &BasicCommand::setNoColor },
	{ "s", &BasicCommand::setVerbosity },
	{ "silent", &BasicCommand::setVerbosity },
	{ "q", &BasicCommand::setVerbosity },
	{ "quiet", &BasicCommand::setVerbosity },
	{ "v", &BasicCommand::setVerbosity },
	{ "verbose", &BasicCommand::setVerbosity },
	{ "d", &BasicCommand::setVerbosity },
	{ "debug", &BasicCommand::setVerbosity }
};

BasicCommand::BasicCommand() :
	yesToAllPrompts_(false)
{
	addOptions(BASIC_OPTIONS, sizeof(BASIC_OPTIONS) / sizeof(Option));
}

void BasicCommand::addOptions(const Option* options, size_t count)
{
	for (size_t i = 0; i < count; i++)
	{
		options_[options[i].name] = options[i].method;
	}
}

int BasicCommand::setOption(std::string_view name, std::string_view value)
{
	auto it = options_.find(name);
	if (it == options_.end()) return -1;
	if (it->second == &BasicCommand::setVerbosity) return setVerbosity(name);
	return (this->*(it->second))(value);
}

// Verbosity options take no value; the option name selects the level
int BasicCommand::setVerbosity(std::string_view name)
{
	switch (name[0])
	{
	case 's':
		Console::setVerbosity(Console::Verbosity::SILENT);
		break;
	case 'q':
		Console::setVerbosity(Console::Verbosity::QUIET);
		break;
	case 'v':
		Console::setVerbosity(Console::Verbosity::VERBOSE);
		break;
	case 'd':
		Console::setVerbosity(Console::Verbosity::DEBUG);
		break;
	default:
		break;
	}
	return 0;
}

int BasicCommand::run(char* argv[])
{
	return CliCommand::run(argv);
}

bool BasicCommand::confirmReplace(const std::string& path) const
{
	if (yesToAllPrompts_ || !File::exists(path.c_str())) return true;
	ConsoleWriter out;
	out.arrow() << Console::FAINT_LIGHT_BLUE << path
		<< Console::DEFAULT << " exists already. Replace it?";
	return out.prompt(false) == 1;
}

ProgressCallback BasicCommand::progress(const char* task)
{
	Console::get()->start(task);
	return [](size_t current, size_t total)
	{
		Console::get()->setProgress(
			total == 0 ? 100 : static_cast<int>(current * 100 / total));
	};
}

void BasicCommand::generalOptions(CliHelp& help)
{
	help.beginSection("General Options:");
	help.option("-s, --silent","No output");
	help.option("-q, --quiet","Minimal output");
	help.option("-v, --verbose","Detailed output (lists renamed files)");
	help.option("-d, --debug","Diagnostic output");
	help.option("--no-color","Disable colored output");
	help.option("-Y, --yes","Replace existing files without asking");
	help.endSection();
}
