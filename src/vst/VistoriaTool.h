// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <clarisma/cli/CliApplication.h>

class VistoriaTool : public clarisma::CliApplication
{
public:
	int run(char* argv[]);

	static constexpr const char* VERSION = "1.0.0";

private:
	static int classify(char* argv[]);
	static int init(char* argv[]);
	static int rename(char* argv[]);
	static int report(char* argv[]);
};
