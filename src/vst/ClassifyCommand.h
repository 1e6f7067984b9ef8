// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include "SurveyCommand.h"

class ClassifyCommand : public SurveyCommand
{
public:
	int run(char* argv[]);

private:
	void help() override;
};
