// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>
#include "photo/CaptureTime.h"
#include "photo/RecordResult.h"
#include "util/Progress.h"

class RenamePlan;

// Renames the classified images of a directory in two passes (see
// RenamePlan). Must not run concurrently on the same directory. If it
// is interrupted between the passes, the images are left with valid
// scratch names, and running it again completes the job.

class NamingPipeline
{
public:
    struct Item
    {
        std::string fileName;
        std::string sigla;
        CaptureTime capturedAt;
    };

    struct Failure
    {
        std::string fileName;
        ErrorKind kind;
        std::string message;
    };

    NamingPipeline();
    explicit NamingPipeline(uint32_t seed) : random_(seed) {}

    /// Returns the final names of the images that were renamed or
    /// confirmed in place, sorted by name
    std::vector<std::string> run(const std::filesystem::path& dir,
        const std::vector<Item>& items, const ProgressCallback& progress = nullptr);

    const std::vector<Failure>& failures() const { return failures_; }

private:
    bool rename(const std::filesystem::path& dir, const std::string& from, const std::string& to);
    void fail(const std::string& fileName, ErrorKind kind, std::string message);

    std::mt19937 random_;
    std::vector<Failure> failures_;
};
