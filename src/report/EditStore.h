// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include "Status.h"

// What the user has changed about one image

struct ImageEdit
{
    std::string comment;
    std::string status = Status::DEFAULT;
    bool include = true;
    std::optional<int> order;

    bool operator==(const ImageEdit&) const = default;
};

// The persisted user edits of a photo directory: one ImageEdit per
// content hash, plus the document-level fields. Keys are content hashes,
// so edits survive renames.
//
// File format (`imagens_db.json` in the photo directory):
//
//   {
//       "<hash>": { "comment": "", "status": "Parcial",
//                   "include": true, "order": 3 },
//       "general_comments": "",
//       "disable_states": false,
//       "disable_comments_table": false,
//       "report_date": "18/10/2026",
//       "toggle_all_items": false
//   }

class EditStore
{
public:
    static constexpr const char* FILE_NAME = "imagens_db.json";

    /// Reads a store; a missing file yields an empty store. Throws if the
    /// file exists but cannot be read or parsed.
    static EditStore load(const std::filesystem::path& file);
    static EditStore parse(const char* json);

    /// Writes the store through a temporary file that replaces `file`
    /// once complete
    void save(const std::filesystem::path& file) const;
    std::string toJson() const;

    const ImageEdit* find(std::string_view hash) const;

    /// The edit for `hash`, created with defaults if absent
    ImageEdit& edit(const std::string& hash) { return edits_[hash]; }
    bool contains(const std::string& hash) const { return edits_.contains(hash); }
    size_t size() const { return edits_.size(); }

    const std::string& generalComments() const { return generalComments_; }
    bool disableStates() const { return disableStates_; }
    bool disableCommentsTable() const { return disableCommentsTable_; }
    const std::string& reportDate() const { return reportDate_; }
    bool toggleAllItems() const { return toggleAllItems_; }

    void setGeneralComments(std::string_view s) { generalComments_ = s; }
    void setDisableStates(bool b) { disableStates_ = b; }
    void setDisableCommentsTable(bool b) { disableCommentsTable_ = b; }
    void setReportDate(std::string_view s) { reportDate_ = s; }
    void setToggleAllItems(bool b) { toggleAllItems_ = b; }

private:
    friend class EditStoreParser;

    std::map<std::string, ImageEdit, std::less<>> edits_;
    std::string generalComments_;
    std::string reportDate_;
    bool disableStates_ = false;
    bool disableCommentsTable_ = false;
    bool toggleAllItems_ = false;
};
