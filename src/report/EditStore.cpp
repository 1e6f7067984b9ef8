// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "EditStore.h"
#include <cmath>
#include <limits>
#include <clarisma/io/File.h>
#include "util/JsonParser.h"
#include "util/JsonWriter.h"

class EditStoreParser : public JsonParser
{
public:
    EditStoreParser(const char* s, EditStore& store) :
        JsonParser(s),
        store_(store)
    {
    }

    void parse()
    {
        expectObjectStart();
        members([this](const std::string& key)
        {
            if (key == "general_comments")
            {
                store_.generalComments_ = scalarAsString();
            }
            else if (key == "disable_states")
            {
                store_.disableStates_ = expectBoolean();
            }
            else if (key == "disable_comments_table")
            {
                store_.disableCommentsTable_ = expectBoolean();
            }
            else if (key == "report_date")
            {
                store_.reportDate_ = scalarAsString();
            }
            else if (key == "toggle_all_items")
            {
                store_.toggleAllItems_ = expectBoolean();
            }
            else if (*pNext_ == '{')
            {
                pNext_++;
                store_.edits_[key] = parseEdit();
            }
            else
            {
                skipValue(0);
            }
        });
    }

private:
    ImageEdit parseEdit()
    {
        ImageEdit edit;
        members([this, &edit](const std::string& key)
        {
            if (key == "comment")
            {
                edit.comment = scalarAsString();
            }
            else if (key == "status")
            {
                edit.status = scalarAsString();
                if (edit.status.empty()) edit.status = Status::DEFAULT;
            }
            else if (key == "include")
            {
                edit.include = expectBoolean();
            }
            else if (key == "order")
            {
                if (acceptNull()) return;
                double d = number();
                if (std::isnan(d))
                {
                    error("Expected number or null for \"order\"");
                    return;
                }
                if (d < std::numeric_limits<int>::min() || d > std::numeric_limits<int>::max())
                {
                    error("\"order\" is out of range");
                    return;
                }
                edit.order = static_cast<int>(d);
            }
            else
            {
                skipValue(1);
            }
        });
        return edit;
    }

    EditStore& store_;
};

EditStore EditStore::load(const std::filesystem::path& file)
{
    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) return EditStore();
    std::string json = File::readString(file.string().c_str());
    return parse(json.c_str());
}

EditStore EditStore::parse(const char* json)
{
    EditStore store;
    EditStoreParser parser(json, store);
    parser.parse();
    return store;
}

const ImageEdit* EditStore::find(std::string_view hash) const
{
    auto it = edits_.find(hash);
    return it == edits_.end() ? nullptr : &it->second;
}

std::string EditStore::toJson() const
{
    JsonWriter json;
    json.beginObject();
    for (const auto& [hash, edit] : edits_)
    {
        json.key(hash);
        json.beginObject();
        json.key("comment");
        json.value(edit.comment);
        json.key("status");
        json.value(edit.status);
        json.key("include");
        json.value(edit.include);
        json.key("order");
        if (edit.order)
        {
            json.value(static_cast<int64_t>(*edit.order));
        }
        else
        {
            json.nullValue();
        }
        json.endObject();
    }
    json.key("general_comments");
    json.value(generalComments_);
    json.key("disable_states");
    json.value(disableStates_);
    json.key("disable_comments_table");
    json.value(disableCommentsTable_);
    json.key("report_date");
    json.value(reportDate_);
    json.key("toggle_all_items");
    json.value(toggleAllItems_);
    json.endObject();
    return json.toString();
}

void EditStore::save(const std::filesystem::path& file) const
{
    std::string json = toJson();
    json.push_back('\n');
    std::string fileName = file.string();
    std::string tmpFileName = fileName + ".tmp";
    File out;
    out.open(tmpFileName,
        File::OpenMode::WRITE | File::OpenMode::CREATE |
            File::OpenMode::TRUNCATE);
    out.writeAll(json.data(), json.size());
    out.close();
    File::rename(tmpFileName.c_str(), fileName.c_str());
}
