// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include <gtest/gtest.h>
#include <limits>
#include "TestSupport.h"
#include "report/EditStore.h"
#include "report/EntryAggregator.h"
#include "report/EntryBuilder.h"
#include "report/ReportSettings.h"
#include "util/JsonWriter.h"

namespace
{
    Entry entry(ZoneType type, const char* id, const char* sigla,
        const char* status, const char* comment = "")
    {
        Entry e;
        e.zoneType = type;
        e.zoneId = id;
        e.sigla = sigla;
        e.status = status;
        e.comment = comment;
        return e;
    }

    ClassifiedImage image(const char* fileName, const char* hash,
        ZoneType type = ZoneType::QUADRA, const char* sigla = "FEEC")
    {
        ClassifiedImage img;
        img.record.path = fileName;
        img.record.contentHash = hash;
        img.record.capturedAt = *CaptureTime::parseExif("2024:05:14 09:41:07");
        img.classification.type = type;
        img.classification.zoneId = "12";
        img.classification.sigla = sigla;
        img.classification.distance = 0;
        return img;
    }

    std::vector<std::string> fileNames(const std::vector<Entry>& entries)
    {
        std::vector<std::string> names;
        for (const Entry& e : entries) names.push_back(e.fileName);
        return names;
    }
}

TEST(EntryAggregatorTest, MajorityStatus)
{
    EXPECT_EQ(EntryAggregator::majorityStatus(
        { Status::DONE, Status::DONE, Status::PARTIAL }), Status::DONE);
    EXPECT_EQ(EntryAggregator::majorityStatus(
        { Status::PARTIAL, Status::DONE, Status::DONE }), Status::DONE);
}

TEST(EntryAggregatorTest, MajorityTieGoesToFirstEncountered)
{
    EXPECT_EQ(EntryAggregator::majorityStatus(
        { Status::DONE, Status::PARTIAL }), Status::DONE);
    EXPECT_EQ(EntryAggregator::majorityStatus(
        { Status::PARTIAL, Status::DONE }), Status::PARTIAL);
    EXPECT_EQ(EntryAggregator::majorityStatus(
        { Status::NOT_DONE, Status::DONE, Status::DONE, Status::NOT_DONE }), Status::NOT_DONE);
}

TEST(EntryAggregatorTest, MergeCommentsDeduplicatesAndSorts)
{
    EXPECT_EQ(EntryAggregator::mergeComments({ "x\ny", "y\nz" }), "x\ny\nz");
    EXPECT_EQ(EntryAggregator::mergeComments({ "  b \n\n a", "", "b" }), "a\nb");
    EXPECT_EQ(EntryAggregator::mergeComments({ "", "  \n" }), "");
}

TEST(EntryAggregatorTest, GroupsByZoneInFirstSeenOrder)
{
    std::vector<Entry> entries =
    {
        entry(ZoneType::QUADRA, "7", "BBB", Status::PARTIAL, "fix gate"),
        entry(ZoneType::QUADRA, "3", "AAA", Status::DONE),
        entry(ZoneType::CANTEIRO, "C1", "AAA", Status::DONE, "weeds"),
        entry(ZoneType::QUADRA, "7", "BBB", Status::DONE),
        entry(ZoneType::QUADRA, "7", "BBB", Status::DONE, "fix gate\npaint"),
        entry(ZoneType::UNKNOWN, "Unknown", "Unknown", Status::DONE, "lost"),
    };
    AggregatedTables tables = EntryAggregator::aggregate(entries);

    ASSERT_EQ(tables.quadraRows.size(), 2);
    EXPECT_EQ(tables.quadraRows[0].zoneId, "7");
    EXPECT_EQ(tables.quadraRows[0].sigla, "BBB");
    EXPECT_EQ(tables.quadraRows[0].status, Status::DONE);
    EXPECT_EQ(tables.quadraRows[1].sigla, "AAA");

    ASSERT_EQ(tables.canteiroRows.size(), 1);
    EXPECT_EQ(tables.canteiroRows[0].zoneId, "C1");

    ASSERT_EQ(tables.quadraComments.size(), 1);
    EXPECT_EQ(tables.quadraComments[0].sigla, "BBB");
    EXPECT_EQ(tables.quadraComments[0].comments, "fix gate\npaint");
    ASSERT_EQ(tables.canteiroComments.size(), 1);
    EXPECT_EQ(tables.canteiroComments[0].comments, "weeds");
}

TEST(EditStoreTest, MissingFileIsEmptyStore)
{
    TempDir dir;
    EditStore store = EditStore::load(dir / EditStore::FILE_NAME);
    EXPECT_EQ(store.size(), 0);
    EXPECT_EQ(store.find("abc"), nullptr);
    EXPECT_FALSE(store.disableStates());
}

TEST(EditStoreTest, ParsesEditsAndDocumentFields)
{
    EditStore store = EditStore::parse(R"({
        "aaa": { "comment": "Broken\nlamp", "status": "Parcial", "include": false, "order": 2 },
        "bbb": { "comment": "", "status": "", "include": true, "order": null, "extra": [1, 2] },
        "general_comments": "All good",
        "disable_states": true,
        "disable_comments_table": false,
        "report_date": "18/10/2026",
        "toggle_all_items": true,
        "unknown": 5
    })");
    ASSERT_EQ(store.size(), 2);
    const ImageEdit* a = store.find("aaa");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->comment, "Broken\nlamp");
    EXPECT_EQ(a->status, Status::PARTIAL);
    EXPECT_FALSE(a->include);
    EXPECT_EQ(a->order, 2);

    const ImageEdit* b = store.find("bbb");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->status, Status::DEFAULT);
    EXPECT_FALSE(b->order);

    EXPECT_EQ(store.generalComments(), "All good");
    EXPECT_TRUE(store.disableStates());
    EXPECT_FALSE(store.disableCommentsTable());
    EXPECT_EQ(store.reportDate(), "18/10/2026");
    EXPECT_TRUE(store.toggleAllItems());
}

TEST(EditStoreTest, RejectsOrderOutsideIntegerRange)
{
    EXPECT_THROW(EditStore::parse(R"({ "aaa": { "order": 1000000000000 } })"), std::exception);
    EXPECT_THROW(EditStore::parse(R"({ "aaa": { "order": -3000000000 } })"), std::exception);

    EditStore store = EditStore::parse(R"({ "aaa": { "order": -2147483648 } })");
    ASSERT_NE(store.find("aaa"), nullptr);
    EXPECT_EQ(store.find("aaa")->order, std::numeric_limits<int>::min());
}

TEST(EditStoreTest, SavedStoreReadsBack)
{
    TempDir dir;
    EditStore store;
    ImageEdit& edit = store.edit("0123456789abcdef01234567");
    edit.comment = "Fissura na \"parede\"\n\tsul";
    edit.status = Status::DONE;
    edit.order = 4;
    store.edit("ffff");
    store.setGeneralComments("Observações gerais");
    store.setReportDate("01/02/2026");
    store.setDisableCommentsTable(true);

    std::filesystem::path file = dir / EditStore::FILE_NAME;
    store.save(file);
    EXPECT_FALSE(std::filesystem::exists(dir / "imagens_db.json.tmp"));

    EditStore loaded = EditStore::load(file);
    ASSERT_EQ(loaded.size(), 2);
    EXPECT_EQ(*loaded.find("0123456789abcdef01234567"), edit);
    EXPECT_EQ(*loaded.find("ffff"), ImageEdit());
    EXPECT_EQ(loaded.generalComments(), "Observações gerais");
    EXPECT_EQ(loaded.reportDate(), "01/02/2026");
    EXPECT_TRUE(loaded.disableCommentsTable());
    EXPECT_FALSE(loaded.toggleAllItems());
}

TEST(JsonWriterTest, EscapesStrings)
{
    StringBuilder out;
    JsonWriter::writeString(out, "a\"b\\c\nd\x01");
    EXPECT_EQ(out.toString(), "\"a\\\"b\\\\c\\nd\\u0001\"");
}

TEST(ReportSettingsTest, DefaultsAndOverrides)
{
    ReportSettings settings;
    EXPECT_EQ(settings.header2(), "UNICAMP - UNIVERSIDADE ESTADUAL DE CAMPINAS");
    EXPECT_EQ(ReportSettings::keyOf("sign2_name"), ReportSettings::SIGN2_NAME);
    EXPECT_EQ(ReportSettings::keyOf("nope"), -1);

    settings.loadFromString(R"({
        "title": "RELATÓRIO DE VISTORIA",
        "address": "Rua A, 1",
        "postal_code": "CEP: 13083-000",
        "contact_phone": "Tel: 1",
        "contact_fax": "Fax: 2",
        "contact_email": "x@y.br",
        "something_else": { "nested": true }
    })");
    EXPECT_EQ(settings.title(), "RELATÓRIO DE VISTORIA");
    EXPECT_EQ(settings.sign1(), "PREPOSTO CONTRATANTE");

    std::vector<std::string> footer = settings.footerLines();
    ASSERT_EQ(footer.size(), 3);
    EXPECT_EQ(footer[0], "Rua A, 1");
    EXPECT_EQ(footer[1], "CEP: 13083-000 - Tel: 1 - Fax: 2");
    EXPECT_EQ(footer[2], "x@y.br");
    EXPECT_EQ(settings.locationDate("18/10/2026"), "Rua A, 1, 18/10/2026");
}

TEST(ReportSettingsTest, LoadsFile)
{
    TempDir dir;
    dir.write(ReportSettings::FILE_NAME, R"({ "sign1_name": "Maria" })");
    ReportSettings settings;
    settings.load((dir / ReportSettings::FILE_NAME).string().c_str());
    EXPECT_EQ(settings.sign1Name(), "Maria");
}

TEST(EntryBuilderTest, OrdersByPersistedOrderThenFileName)
{
    std::vector<ClassifiedImage> images =
    {
        image("d.jpg", "h-d"),
        image("a.jpg", "h-a"),
        image("c.jpg", "h-c"),
        image("b.jpg", "h-b"),
        image("e.jpg", "h-e"),
    };
    EditStore store;
    store.edit("h-d").order = 1;
    store.edit("h-c").order = 0;
    store.edit("h-e").include = false;

    EntryBuilder builder(store, false);
    std::vector<Entry> entries = builder.build(images);
    EXPECT_EQ(fileNames(entries),
        (std::vector<std::string>{ "c.jpg", "d.jpg", "a.jpg", "b.jpg" }));

    store.setToggleAllItems(true);
    entries = EntryBuilder(store, false).build(images);
    EXPECT_EQ(entries.size(), 5);
}

TEST(EntryBuilderTest, StatusAndComment)
{
    std::vector<ClassifiedImage> images = { image("a.jpg", "h-a"), image("b.jpg", "h-b") };
    EditStore store;
    store.edit("h-a").status = Status::PARTIAL;
    store.edit("h-a").comment = "Needs paint";

    std::vector<Entry> entries = EntryBuilder(store, false).build(images);
    ASSERT_EQ(entries.size(), 2);
    EXPECT_EQ(entries[0].status, Status::PARTIAL);
    EXPECT_EQ(entries[0].comment, "Needs paint");
    EXPECT_EQ(entries[1].status, Status::DEFAULT);
    EXPECT_EQ(entries[0].zoneType, ZoneType::QUADRA);
    EXPECT_EQ(entries[0].sigla, "FEEC");

    entries = EntryBuilder(store, true).build(images);
    EXPECT_EQ(entries[0].status, "");
}

TEST(EntryBuilderTest, Caption)
{
    ClassifiedImage img = image("a.jpg", "h-a", ZoneType::CANTEIRO, "IMECC");
    img.record.location = Point::ofLonLat(-47.07, -22.8);
    EditStore store;
    EntryBuilder builder(store, false);

    RichText caption = builder.caption(7, img, Status::DONE, "linha 1\nlinha 2");
    EXPECT_EQ(caption.toPlainText(),
        "007\n"
        "Data e hora: 14/05/2024 09:41:07\n"
        "Canteiro: 12, Sigla: IMECC\n"
        "Localização: https://www.google.com/maps?q=-22.800000,-47.070000\n"
        "Estado: Concluído\n"
        "Comentários\n"
        "linha 1\n"
        "linha 2");
    ASSERT_GE(caption.lines.size(), 4);
    const RichText::Line& location = caption.lines[3];
    EXPECT_EQ(location.back().link, "https://www.google.com/maps?q=-22.800000,-47.070000");
    EXPECT_TRUE(caption.lines[5][0].underline);

    img.record.location.reset();
    img.classification.type = ZoneType::UNKNOWN;
    caption = EntryBuilder(store, true).caption(1, img, "", "");
    EXPECT_EQ(caption.toPlainText(),
        "001\n"
        "Data e hora: 14/05/2024 09:41:07\n"
        "Área: 12, Sigla: IMECC\n"
        "Localização: Sem localização");
}
