// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include <gtest/gtest.h>
#include "TestSupport.h"
#include "photo/CaptureTime.h"
#include "photo/ContentHash.h"
#include "photo/JpegReader.h"
#include "photo/PhotoScanner.h"
#include "photo/ThumbnailCache.h"

TEST(CaptureTimeTest, ParsesExifFormat)
{
    std::optional<CaptureTime> t = CaptureTime::parseExif("2024:05:14 09:41:07");
    ASSERT_TRUE(t);
    EXPECT_EQ(t->year, 2024);
    EXPECT_EQ(t->month, 5);
    EXPECT_EQ(t->day, 14);
    EXPECT_EQ(t->second, 7);
    EXPECT_EQ(t->toDisplayString(), "14/05/2024 09:41:07");

    EXPECT_TRUE(CaptureTime::parseExif("2024-05-14 09:41:07"));
    EXPECT_FALSE(CaptureTime::parseExif("0000:00:00 00:00:00"));
    EXPECT_FALSE(CaptureTime::parseExif("    :  :     :  :  "));
    EXPECT_FALSE(CaptureTime::parseExif("2024:05:14"));
}

TEST(JpegReaderTest, ReadsFrameAndExif)
{
    TestJpeg jpeg;
    jpeg.width = 4000;
    jpeg.height = 3000;
    jpeg.orientation = 6;
    jpeg.dateTimeOriginal = "2024:05:14 09:41:07";
    jpeg.lat = -22.8;
    jpeg.lon = -47.07;
    std::vector<uint8_t> bytes = jpeg.build();

    JpegReader reader(bytes.data(), bytes.size());
    ASSERT_TRUE(reader.read()) << reader.error();
    EXPECT_EQ(reader.width(), 4000);
    EXPECT_EQ(reader.height(), 3000);
    EXPECT_EQ(reader.components(), 3);
    EXPECT_TRUE(reader.hasExif());
    EXPECT_TRUE(reader.exifProblem().empty()) << reader.exifProblem();

    const JpegReader::Exif& exif = reader.exif();
    EXPECT_EQ(exif.orientation, 6);
    ASSERT_TRUE(exif.capturedAt);
    EXPECT_EQ(exif.capturedAt->hour, 9);
    ASSERT_TRUE(exif.location);
    EXPECT_NEAR(exif.location->lat(), -22.8, 1e-6);
    EXPECT_NEAR(exif.location->lon(), -47.07, 1e-6);
}

TEST(JpegReaderTest, WithoutExif)
{
    TestJpeg jpeg;
    std::vector<uint8_t> bytes = jpeg.build();
    JpegReader reader(bytes.data(), bytes.size());
    ASSERT_TRUE(reader.read());
    EXPECT_FALSE(reader.hasExif());
    EXPECT_FALSE(reader.exif().location);
    EXPECT_EQ(reader.exif().orientation, 1);
}

TEST(JpegReaderTest, RejectsTruncatedFile)
{
    TestJpeg jpeg;
    std::vector<uint8_t> bytes = jpeg.build();
    bytes.resize(30);
    JpegReader reader(bytes.data(), bytes.size());
    EXPECT_FALSE(reader.read());
    EXPECT_FALSE(reader.error().empty());

    const uint8_t png[] = { 0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A };
    JpegReader notJpeg(png, sizeof(png));
    EXPECT_FALSE(notJpeg.read());
}

TEST(JpegReaderTest, StrippedCopyDropsMetadata)
{
    TestJpeg jpeg;
    jpeg.orientation = 3;
    jpeg.withComment = true;
    std::vector<uint8_t> bytes = jpeg.build();
    JpegReader reader(bytes.data(), bytes.size());
    ASSERT_TRUE(reader.read());

    std::vector<uint8_t> stripped = reader.strippedCopy();
    EXPECT_LT(stripped.size(), bytes.size());
    JpegReader again(stripped.data(), stripped.size());
    ASSERT_TRUE(again.read());
    EXPECT_FALSE(again.hasExif());
    EXPECT_EQ(again.width(), jpeg.width);
    // Image data is untouched
    EXPECT_TRUE(std::equal(stripped.end() - 6, stripped.end(), bytes.end() - 6));
}

TEST(ContentHashTest, IgnoresMetadataOfJpeg)
{
    TempDir dir;
    TestJpeg plain;
    TestJpeg tagged;
    tagged.orientation = 8;
    tagged.dateTimeOriginal = "2023:01:02 03:04:05";
    tagged.lat = 1.5;
    tagged.lon = 2.5;
    dir.write("a.jpg", plain.build());
    dir.write("b.jpg", tagged.build());

    PhotoScanner scanner;
    RecordResult<ImageRecord> a = scanner.read(dir / "a.jpg");
    RecordResult<ImageRecord> b = scanner.read(dir / "b.jpg");
    ASSERT_TRUE(a.isOk());
    ASSERT_TRUE(b.isOk());
    EXPECT_EQ(a.value().contentHash, b.value().contentHash);
    EXPECT_EQ(a.value().contentHash.size(), 24);

    TestJpeg other;
    other.scanData = { 0x01, 0x02 };
    dir.write("c.jpg", other.build());
    RecordResult<ImageRecord> c = scanner.read(dir / "c.jpg");
    ASSERT_TRUE(c.isOk());
    EXPECT_NE(c.value().contentHash, a.value().contentHash);
}

TEST(ContentHashTest, IsStable)
{
    const uint8_t data[] = { 'a', 'b', 'c' };
    EXPECT_EQ(ContentHash::compute(data, 3), ContentHash::compute(data, 3));
    EXPECT_NE(ContentHash::compute(data, 3), ContentHash::compute(data, 2));
}

TEST(ThumbnailCacheTest, EvictsLeastRecentlyUsed)
{
    ThumbnailCache cache(2);
    auto t1 = std::make_shared<Thumbnail>();
    auto t2 = std::make_shared<Thumbnail>();
    auto t3 = std::make_shared<Thumbnail>();
    cache.put("1", t1);
    cache.put("2", t2);
    EXPECT_EQ(cache.get("1"), t1);     // "2" is now the oldest
    cache.put("3", t3);
    EXPECT_EQ(cache.size(), 2);
    EXPECT_EQ(cache.get("2"), nullptr);
    EXPECT_EQ(cache.get("1"), t1);
    EXPECT_EQ(cache.get("3"), t3);
    EXPECT_EQ(cache.hits(), 3);
    EXPECT_EQ(cache.misses(), 1);
}

TEST(ThumbnailTest, OrientationTurnsDisplaySize)
{
    Thumbnail t;
    t.width = 400;
    t.height = 300;
    EXPECT_EQ(quarterTurns(1), 0);
    EXPECT_EQ(quarterTurns(6), 1);
    EXPECT_EQ(t.displayWidth(quarterTurns(6)), 300);
    EXPECT_EQ(t.displayHeight(quarterTurns(6)), 400);
    EXPECT_EQ(quarterTurns(3), 2);
    EXPECT_EQ(t.displayWidth(quarterTurns(3)), 400);
    EXPECT_EQ(quarterTurns(8), 3);
    EXPECT_EQ(quarterTurns(0), 0);
}

TEST(PhotoScannerTest, ScansDirectoryPerRecord)
{
    TempDir dir;
    TestJpeg jpeg;
    jpeg.lat = -22.8;
    jpeg.lon = -47.07;
    jpeg.dateTimeOriginal = "2024:05:14 09:41:07";
    dir.write("b.jpg", jpeg.build());
    dir.write("a.JPG", TestJpeg().build());
    dir.write("broken.jpg", "not really a jpeg");
    dir.write("c.png", "\x89PNG\r\n\x1a\n....");
    dir.write("notes.txt", "ignored");

    ThumbnailCache cache;
    PhotoScanner scanner(&cache);
    int calls = 0;
    std::vector<ImageRecord> records = scanner.scan(dir.path(),
        [&calls](size_t, size_t total)
        {
            calls++;
            EXPECT_EQ(total, 4);
        });
    EXPECT_EQ(calls, 4);
    EXPECT_EQ(scanner.droppedCount(), 1);
    EXPECT_EQ(scanner.degradedCount(), 1);

    ASSERT_EQ(records.size(), 3);
    EXPECT_EQ(records[0].fileName(), "a.JPG");
    EXPECT_EQ(records[1].fileName(), "b.jpg");
    EXPECT_EQ(records[2].fileName(), "c.png");

    ASSERT_TRUE(records[1].location);
    EXPECT_EQ(records[1].capturedAt.toDisplayString(), "14/05/2024 09:41:07");
    ASSERT_TRUE(records[1].thumbnail);
    EXPECT_EQ(records[1].thumbnail->width, 640);

    EXPECT_FALSE(records[2].thumbnail);
    EXPECT_FALSE(records[2].contentHash.empty());
    EXPECT_EQ(cache.size(), 1);     // a.JPG and b.jpg share their image data
}

TEST(PhotoScannerTest, SharedImageDataKeepsOwnOrientation)
{
    TempDir dir;
    TestJpeg upright;
    TestJpeg turned;
    turned.orientation = 6;
    dir.write("a.jpg", upright.build());
    dir.write("b.jpg", turned.build());

    ThumbnailCache cache;
    PhotoScanner scanner(&cache);
    std::vector<ImageRecord> records = scanner.scan(dir.path(), nullptr);
    ASSERT_EQ(records.size(), 2);
    EXPECT_EQ(records[0].contentHash, records[1].contentHash);
    EXPECT_EQ(records[0].thumbnail, records[1].thumbnail);
    EXPECT_EQ(cache.size(), 1);
    EXPECT_EQ(records[0].orientation, 1);
    EXPECT_EQ(records[1].orientation, 6);

    // Rescanning in the other order must not carry over the first
    // file's orientation either
    ThumbnailCache second;
    PhotoScanner rescanner(&second);
    ImageRecord first = rescanner.read(dir / "b.jpg").take();
    ImageRecord again = rescanner.read(dir / "a.jpg").take();
    EXPECT_EQ(first.orientation, 6);
    EXPECT_EQ(again.orientation, 1);
    EXPECT_EQ(second.hits(), 1);
}
