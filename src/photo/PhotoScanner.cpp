// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "PhotoScanner.h"
#include <algorithm>
#include <clarisma/alloc/Block.h>
#include <clarisma/cli/Console.h>
#include <clarisma/io/File.h>
#include <clarisma/io/IOException.h>
#include "ContentHash.h"
#include "JpegReader.h"
#include "ThumbnailCache.h"
#include "util/TextUtils.h"

using namespace clarisma;

bool PhotoScanner::isImageFile(const std::filesystem::path& path)
{
    std::string ext = TextUtils::toLowerAscii(path.extension().string());
    return ext == ".jpg" || ext == ".jpeg" || ext == ".png" || ext == ".heic";
}

bool PhotoScanner::isJpegFile(const std::filesystem::path& path)
{
    std::string ext = TextUtils::toLowerAscii(path.extension().string());
    return ext == ".jpg" || ext == ".jpeg";
}

std::vector<std::filesystem::path> PhotoScanner::list(const std::filesystem::path& dir)
{
    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir))
    {
        if (entry.is_regular_file() && isImageFile(entry.path()))
        {
            files.push_back(entry.path());
        }
    }
    std::ranges::sort(files, [](const auto& a, const auto& b)
    {
        return a.filename().string() < b.filename().string();
    });
    return files;
}

RecordResult<ImageRecord> PhotoScanner::read(const std::filesystem::path& file)
{
    ImageRecord record;
    record.path = file;

    std::error_code ec;
    auto modified = std::filesystem::last_write_time(file, ec);
    if (ec)
    {
        return RecordResult<ImageRecord>::dropped(ErrorKind::UNREADABLE, ec.message());
    }
    record.capturedAt = CaptureTime::ofFileTime(modified);

    try
    {
        ByteBlock bytes = File::readAll(file);
        return readBytes(record, reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
    }
    catch (IOException& ex)
    {
        return RecordResult<ImageRecord>::dropped(ErrorKind::UNREADABLE, ex.what());
    }
}

RecordResult<ImageRecord> PhotoScanner::readBytes(ImageRecord& record, const uint8_t* data, size_t size)
{
    if (size == 0)
    {
        return RecordResult<ImageRecord>::dropped(ErrorKind::UNREADABLE, "Empty file");
    }
    if (JpegReader::isJpeg(data, size))
    {
        return readJpeg(record, data, size);
    }
    if (isJpegFile(record.path))
    {
        return RecordResult<ImageRecord>::dropped(ErrorKind::UNREADABLE,
            "File has a JPEG extension but no JPEG content");
    }
    record.contentHash = ContentHash::compute(data, size);
    return RecordResult<ImageRecord>::degraded(std::move(record),
        ErrorKind::UNSUPPORTED_FORMAT, "No location or embeddable image for this format");
}

RecordResult<ImageRecord> PhotoScanner::readJpeg(ImageRecord& record, const uint8_t* data, size_t size)
{
    JpegReader reader(data, size);
    if (!reader.read())
    {
        return RecordResult<ImageRecord>::dropped(ErrorKind::UNREADABLE, reader.error());
    }
    record.contentHash = ContentHash::compute(data + reader.scanOffset(),
        size - reader.scanOffset());

    const JpegReader::Exif& exif = reader.exif();
    if (exif.capturedAt) record.capturedAt = *exif.capturedAt;
    record.location = exif.location;
    record.orientation = exif.orientation;

    std::shared_ptr<const Thumbnail> thumbnail;
    if (cache_) thumbnail = cache_->get(record.contentHash);
    if (!thumbnail)
    {
        auto t = std::make_shared<Thumbnail>();
        t->jpeg = reader.strippedCopy();
        t->width = reader.width();
        t->height = reader.height();
        t->components = reader.components();
        thumbnail = std::move(t);
        if (cache_) cache_->put(record.contentHash, thumbnail);
    }
    record.thumbnail = std::move(thumbnail);

    if (!reader.exifProblem().empty())
    {
        ErrorKind kind = exif.location || reader.exifProblem().find("GPS") == std::string::npos ?
            ErrorKind::BAD_METADATA : ErrorKind::BAD_LOCATION;
        return RecordResult<ImageRecord>::degraded(std::move(record), kind, reader.exifProblem());
    }
    return RecordResult<ImageRecord>::ok(std::move(record));
}

std::vector<ImageRecord> PhotoScanner::scan(const std::filesystem::path& dir,
    const ProgressCallback& progress)
{
    std::vector<std::filesystem::path> files = list(dir);
    std::vector<ImageRecord> records;
    records.reserve(files.size());
    for (size_t i = 0; i < files.size(); i++)
    {
        RecordResult<ImageRecord> res = read(files[i]);
        if (res.isDropped())
        {
            droppedCount_++;
            Console::msg("Skipped %s: %s (%s)", files[i].filename().string().c_str(),
                res.message().c_str(), errorKindName(res.errorKind()));
        }
        else
        {
            if (res.isDegraded())
            {
                degradedCount_++;
                if (res.errorKind() == ErrorKind::UNSUPPORTED_FORMAT)
                {
                    Console::debug("%s: %s", files[i].filename().string().c_str(),
                        res.message().c_str());
                }
                else
                {
                    Console::msg("%s: %s (%s)", files[i].filename().string().c_str(),
                        res.message().c_str(), errorKindName(res.errorKind()));
                }
            }
            records.push_back(res.take());
        }
        if (progress) progress(i + 1, files.size());
    }
    return records;
}
