#include "pageflow/progress.h"
#include "pageflow/text.h"
#include "pageflow/log.h"
#include <cstdio>
#include <fstream>

namespace pageflow {

std::string makeBookIdentifier(const std::string& fileName,
                               uint64_t sizeBytes,
                               int64_t lastModifiedMs) {
    return fileName + "-" + std::to_string(sizeBytes) + "-" + std::to_string(lastModifiedMs);
}

FileProgressStore::FileProgressStore(std::string path)
    : path_(std::move(path)) {}

void FileProgressStore::save(const ReadingPosition& position) {
    // Write beside the target, then swap it in
    std::string tmpPath = path_ + ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::trunc);
        if (!out) {
            PF_LOGW("progress: cannot write '%s'", tmpPath.c_str());
            return;
        }
        out << "book=" << position.bookIdentifier << '\n'
            << "page=" << position.pageIndex << '\n'
            << "density=" << densityName(position.density) << '\n'
            << "timestamp=" << position.timestampMs << '\n';
        if (!out.flush()) {
            PF_LOGW("progress: write failed for '%s'", tmpPath.c_str());
            return;
        }
    }
    if (std::rename(tmpPath.c_str(), path_.c_str()) != 0) {
        PF_LOGW("progress: cannot replace '%s'", path_.c_str());
        std::remove(tmpPath.c_str());
        return;
    }
    PF_LOGD("progress: saved book='%s' page=%d", position.bookIdentifier.c_str(), position.pageIndex);
}

std::optional<ReadingPosition> FileProgressStore::load() const {
    std::ifstream in(path_);
    if (!in) {
        PF_LOGD("progress: no saved position at '%s'", path_.c_str());
        return std::nullopt;
    }

    ReadingPosition position;
    bool hasBook = false;
    bool hasPage = false;
    std::string line;

    try {
        while (std::getline(in, line)) {
            if (trim(line).empty()) continue;
            auto eq = line.find('=');
            if (eq == std::string::npos) {
                PF_LOGW("progress: malformed line in '%s'", path_.c_str());
                return std::nullopt;
            }
            std::string key = trim(line.substr(0, eq));
            std::string value = line.substr(eq + 1);

            if (key == "book") {
                position.bookIdentifier = value;
                hasBook = true;
            } else if (key == "page") {
                position.pageIndex = std::stoi(value);
                hasPage = true;
            } else if (key == "density") {
                position.density = parseDensity(trim(value));
            } else if (key == "timestamp") {
                position.timestampMs = std::stoll(value);
            }
        }
    } catch (const std::exception& e) {
        PF_LOGW("progress: malformed value in '%s': %s", path_.c_str(), e.what());
        return std::nullopt;
    }

    if (!hasBook || !hasPage || position.pageIndex < 0) {
        PF_LOGW("progress: incomplete record in '%s'", path_.c_str());
        return std::nullopt;
    }
    return position;
}

void FileProgressStore::clear() {
    if (std::remove(path_.c_str()) != 0) {
        PF_LOGD("progress: nothing to clear at '%s'", path_.c_str());
    }
}

} // namespace pageflow
