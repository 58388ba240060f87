#pragma once

#include "pageflow/settings.h"
#include <cstdint>
#include <optional>
#include <string>

namespace pageflow {

/// The reader's saved place in one book
struct ReadingPosition {
    std::string bookIdentifier;
    int pageIndex = 0;                 // 0-based
    Density density = Density::Medium;
    int64_t timestampMs = 0;
};

/// Stable identifier for a source file: "name-size-lastModified"
std::string makeBookIdentifier(const std::string& fileName,
                               uint64_t sizeBytes,
                               int64_t lastModifiedMs);

/// Persistence for the most recent reading position.
/// Implementations keep a single record; saving replaces it.
class ProgressStore {
public:
    virtual ~ProgressStore() = default;

    virtual void save(const ReadingPosition& position) = 0;
    virtual std::optional<ReadingPosition> load() const = 0;
    virtual void clear() = 0;
};

/// Process-local store, used when nothing has to survive a restart
class MemoryProgressStore : public ProgressStore {
public:
    void save(const ReadingPosition& position) override { position_ = position; }
    std::optional<ReadingPosition> load() const override { return position_; }
    void clear() override { position_.reset(); }

private:
    std::optional<ReadingPosition> position_;
};

/// Store backed by a small key=value text file:
///
///     book=moby-dick.epub-123456-1700000000000
///     page=41
///     density=medium
///     timestamp=1700000100000
///
/// A missing file loads as absent; a malformed one loads as absent with a
/// warning. Write failures are logged and leave the previous file in place.
class FileProgressStore : public ProgressStore {
public:
    explicit FileProgressStore(std::string path);

    void save(const ReadingPosition& position) override;
    std::optional<ReadingPosition> load() const override;
    void clear() override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace pageflow
