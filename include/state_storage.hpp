#pragma once

#include <memory>
#include <optional>
#include <string>

namespace sr {

// Host-side persistence of the serialized store. The blob is always read and
// written whole; there are no partial writes.
class StateStorage {
public:
    virtual ~StateStorage() = default;
    virtual std::optional<std::string> load() const = 0;
    virtual void save(const std::string& blob) = 0;
};

using StateStoragePtr = std::shared_ptr<StateStorage>;

class MemoryStateStorage : public StateStorage {
public:
    std::optional<std::string> load() const override { return blob_; }
    void save(const std::string& blob) override { blob_ = blob; }

private:
    std::optional<std::string> blob_;
};

class FileStateStorage : public StateStorage {
public:
    explicit FileStateStorage(std::string path);

    std::optional<std::string> load() const override;
    // Writes to "<path>.tmp" and renames over the target.
    void save(const std::string& blob) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace sr
