#pragma once
#ifndef ECORISK_MODEL_STORE_H
#define ECORISK_MODEL_STORE_H

#include "ai/collapse_model.h"
#include <memory>
#include <mutex>
#include <string>

namespace ecorisk {
namespace ai {

// Durable home of the (classifier, scaler) pair. Implementations must write
// and read the pair as one unit.
class IModelStore {
public:
    virtual ~IModelStore() = default;

    // Throws ModelStoreError
    virtual void save(const CollapseModel& model) = 0;

    // nullptr when nothing is stored. Throws ModelStoreError on a corrupt artifact.
    virtual std::shared_ptr<const CollapseModel> load() = 0;

    virtual bool exists() const = 0;
    virtual std::string location() const = 0;
};

// Single JSON artifact in a directory, replaced via write-to-temp + rename
class FileModelStore : public IModelStore {
public:
    static constexpr const char* kArtifactName = "collapse_model.json";

    explicit FileModelStore(std::string directory);

    void save(const CollapseModel& model) override;
    std::shared_ptr<const CollapseModel> load() override;
    bool exists() const override;
    std::string location() const override;

private:
    std::string directory_;
    std::mutex write_mutex_;

    std::string artifact_path() const;
};

} // namespace ai
} // namespace ecorisk

#endif // ECORISK_MODEL_STORE_H
