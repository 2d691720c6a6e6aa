#include "ai/model_store.h"
#include "ai/errors.h"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace ecorisk {
namespace ai {

FileModelStore::FileModelStore(std::string directory)
    : directory_(std::move(directory)) {}

std::string FileModelStore::artifact_path() const {
    return (std::filesystem::path(directory_) / kArtifactName).string();
}

std::string FileModelStore::location() const {
    return artifact_path();
}

bool FileModelStore::exists() const {
    std::error_code ec;
    return std::filesystem::exists(artifact_path(), ec);
}

void FileModelStore::save(const CollapseModel& model) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    const std::string document = model.to_json().dump(2);
    const std::filesystem::path target = artifact_path();
    const std::filesystem::path temp = target.string() + ".tmp";

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw ModelStoreError("Cannot create model directory " + directory_ + ": " + ec.message());
    }

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw ModelStoreError("Cannot open " + temp.string() + " for writing");
        }
        out << document;
        out.flush();
        if (!out) {
            throw ModelStoreError("Failed writing " + temp.string());
        }
    }

    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::filesystem::remove(temp, ec);
        throw ModelStoreError("Cannot replace " + target.string());
    }

    std::cout << "[ModelStore] Model saved to: " << target.string() << std::endl;
}

std::shared_ptr<const CollapseModel> FileModelStore::load() {
    const std::string path = artifact_path();
    if (!exists()) {
        std::cout << "[ModelStore] No pre-trained model found at: " << path << std::endl;
        return nullptr;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ModelStoreError("Cannot open " + path);
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ModelStoreError("Corrupt model artifact " + path + ": " + e.what());
    }

    auto model = CollapseModel::from_json(j);
    std::cout << "[ModelStore] Collapse prediction model loaded from: " << path << std::endl;
    return model;
}

} // namespace ai
} // namespace ecorisk
