#pragma once
#include "ObjectStore.hpp"
#include <atomic>
#include <filesystem>

// Queue backed by a spool directory: every message becomes one file,
// published by rename so consumers only see complete messages.
class SpoolNotifier : public Notifier {
public:
    explicit SpoolNotifier(std::filesystem::path dir);

    ObjectResult send(const std::string& message) override;

    const std::filesystem::path& directory() const { return dir_; }

private:
    std::filesystem::path dir_;
    std::atomic<unsigned long> sequence_{0};
};

// {"container_name": "...", "blob_name": "..."}
std::string makeUploadMessage(const std::string& container, const std::string& blob_name);
