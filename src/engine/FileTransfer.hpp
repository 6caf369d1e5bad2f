#pragma once
#include "common.hpp"
#include "ObjectStore.hpp"
#include "Retry.hpp"
#include <cstddef>
#include <optional>
#include <string>

struct TransferResult {
    bool ok{};
    std::optional<std::string> error;
};

// Copies one result file from the source store to the target store.
//
// The destination name is "{workitem_name}-{basename(filename)}". A file whose
// destination already exists is reported as done without downloading it, and
// an upload that loses a race against another writer counts as success, so
// the transfer can be repeated safely after a crash.
class FileTransfer {
public:
    static constexpr std::size_t kMaxNameLength = 1024;

    // notifier may be null; container is only used in notification messages.
    FileTransfer(ObjectStore& source, ObjectStore& target, Notifier* notifier,
                 std::string container, RetryPolicy retry = RetryPolicy{});

    TransferResult transfer(const FileMetadata& file);

    // Identity used for de-duplication; never shortened.
    static std::string destinationKey(const FileMetadata& file);
    // Key as stored, with a random short fallback when it exceeds kMaxNameLength.
    static std::string destinationName(const FileMetadata& file);

private:
    ObjectStore& source_;
    ObjectStore& target_;
    Notifier* notifier_;
    std::string container_;
    RetryPolicy retry_;

    void notifyUploaded(const std::string& name);
};
