#include "FileTransfer.hpp"
#include "Log.hpp"
#include "SpoolNotifier.hpp"
#include <random>

FileTransfer::FileTransfer(ObjectStore& source, ObjectStore& target, Notifier* notifier,
                           std::string container, RetryPolicy retry)
    : source_(source), target_(target), notifier_(notifier),
      container_(std::move(container)), retry_(retry) {}

std::string FileTransfer::destinationKey(const FileMetadata& file) {
    return file.workitem_name + "-" + baseName(file.filename);
}

std::string FileTransfer::destinationName(const FileMetadata& file) {
    std::string name = destinationKey(file);
    if (name.size() <= kMaxNameLength) return name;

    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(1000, 9999);
    name = file.workitem_name + "-" + std::to_string(dist(rng)) + "-perf-lab-report.json";
    logWarning("Blob name too long, using random fallback: " + name);
    return name;
}

TransferResult FileTransfer::transfer(const FileMetadata& file) {
    try {
        const std::string name = destinationName(file);

        if (target_.exists(name)) {
            logInfo("Blob already exists, skipping download: " + name);
            return {true, std::nullopt};
        }

        logInfo("Downloading " + file.filename + " from source...");
        ObjectResult src = retryTransient(retry_, "download " + file.source_uri,
            [&] { return source_.get(file.source_uri); });
        if (!src.ok()) {
            std::string msg = std::string("Download failed (") + toString(src.code) + "): " + src.error;
            logError("Failed to reupload " + file.filename + ": " + msg);
            return {false, msg};
        }

        logInfo("Uploading " + file.filename + " to target " + name + "...");
        ObjectResult put = retryTransient(retry_, "upload " + name,
            [&] { return target_.put(name, src.data, true); });

        switch (put.code) {
        case ResultCode::Ok:
            logInfo("Uploaded blob: " + name);
            notifyUploaded(name);
            return {true, std::nullopt};
        case ResultCode::AlreadyExists:
            logInfo("Blob already exists, skipping: " + name);
            return {true, std::nullopt};
        case ResultCode::NotFound:
        case ResultCode::TransientError:
        case ResultCode::FatalError:
            break;
        }
        std::string msg = std::string("Upload failed (") + toString(put.code) + "): " + put.error;
        logError("Failed to upload " + name + ": " + msg);
        return {false, msg};
    }
    catch (const std::exception& ex) {
        logError("Failed to reupload " + file.filename + ": " + ex.what());
        return {false, std::string("Unexpected error: ") + ex.what()};
    }
}

void FileTransfer::notifyUploaded(const std::string& name) {
    if (!notifier_) return;
    const std::string message = makeUploadMessage(container_, name);
    ObjectResult sent = retryTransient(retry_, "queue message for " + name,
        [&] { return notifier_->send(message); });
    if (sent.ok()) {
        logInfo("Queued message for: " + name);
    }
    else {
        logError("Failed to queue message for " + name + ": " + sent.error);
    }
}
