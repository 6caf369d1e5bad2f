#include "FileTransfer.hpp"
#include "TestDoubles.hpp"

#include <cassert>
#include <string>

using namespace testing_support;

namespace {

FileMetadata sampleFile() {
    return makeFile("w1", "j1", "bench-run", "logs/out/a.perf-lab-report.json", "src/a.json");
}

void testCopiesAndNotifies() {
    MemoryObjectStore source;
    MemoryObjectStore target;
    RecordingNotifier notifier;
    source.seed("src/a.json", "{\"score\": 1}");

    FileTransfer transfer(source, target, &notifier, "results", fastRetry());
    TransferResult r = transfer.transfer(sampleFile());
    assert(r.ok);
    assert(!r.error);
    assert(target.content("bench-run-a.perf-lab-report.json") == "{\"score\": 1}");

    auto messages = notifier.snapshot();
    assert(messages.size() == 1);
    assert(messages[0].find("\"container_name\": \"results\"") != std::string::npos);
    assert(messages[0].find("\"blob_name\": \"bench-run-a.perf-lab-report.json\"") != std::string::npos);
}

void testExistingDestinationSkipsDownload() {
    MemoryObjectStore source;
    MemoryObjectStore target;
    RecordingNotifier notifier;
    source.seed("src/a.json", "new");
    target.seed("bench-run-a.perf-lab-report.json", "old");

    FileTransfer transfer(source, target, &notifier, "results", fastRetry());
    assert(transfer.transfer(sampleFile()).ok);
    assert(source.gets.load() == 0);
    assert(target.puts.load() == 0);
    assert(target.content("bench-run-a.perf-lab-report.json") == "old");
    assert(notifier.snapshot().empty());
}

void testLostUploadRaceCountsAsSuccess() {
    MemoryObjectStore source;
    MemoryObjectStore target;
    RecordingNotifier notifier;
    source.seed("src/a.json", "data");
    target.failPut(ResultCode::AlreadyExists);

    FileTransfer transfer(source, target, &notifier, "results", fastRetry());
    assert(transfer.transfer(sampleFile()).ok);
    assert(notifier.snapshot().empty());
}

void testNotifierFailureIsNotFatal() {
    MemoryObjectStore source;
    MemoryObjectStore target;
    RecordingNotifier notifier;
    notifier.fail = true;
    source.seed("src/a.json", "data");

    FileTransfer transfer(source, target, &notifier, "results", fastRetry());
    assert(transfer.transfer(sampleFile()).ok);
    assert(target.has("bench-run-a.perf-lab-report.json"));

    FileTransfer quiet(source, target, nullptr, "results", fastRetry());
    FileMetadata other = makeFile("w1", "j1", "bench-run", "b.perf-lab-report.json", "src/a.json");
    assert(quiet.transfer(other).ok);
}

void testDownloadFailures() {
    MemoryObjectStore source;
    MemoryObjectStore target;

    FileTransfer transfer(source, target, nullptr, "results", fastRetry());
    TransferResult missing = transfer.transfer(sampleFile());
    assert(!missing.ok);
    assert(missing.error && missing.error->find("Download failed") == 0);
    // not-found is not retried
    assert(source.gets.load() == 1);
    assert(target.puts.load() == 0);

    // transient errors are retried up to the policy limit
    source.seed("src/a.json", "data");
    source.failGet("src/a.json", ResultCode::TransientError, 2);
    assert(transfer.transfer(sampleFile()).ok);
    assert(source.gets.load() == 1 + 3);

    MemoryObjectStore flaky;
    flaky.failGet("src/a.json", ResultCode::TransientError);
    FileTransfer failing(flaky, target, nullptr, "results", fastRetry());
    FileMetadata other = makeFile("w1", "j1", "bench-run", "c.perf-lab-report.json", "src/a.json");
    TransferResult gaveUp = failing.transfer(other);
    assert(!gaveUp.ok);
    assert(flaky.gets.load() == 3);
}

void testUploadFailure() {
    MemoryObjectStore source;
    MemoryObjectStore target;
    source.seed("src/a.json", "data");
    target.failPut(ResultCode::FatalError);

    FileTransfer transfer(source, target, nullptr, "results", fastRetry());
    TransferResult r = transfer.transfer(sampleFile());
    assert(!r.ok);
    assert(r.error && r.error->find("Upload failed") == 0);
}

void testDestinationNames() {
    FileMetadata file = sampleFile();
    assert(FileTransfer::destinationKey(file) == "bench-run-a.perf-lab-report.json");
    assert(FileTransfer::destinationName(file) == FileTransfer::destinationKey(file));

    FileMetadata windows = makeFile("w1", "j1", "bench-run", "dir\\sub\\z.perf-lab-report.json", "u");
    assert(FileTransfer::destinationKey(windows) == "bench-run-z.perf-lab-report.json");

    FileMetadata longName = makeFile("w1", "j1", "bench-run", std::string(1100, 'x') + ".json", "u");
    std::string name = FileTransfer::destinationName(longName);
    assert(name.size() <= FileTransfer::kMaxNameLength);
    assert(name.rfind("bench-run-", 0) == 0);
    assert(name.size() == std::string("bench-run-0000-perf-lab-report.json").size());
    assert(name.find("-perf-lab-report.json") == name.size() - std::string("-perf-lab-report.json").size());
}

} // namespace

int main() {
    testCopiesAndNotifies();
    testExistingDestinationSkipsDownload();
    testLostUploadRaceCountsAsSuccess();
    testNotifierFailureIsNotFatal();
    testDownloadFailures();
    testUploadFailure();
    testDestinationNames();
    return 0;
}
