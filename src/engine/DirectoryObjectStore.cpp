#include "DirectoryObjectStore.hpp"
#include "Log.hpp"
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::atomic<unsigned long> g_tmpCounter{0};

ResultCode classifyErrno(int err) {
    switch (err) {
    case ENOENT:
        return ResultCode::NotFound;
    case EEXIST:
        return ResultCode::AlreadyExists;
    case EAGAIN:
    case EINTR:
    case EBUSY:
    case EIO:
    case ETIMEDOUT:
        return ResultCode::TransientError;
    default:
        return ResultCode::FatalError;
    }
}

ObjectResult errnoFailure(const std::string& what, const fs::path& path, int err) {
    return ObjectResult::failure(classifyErrno(err), what + " '" + path.string() + "': " + std::strerror(err));
}

class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { if (fd_ >= 0) ::close(fd_); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    // Returns 0 or the errno of a failed close.
    int close() {
        int fd = fd_;
        fd_ = -1;
        return ::close(fd) == 0 ? 0 : errno;
    }

private:
    int fd_;
};

int writeAll(int fd, const char* data, std::size_t length) {
    std::size_t written = 0;
    while (written < length) {
        ssize_t rc = ::write(fd, data + written, length - written);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return errno;
        }
        written += static_cast<std::size_t>(rc);
    }
    return 0;
}

} // namespace

const char* toString(ResultCode code) {
    switch (code) {
    case ResultCode::Ok:             return "ok";
    case ResultCode::AlreadyExists:  return "already-exists";
    case ResultCode::NotFound:       return "not-found";
    case ResultCode::TransientError: return "transient-error";
    case ResultCode::FatalError:     return "fatal-error";
    }
    return "unknown";
}

DirectoryObjectStore::DirectoryObjectStore(fs::path root) {
    fs::create_directories(root);
    root_ = fs::absolute(root).lexically_normal();
    if (!root_.has_filename() && root_.has_parent_path() && root_ != root_.root_path()) {
        root_ = root_.parent_path();
    }
}

std::optional<fs::path> DirectoryObjectStore::objectPath(const std::string& name) const {
    std::string rel = name;
    if (rel.rfind("file://", 0) == 0) rel = rel.substr(7);
    if (rel.empty()) return std::nullopt;

    fs::path p(rel);
    fs::path full = (p.is_absolute() ? p : root_ / p).lexically_normal();
    fs::path inside = full.lexically_relative(root_);
    if (inside.empty() || inside == "." || *inside.begin() == "..") return std::nullopt;
    return full;
}

bool DirectoryObjectStore::exists(const std::string& name) {
    auto p = objectPath(name);
    if (!p) {
        logWarning("Invalid object name: " + name);
        return false;
    }
    std::error_code ec;
    bool present = fs::is_regular_file(*p, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        logWarning("Failed to check if object exists " + name + ": " + ec.message());
        return false;
    }
    return present;
}

ObjectResult DirectoryObjectStore::get(const std::string& name) {
    auto p = objectPath(name);
    if (!p) return ObjectResult::failure(ResultCode::FatalError, "invalid object name '" + name + "'");

    FileDescriptor fd(::open(p->c_str(), O_RDONLY));
    if (!fd.valid()) return errnoFailure("failed to open", *p, errno);

    struct stat st{};
    if (::fstat(fd.get(), &st) != 0) return errnoFailure("failed to stat", *p, errno);
    if (!S_ISREG(st.st_mode)) return ObjectResult::failure(ResultCode::NotFound, "not a file: " + p->string());

    ObjectResult result;
    result.data.reserve(static_cast<std::size_t>(st.st_size));
    char buffer[64 * 1024];
    for (;;) {
        ssize_t n = ::read(fd.get(), buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            return errnoFailure("failed to read", *p, errno);
        }
        if (n == 0) break;
        result.data.insert(result.data.end(), buffer, buffer + n);
    }
    return result;
}

ObjectResult DirectoryObjectStore::put(const std::string& name, const std::vector<char>& data,
                                       bool create_if_absent) {
    auto target = objectPath(name);
    if (!target) return ObjectResult::failure(ResultCode::FatalError, "invalid object name '" + name + "'");

    std::error_code ec;
    fs::create_directories(target->parent_path(), ec);
    if (ec) return errnoFailure("failed to create directory", target->parent_path(), ec.value());

    fs::path tmp = target->parent_path() /
        ("." + target->filename().string() + ".tmp." + std::to_string(::getpid()) + "." +
         std::to_string(g_tmpCounter.fetch_add(1)));

    {
        FileDescriptor fd(::open(tmp.c_str(), O_CREAT | O_EXCL | O_WRONLY, 0644));
        if (!fd.valid()) return errnoFailure("failed to create", tmp, errno);

        int err = writeAll(fd.get(), data.data(), data.size());
        if (err == 0 && ::fsync(fd.get()) != 0) err = errno;
        if (err == 0) err = fd.close();
        if (err != 0) {
            ::unlink(tmp.c_str());
            return errnoFailure("failed to write", tmp, err);
        }
    }

    if (create_if_absent) {
        // link() refuses to replace an existing name, which makes the publish
        // step atomic against a concurrent writer.
        int rc = ::link(tmp.c_str(), target->c_str());
        int err = (rc == 0) ? 0 : errno;
        ::unlink(tmp.c_str());
        if (err == EEXIST) {
            return ObjectResult::failure(ResultCode::AlreadyExists, "object already exists: " + name);
        }
        if (err != 0) return errnoFailure("failed to publish", *target, err);
        return ObjectResult::success();
    }

    if (::rename(tmp.c_str(), target->c_str()) != 0) {
        int err = errno;
        ::unlink(tmp.c_str());
        return errnoFailure("failed to publish", *target, err);
    }
    return ObjectResult::success();
}
