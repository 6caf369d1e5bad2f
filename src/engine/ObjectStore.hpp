#pragma once
#include <string>
#include <utility>
#include <vector>

enum class ResultCode {
    Ok,
    AlreadyExists,
    NotFound,
    TransientError,
    FatalError
};

const char* toString(ResultCode code);

struct ObjectResult {
    ResultCode        code{ResultCode::Ok};
    std::string       error;
    std::vector<char> data;     // filled by get()

    bool ok() const { return code == ResultCode::Ok; }

    static ObjectResult success() { return ObjectResult{}; }
    static ObjectResult failure(ResultCode code, std::string error) {
        ObjectResult r;
        r.code = code;
        r.error = std::move(error);
        return r;
    }
};

// Blob/content store used both as transfer source and target.
// Implementations must tolerate calls from several threads at once.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    virtual bool exists(const std::string& name) = 0;
    virtual ObjectResult get(const std::string& name) = 0;
    // With create_if_absent an existing object yields AlreadyExists and is
    // left untouched.
    virtual ObjectResult put(const std::string& name, const std::vector<char>& data, bool create_if_absent) = 0;
};

// Best-effort downstream queue.
class Notifier {
public:
    virtual ~Notifier() = default;

    virtual ObjectResult send(const std::string& message) = 0;
};
