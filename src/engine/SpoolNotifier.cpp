#include "SpoolNotifier.hpp"
#include <chrono>
#include <cstdio>
#include <fstream>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

static std::string jsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                out += buf;
            }
            else {
                out += c;
            }
        }
    }
    return out;
}

std::string makeUploadMessage(const std::string& container, const std::string& blob_name) {
    return "{\"container_name\": \"" + jsonEscape(container) +
        "\", \"blob_name\": \"" + jsonEscape(blob_name) + "\"}";
}

SpoolNotifier::SpoolNotifier(fs::path dir) : dir_(std::move(dir)) {
    fs::create_directories(dir_);
}

ObjectResult SpoolNotifier::send(const std::string& message) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::string stem = std::to_string(micros) + "-" + std::to_string(::getpid()) + "-" +
        std::to_string(sequence_.fetch_add(1));

    fs::path tmp = dir_ / ("." + stem + ".tmp");
    fs::path final = dir_ / (stem + ".json");
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return ObjectResult::failure(ResultCode::TransientError, "cannot open spool file " + tmp.string());
        }
        out << message << "\n";
        out.flush();
        if (!out) {
            return ObjectResult::failure(ResultCode::TransientError, "cannot write spool file " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, final, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return ObjectResult::failure(ResultCode::FatalError, "cannot publish spool file " + final.string());
    }
    return ObjectResult::success();
}
