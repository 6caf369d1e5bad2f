#pragma once
#include "ObjectStore.hpp"
#include <filesystem>
#include <optional>
#include <string>

// A directory tree acting as an object store. Object names map to relative
// paths under the root; a "file://" prefix is accepted. Puts land through a
// temporary file so readers never observe a partial object.
class DirectoryObjectStore : public ObjectStore {
public:
    explicit DirectoryObjectStore(std::filesystem::path root);

    bool exists(const std::string& name) override;
    ObjectResult get(const std::string& name) override;
    ObjectResult put(const std::string& name, const std::vector<char>& data, bool create_if_absent) override;

    // Empty when the name is empty or escapes the root.
    std::optional<std::filesystem::path> objectPath(const std::string& name) const;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};
