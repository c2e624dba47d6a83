#pragma once

#include <optional>
#include <string>

namespace Marquee {

/**
 * Persistence capability for opaque serialized blobs
 */
class BlobStore {
public:
    virtual ~BlobStore() = default;

    virtual std::optional<std::string> load(const std::string& key) = 0;
    virtual bool save(const std::string& key, const std::string& blob) = 0;
};

/**
 * Stores each blob as <directory>/<key>.json
 */
class FileBlobStore : public BlobStore {
public:
    // Empty directory means g_get_user_data_dir()/marquee
    explicit FileBlobStore(const std::string& directory = "");

    std::optional<std::string> load(const std::string& key) override;
    bool save(const std::string& key, const std::string& blob) override;

    const std::string& directory() const { return directory_; }

    static std::string default_directory();

private:
    std::string directory_;

    std::string path_for(const std::string& key) const;
};

} // namespace Marquee
